#include "abc/AbcJson.h"

#include <QJsonArray>

namespace abc {

QJsonObject eventToJson(const MusicEvent& event) {
    QJsonObject o;
    o.insert("duration", event.duration);
    if (event.isRest()) {
        o.insert("type", "rest");
        return o;
    }
    o.insert("type", "note");
    o.insert("name", event.name);
    if (event.accidental != Accidental::None) o.insert("accidental", accidentalName(event.accidental));
    o.insert("pitch", event.pitchValue);
    return o;
}

QJsonObject documentToJson(const AbcDocument& doc) {
    QJsonArray fields;
    for (const auto& f : doc.fields) {
        QJsonObject fo;
        fo.insert("key", QString(f.key));
        fo.insert("value", f.value);
        fields.push_back(fo);
    }

    QJsonArray music;
    for (const auto& e : doc.music) music.push_back(eventToJson(e));

    QJsonObject o;
    o.insert("fields", fields);
    o.insert("music", music);
    return o;
}

} // namespace abc
