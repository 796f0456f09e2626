#include "abc/AbcDocument.h"

#include "abc/KeySignature.h"

namespace abc {

QString AbcDocument::fieldValue(QChar key) const {
    for (const auto& f : fields) {
        if (f.key == key) return f.value;
    }
    return {};
}

bool AbcDocument::hasField(QChar key) const {
    for (const auto& f : fields) {
        if (f.key == key) return true;
    }
    return false;
}

QVector<MusicEvent> AbcDocument::notes() const {
    QVector<MusicEvent> out;
    out.reserve(music.size());
    for (const auto& e : music) {
        if (e.isNote()) out.push_back(e);
    }
    return out;
}

bool validateHeader(const QVector<InformationField>& fields, ParseError& error) {
    if (fields.size() < 3) {
        return failParse(error, ParseErrorKind::HeaderTooShort,
                         QString("tune header must contain at least X:, T: and K: (found %1 fields)").arg(fields.size()));
    }
    if (fields[0].key != 'X' || fields[1].key != 'T') {
        return failParse(error, ParseErrorKind::HeaderOrderInvalid, "tune header must begin with X: followed by T:");
    }
    if (fields.last().key != 'K') {
        return failParse(error, ParseErrorKind::HeaderOrderInvalid, "tune header must end with K:");
    }
    return true;
}

bool buildAbcDocument(const QVector<InformationField>& fields,
                      const QVector<MusicEvent>& music,
                      AbcDocument& out,
                      ParseError& error) {
    if (!validateHeader(fields, error)) return false;

    AbcDocument doc;
    doc.fields = fields;
    doc.music = music;
    if (!propagateKeySignature(doc.keySignature(), doc.music, error)) return false;

    out = doc;
    return true;
}

} // namespace abc
