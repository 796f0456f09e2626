#include "abc/KeySignature.h"

#include <QDebug>
#include <QStringList>

namespace abc {
namespace {

static bool isKeyLetter(QChar c) {
    const QChar u = c.toUpper();
    return u >= 'A' && u <= 'G';
}

} // namespace

bool parseKeySignature(const QString& value, KeySignature& out, ParseError& error) {
    const QStringList tokens = value.trimmed().split(' ', Qt::KeepEmptyParts);
    if (tokens.isEmpty() || tokens.first() != "C") {
        return failParse(error, ParseErrorKind::KeySignatureUnsupported,
                         QString("key signature must be C with accidentals, got '%1'").arg(value));
    }

    KeySignature key;
    for (int i = 1; i < tokens.size(); ++i) {
        const QString& t = tokens[i];
        if (t.size() != 2) {
            if (!t.isEmpty()) qDebug().noquote() << QString("abc: key signature token '%1' skipped").arg(t);
            continue;
        }
        KeyAccidental ka;
        ka.letter = t[1];
        if (!parseAccidentalMark(t[0], ka.accidental) || !isKeyLetter(ka.letter)) {
            return failParse(error, ParseErrorKind::KeySignatureUnsupported,
                             QString("'%1' is not an accidental such as ^F, =B or _E").arg(t));
        }
        key.accidentals.push_back(ka);
    }

    out = key;
    return true;
}

void applyKeySignature(const KeySignature& key, QVector<MusicEvent>& music) {
    for (const KeyAccidental& ka : key.accidentals) {
        const QChar letter = ka.letter.toLower();
        for (MusicEvent& e : music) {
            if (!e.isNote() || e.accidental != Accidental::None) continue;
            if (e.name[0].toLower() != letter) continue;
            e.setAccidental(ka.accidental);
        }
    }
}

bool propagateKeySignature(const QString& value, QVector<MusicEvent>& music, ParseError& error) {
    KeySignature key;
    if (!parseKeySignature(value, key, error)) return false;
    applyKeySignature(key, music);
    return true;
}

} // namespace abc
