#pragma once

#include <QChar>
#include <QString>
#include <QVector>

#include "abc/Accidental.h"
#include "abc/MusicEvent.h"
#include "abc/ParseError.h"

namespace abc {

struct KeyAccidental {
    QChar letter;                             // as written, A-G or a-g
    Accidental accidental = Accidental::None;
};

// Only the "C with an explicit accidental list" form is supported, e.g. "C ^F _B".
struct KeySignature {
    QVector<KeyAccidental> accidentals;
};

// Parses a K: field value. Fails with KeySignatureUnsupported when the value is
// empty, does not start with the token "C", or lists a malformed accidental.
bool parseKeySignature(const QString& value, KeySignature& out, ParseError& error);

// Gives every note without its own accidental the key's accidental for its
// letter. Matching ignores case and octave marks.
void applyKeySignature(const KeySignature& key, QVector<MusicEvent>& music);

bool propagateKeySignature(const QString& value, QVector<MusicEvent>& music, ParseError& error);

} // namespace abc
