#pragma once

#include <QChar>
#include <QString>

namespace abc {

// Pitch modifier written before a note letter. None means the note has no
// accidental of its own and may still receive one from the key signature.
enum class Accidental {
    None = 0,
    Flat,     // _
    Natural,  // =
    Sharp,    // ^
};

// Semitone delta: Flat -1, Natural 0, Sharp +1, None 0.
int accidentalDelta(Accidental accidental);

// Maps '_', '=' or '^' to an accidental. Returns false for any other character.
bool parseAccidentalMark(QChar mark, Accidental& out);

// "flat", "natural", "sharp", or "" for None.
QString accidentalName(Accidental accidental);

} // namespace abc
