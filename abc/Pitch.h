#pragma once

#include <QChar>
#include <QString>

#include "abc/Accidental.h"

namespace abc {

// Pitch values follow piano key position on a white-key grid:
//   C D E F G A B c d e f g a b -> 40 42 44 45 47 49 51 52 54 56 57 59 61 63
// Lower case letters sit one octave above upper case. The steps are not
// true semitone spacing; callers rely on these exact numbers.
constexpr int kOctaveStep = 12;

// Base value for one of the 14 table letters, or -1 if the letter is not in the table.
int basePitchValue(QChar letter);

// Computes the pitch value of a note name such as "c", "C,", "e'" with an optional accidental.
// Each ',' after the letter lowers by an octave, each '\'' raises by an octave.
// Returns false if the first character is not a table letter.
bool pitchValueFor(const QString& name, Accidental accidental, int& valueOut);

} // namespace abc
