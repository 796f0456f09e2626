#include "abc/Pitch.h"

namespace abc {
namespace {

static const char kTableLetters[] = "CDEFGABcdefgab";
static const int kTableValues[14] = {40, 42, 44, 45, 47, 49, 51, 52, 54, 56, 57, 59, 61, 63};

} // namespace

int basePitchValue(QChar letter) {
    for (int i = 0; i < 14; ++i) {
        if (letter == QLatin1Char(kTableLetters[i])) return kTableValues[i];
    }
    return -1;
}

bool pitchValueFor(const QString& name, Accidental accidental, int& valueOut) {
    if (name.isEmpty()) return false;
    int value = basePitchValue(name[0]);
    if (value < 0) return false;

    for (int i = 1; i < name.size(); ++i) {
        const QChar c = name[i];
        if (c == ',') value -= kOctaveStep;
        else if (c == '\'') value += kOctaveStep;
    }

    valueOut = value + accidentalDelta(accidental);
    return true;
}

} // namespace abc
