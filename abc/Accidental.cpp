#include "abc/Accidental.h"

namespace abc {

int accidentalDelta(Accidental accidental) {
    switch (accidental) {
    case Accidental::Flat:    return -1;
    case Accidental::Sharp:   return 1;
    case Accidental::Natural:
    case Accidental::None:    return 0;
    }
    return 0;
}

bool parseAccidentalMark(QChar mark, Accidental& out) {
    switch (mark.unicode()) {
    case '_': out = Accidental::Flat;    return true;
    case '=': out = Accidental::Natural; return true;
    case '^': out = Accidental::Sharp;   return true;
    default:  return false;
    }
}

QString accidentalName(Accidental accidental) {
    switch (accidental) {
    case Accidental::Flat:    return "flat";
    case Accidental::Natural: return "natural";
    case Accidental::Sharp:   return "sharp";
    case Accidental::None:    return {};
    }
    return {};
}

} // namespace abc
