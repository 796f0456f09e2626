#include "abc/MusicEvent.h"

#include "abc/Pitch.h"

namespace abc {

MusicEvent MusicEvent::rest(int duration) {
    MusicEvent e;
    e.kind = EventKind::Rest;
    e.duration = duration;
    return e;
}

bool MusicEvent::makeNote(const QString& name, Accidental accidental, int duration, MusicEvent& out) {
    int natural = 0;
    if (!pitchValueFor(name, Accidental::None, natural)) return false;

    MusicEvent e;
    e.kind = EventKind::Note;
    e.duration = duration;
    e.name = name;
    e.naturalPitch = natural;
    e.setAccidental(accidental);
    out = e;
    return true;
}

void MusicEvent::setAccidental(Accidental a) {
    accidental = a;
    pitchValue = naturalPitch + accidentalDelta(a);
}

bool MusicEvent::sameTieName(const MusicEvent& other) const {
    if (kind != other.kind) return false;
    if (isRest()) return true;
    return name == other.name;
}

QString MusicEvent::toString() const {
    QString s = isRest() ? QString("Rest") : name + accidentalName(accidental);
    if (duration > 0) s += QString::number(duration);
    return s;
}

} // namespace abc
