#pragma once

#include <QString>

#include "abc/Accidental.h"

namespace abc {

enum class EventKind {
    Note = 0,
    Rest,
};

// One resolved body event. A tagged union over Note and Rest: the kind is fixed
// when the tokenizer builds the event; name, accidental and pitch fields are
// meaningful for notes only.
struct MusicEvent {
    EventKind kind = EventKind::Rest;

    // Beat count. 1 by default, 0 for non-leading chord members, summed across ties.
    int duration = 1;

    QString name;                          // letter plus octave marks, e.g. "c'" (notes only)
    Accidental accidental = Accidental::None;
    int naturalPitch = 0;                  // letter + octave marks, before the accidental
    int pitchValue = 0;                    // naturalPitch + accidental delta

    static MusicEvent rest(int duration = 1);

    // Builds a note, computing its pitch value. Returns false if the first
    // character of `name` is not a pitch table letter.
    static bool makeNote(const QString& name, Accidental accidental, int duration, MusicEvent& out);

    bool isNote() const { return kind == EventKind::Note; }
    bool isRest() const { return kind == EventKind::Rest; }

    // Replaces the accidental and recomputes pitchValue.
    void setAccidental(Accidental a);

    // Tie continuation check: two rests always match, two notes match on their
    // full written name (accidentals are not part of the name).
    bool sameTieName(const MusicEvent& other) const;

    // Short listing form: name, accidental name, then duration when non-zero.
    // e.g. "Fsharp2", "c1", "Rest3", "E" for a chord member.
    QString toString() const;
};

// Notes compare by pitch value only, so enharmonic spellings compare equal.
// Rests carry no pitch and should not be compared.
inline bool operator==(const MusicEvent& a, const MusicEvent& b) { return a.pitchValue == b.pitchValue; }
inline bool operator!=(const MusicEvent& a, const MusicEvent& b) { return !(a == b); }
inline bool operator<(const MusicEvent& a, const MusicEvent& b) { return a.pitchValue < b.pitchValue; }
inline bool operator>(const MusicEvent& a, const MusicEvent& b) { return b < a; }

} // namespace abc
