#pragma once

#include <QVector>

#include "abc/MusicEvent.h"

namespace abc {

struct TuneSummary {
    int totalBeats = 0;
    int noteCount = 0;
    int restCount = 0;

    // Extremes over notes; both -1 when the tune has no notes.
    int lowestPitch = -1;
    int highestPitch = -1;

    // Number of pitch steps a comb needs to play the tune (highest - lowest + 1), 0 without notes.
    int pitchSpan() const { return noteCount > 0 ? highestPitch - lowestPitch + 1 : 0; }
    bool fitsComb(int toothCount) const { return pitchSpan() <= toothCount; }
};

TuneSummary summarizeTune(const QVector<MusicEvent>& music);

// Timeline prepared for a music box tape: leading and trailing rests removed
// and the final note shortened to one beat.
QVector<MusicEvent> trimmedForTape(const QVector<MusicEvent>& music);

} // namespace abc
