#include "abc/TuneSummary.h"

#include <algorithm>

namespace abc {

TuneSummary summarizeTune(const QVector<MusicEvent>& music) {
    TuneSummary s;
    for (const auto& e : music) {
        s.totalBeats += e.duration;
        if (e.isRest()) {
            s.restCount += 1;
            continue;
        }
        if (s.noteCount == 0) {
            s.lowestPitch = e.pitchValue;
            s.highestPitch = e.pitchValue;
        } else {
            s.lowestPitch = std::min(s.lowestPitch, e.pitchValue);
            s.highestPitch = std::max(s.highestPitch, e.pitchValue);
        }
        s.noteCount += 1;
    }
    return s;
}

QVector<MusicEvent> trimmedForTape(const QVector<MusicEvent>& music) {
    QVector<MusicEvent> out = music;
    while (!out.isEmpty() && out.first().isRest()) out.removeFirst();
    while (!out.isEmpty() && out.last().isRest()) out.removeLast();
    if (!out.isEmpty() && out.last().duration > 1) out.last().duration = 1;
    return out;
}

} // namespace abc
