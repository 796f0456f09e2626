#pragma once

#include <QVector>

#include "abc/BodyTokenizer.h"
#include "abc/MusicEvent.h"

namespace abc {

// Folds scanned tokens into the event timeline.
// - Tie: when the previous token ended with '-', an event with the same name
//   is merged into the previous one (durations add, the later event is dropped).
//   A tie between different names is left alone.
// - Chord: every event after the opening one until the token carrying ']'
//   gets duration 0, so only the first member advances the timeline.
// Ties are resolved before chord zeroing.
class EventFolder {
public:
    void push(const EventToken& token);

    const QVector<MusicEvent>& events() const { return m_events; }
    QVector<MusicEvent> takeEvents();

    bool pendingTie() const { return m_pendingTie; }
    bool inChord() const { return m_inChord; }

private:
    QVector<MusicEvent> m_events;
    bool m_pendingTie = false;
    bool m_inChord = false;
};

QVector<MusicEvent> foldEvents(const QVector<EventToken>& tokens);

} // namespace abc
