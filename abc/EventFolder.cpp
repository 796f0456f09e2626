#include "abc/EventFolder.h"

#include <QDebug>

#include <utility>

namespace abc {

void EventFolder::push(const EventToken& token) {
    m_events.push_back(token.event);

    const int n = m_events.size();
    if (m_pendingTie && n >= 2) {
        MusicEvent& earlier = m_events[n - 2];
        const MusicEvent& later = m_events[n - 1];
        if (earlier.sameTieName(later)) {
            earlier.duration += later.duration;
            m_events.removeLast();
        } else {
            qDebug().noquote() << QString("abc: tie from %1 to %2 ignored (names differ)")
                                      .arg(earlier.toString(), later.toString());
        }
    }
    m_pendingTie = token.tie;

    if (m_inChord) {
        // After a merged tie the last event is the earlier half; it is zeroed all the same.
        m_events.last().duration = 0;
        m_inChord = !token.chordEnd;
    } else {
        m_inChord = token.chordStart;
    }
}

QVector<MusicEvent> EventFolder::takeEvents() {
    QVector<MusicEvent> out = std::move(m_events);
    m_events.clear();
    m_pendingTie = false;
    m_inChord = false;
    return out;
}

QVector<MusicEvent> foldEvents(const QVector<EventToken>& tokens) {
    EventFolder folder;
    for (const EventToken& t : tokens) folder.push(t);
    return folder.takeEvents();
}

} // namespace abc
