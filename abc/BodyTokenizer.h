#pragma once

#include <QString>
#include <QVector>

#include "abc/MusicEvent.h"
#include "abc/ParseError.h"

namespace abc {

// A raw event as scanned from the body, with the grouping markers that
// surrounded it. Consumed by EventFolder and not kept afterwards.
struct EventToken {
    MusicEvent event;
    bool chordStart = false; // preceded by '['
    bool chordEnd = false;   // followed by ']'
    bool tie = false;        // followed by '-'
};

// Strips everything the tokenizer does not understand (decorations, bar lines,
// quoted text, ...). Keeps letters, digits, whitespace and / - ^ _ , ' = [ ].
// Whitespace runs collapse to one space, and "- " becomes "-" so a tie binds
// to the next event even when a decoration was removed between them.
QString cleanBodyText(const QString& body);

// Scans cleaned body text into event tokens, left to right. Characters that do
// not start an event are skipped. Fails with InvalidPitchLetter when a letter
// other than A-G/a-g or z/x (rests) appears in event position.
bool tokenizeBody(const QString& cleanedBody, QVector<EventToken>& out, ParseError& error);

} // namespace abc
