#pragma once

#include <QString>
#include <QStringList>

#include "abc/AbcDocument.h"
#include "abc/ParseError.h"

namespace abc {

// Literal first line every input must carry.
inline const QString kAbcMarker = QStringLiteral("%abc");

// Parses a tune given as lines (without line terminators).
// - line 0 must be "%abc" (surrounding whitespace ignored)
// - header: "L:value" lines, blank lines skipped, until the first other line
// - body: that line and everything after it, each trimmed, joined without separator
// Returns false and fills `error` on any failure; `out` is left untouched then.
bool parseAbcLines(const QStringList& lines, AbcDocument& out, ParseError& error);

// Splits `text` into lines (LF or CRLF) and calls parseAbcLines().
bool parseAbcText(const QString& text, AbcDocument& out, ParseError& error);

// Reads a UTF-8 file and calls parseAbcText().
bool parseAbcFile(const QString& path, AbcDocument& out, ParseError& error);

} // namespace abc
