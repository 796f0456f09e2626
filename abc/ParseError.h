#pragma once

#include <QString>

namespace abc {

enum class ParseErrorKind {
    None = 0,
    EmptyInput,
    MissingMarker,
    FileUnreadable,
    HeaderTooShort,
    HeaderOrderInvalid,
    KeySignatureUnsupported,
    InvalidPitchLetter,
};

// Describes why a parse call failed. kind == None means no failure was recorded.
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::None;
    QString message;

    bool ok() const { return kind == ParseErrorKind::None; }
};

// Stable identifier for an error kind, e.g. "HeaderTooShort".
QString parseErrorKindName(ParseErrorKind kind);

// Fills `error` and logs it with qWarning(). Always returns false so callers can
// write `return failParse(error, ...);`.
bool failParse(ParseError& error, ParseErrorKind kind, const QString& message);

} // namespace abc
