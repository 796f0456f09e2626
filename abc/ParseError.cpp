#include "abc/ParseError.h"

#include <QDebug>

namespace abc {

QString parseErrorKindName(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::None:                    return "None";
    case ParseErrorKind::EmptyInput:              return "EmptyInput";
    case ParseErrorKind::MissingMarker:           return "MissingMarker";
    case ParseErrorKind::FileUnreadable:          return "FileUnreadable";
    case ParseErrorKind::HeaderTooShort:          return "HeaderTooShort";
    case ParseErrorKind::HeaderOrderInvalid:      return "HeaderOrderInvalid";
    case ParseErrorKind::KeySignatureUnsupported: return "KeySignatureUnsupported";
    case ParseErrorKind::InvalidPitchLetter:      return "InvalidPitchLetter";
    }
    return "Unknown";
}

bool failParse(ParseError& error, ParseErrorKind kind, const QString& message) {
    error.kind = kind;
    error.message = message;
    qWarning().noquote() << QString("abc parse error (%1): %2").arg(parseErrorKindName(kind), message);
    return false;
}

} // namespace abc
