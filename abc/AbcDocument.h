#pragma once

#include <QChar>
#include <QString>
#include <QVector>

#include "abc/MusicEvent.h"
#include "abc/ParseError.h"

namespace abc {

// One "L:value" header line. Key is stored upper case; value is the raw text after ':'.
struct InformationField {
    QChar key;
    QString value;
};

// A parsed tune: header fields in file order (duplicates kept) and the resolved
// body events. Only buildAbcDocument() produces instances that satisfy the
// header rules, and it has already applied the key signature.
struct AbcDocument {
    QVector<InformationField> fields;
    QVector<MusicEvent> music;

    // Value of the first field with this key, or a null string.
    QString fieldValue(QChar key) const;
    bool hasField(QChar key) const;

    QString title() const { return fieldValue('T'); }
    // First K: wins; validation only requires the last field to be K:.
    QString keySignature() const { return fieldValue('K'); }

    QVector<MusicEvent> notes() const;
};

// Header rules: at least three fields, X: first, T: second, K: last.
bool validateHeader(const QVector<InformationField>& fields, ParseError& error);

// Validates the header (see validateHeader()), builds the
// document and propagates the key signature into `music`.
// `out` is only written on success.
bool buildAbcDocument(const QVector<InformationField>& fields,
                      const QVector<MusicEvent>& music,
                      AbcDocument& out,
                      ParseError& error);

} // namespace abc
