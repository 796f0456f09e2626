#include "abc/AbcParser.h"

#include "abc/BodyTokenizer.h"
#include "abc/EventFolder.h"

#include <QFile>
#include <QRegularExpression>

namespace abc {

bool parseAbcLines(const QStringList& lines, AbcDocument& out, ParseError& error) {
    if (lines.isEmpty()) {
        return failParse(error, ParseErrorKind::EmptyInput, "input is empty");
    }
    if (lines.first().trimmed() != kAbcMarker) {
        return failParse(error, ParseErrorKind::MissingMarker,
                         "input does not appear to be abc notation (missing %abc header)");
    }

    static const QRegularExpression reField(R"(^([A-Za-z]):(.*)$)");

    QVector<InformationField> fields;
    int bodyStart = 1;
    for (; bodyStart < lines.size(); ++bodyStart) {
        const QString line = lines[bodyStart].trimmed();
        if (line.isEmpty()) continue;
        const QRegularExpressionMatch m = reField.match(line);
        if (!m.hasMatch()) break;
        fields.push_back(InformationField{m.captured(1).at(0).toUpper(), m.captured(2)});
    }

    // Header problems are reported before anything in the body.
    if (!validateHeader(fields, error)) return false;

    QString body;
    for (int i = bodyStart; i < lines.size(); ++i) body += lines[i].trimmed();

    QVector<EventToken> tokens;
    if (!tokenizeBody(cleanBodyText(body), tokens, error)) return false;

    return buildAbcDocument(fields, foldEvents(tokens), out, error);
}

bool parseAbcText(const QString& text, AbcDocument& out, ParseError& error) {
    if (text.isEmpty()) {
        return failParse(error, ParseErrorKind::EmptyInput, "input is empty");
    }
    QString normalized = text;
    normalized.remove('\r');
    QStringList lines = normalized.split('\n', Qt::KeepEmptyParts);
    if (lines.size() > 1 && lines.last().isEmpty()) lines.removeLast();
    return parseAbcLines(lines, out, error);
}

bool parseAbcFile(const QString& path, AbcDocument& out, ParseError& error) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return failParse(error, ParseErrorKind::FileUnreadable,
                         QString("could not open %1: %2").arg(path, f.errorString()));
    }
    return parseAbcText(QString::fromUtf8(f.readAll()), out, error);
}

} // namespace abc
