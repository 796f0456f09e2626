#include "abc/BodyTokenizer.h"

#include <QRegularExpression>

namespace abc {
namespace {

static bool isRestLetter(QChar c) {
    const QChar l = c.toLower();
    return l == 'z' || l == 'x';
}

} // namespace

QString cleanBodyText(const QString& body) {
    static const QRegularExpression reStrip(R"([^a-zA-Z0-9\s/\-\^_,'=\[\]])");
    static const QRegularExpression reSpaces(R"(\s+)");

    QString s = body;
    s.remove(reStrip);
    s.replace(reSpaces, " ");
    s.replace("- ", "-");
    return s;
}

bool tokenizeBody(const QString& cleanedBody, QVector<EventToken>& out, ParseError& error) {
    // chord start, accidental run, letter with one octave mark, single digit, chord end, tie
    static const QRegularExpression re(R"((\[?)([\^=_]*?)([A-Za-z][,']?)([0-9]?)(\]?)(-?))");

    QVector<EventToken> tokens;

    auto it = re.globalMatch(cleanedBody);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        const QString accidentals = m.captured(2);
        const QString name = m.captured(3);
        const QString digit = m.captured(4);

        // Only the mark closest to the letter counts.
        Accidental accidental = Accidental::None;
        if (!accidentals.isEmpty() && !parseAccidentalMark(accidentals.back(), accidental)) {
            accidental = Accidental::None;
        }

        const int duration = digit.isEmpty() ? 1 : digit[0].digitValue();

        EventToken t;
        t.chordStart = !m.captured(1).isEmpty();
        t.chordEnd = !m.captured(5).isEmpty();
        t.tie = !m.captured(6).isEmpty();

        if (isRestLetter(name[0])) {
            t.event = MusicEvent::rest(duration);
        } else if (!MusicEvent::makeNote(name, accidental, duration, t.event)) {
            return failParse(error, ParseErrorKind::InvalidPitchLetter,
                             QString("'%1' at offset %2 is not a note letter").arg(name).arg(m.capturedStart(3)));
        }
        tokens.push_back(t);
    }

    out = tokens;
    return true;
}

} // namespace abc
