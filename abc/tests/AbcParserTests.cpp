#include "abc/AbcDocument.h"
#include "abc/AbcJson.h"
#include "abc/AbcParser.h"
#include "abc/TuneSummary.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QFile>
#include <QtGlobal>

using abc::AbcDocument;
using abc::Accidental;
using abc::InformationField;
using abc::ParseError;
using abc::ParseErrorKind;

namespace {

static int g_failures = 0;

static void expect(bool cond, const QString& msg) {
    if (!cond) {
        ++g_failures;
        qWarning().noquote() << "FAIL:" << msg;
    }
}

static void expectEq(int a, int b, const QString& msg) {
    expect(a == b, msg + QString(" (got %1 expected %2)").arg(a).arg(b));
}

static void expectStrEq(const QString& a, const QString& b, const QString& msg) {
    expect(a == b, msg + QString(" (got '%1' expected '%2')").arg(a, b));
}

static void expectKind(const ParseError& err, ParseErrorKind kind, const QString& msg) {
    expect(err.kind == kind, msg + QString(" (got %1 expected %2)")
                                       .arg(abc::parseErrorKindName(err.kind), abc::parseErrorKindName(kind)));
}

static AbcDocument parseOk(const QString& text, const QString& what) {
    AbcDocument doc;
    ParseError err;
    expect(abc::parseAbcText(text, doc, err), what + ": " + err.message);
    return doc;
}

static ParseError parseFail(const QString& text, const QString& what) {
    AbcDocument doc;
    ParseError err;
    expect(!abc::parseAbcText(text, doc, err), what + " should fail");
    return err;
}

static QVector<InformationField> header(const QString& keys, const QString& keyValue = "C") {
    QVector<InformationField> fields;
    for (const QChar k : keys) fields.push_back(InformationField{k, k == 'K' ? keyValue : QString("1")});
    return fields;
}

} // namespace

static void testHeaderValidation() {
    AbcDocument doc;
    ParseError err;
    expect(abc::buildAbcDocument(header("XTK"), {}, doc, err), "X,T,K header builds");
    expectEq(doc.fields.size(), 3, "three fields kept");

    expect(abc::buildAbcDocument(header("XTMLK"), {}, doc, err), "extra fields between T and K");

    ParseError e1;
    expect(!abc::buildAbcDocument(header("XT"), {}, doc, e1), "two fields rejected");
    expectKind(e1, ParseErrorKind::HeaderTooShort, "two fields");

    ParseError e2;
    expect(!abc::buildAbcDocument({}, {}, doc, e2), "empty header rejected");
    expectKind(e2, ParseErrorKind::HeaderTooShort, "empty header");

    ParseError e3;
    expect(!abc::buildAbcDocument(header("TXK"), {}, doc, e3), "T first rejected");
    expectKind(e3, ParseErrorKind::HeaderOrderInvalid, "missing X: first");

    ParseError e4;
    expect(!abc::buildAbcDocument(header("XMK"), {}, doc, e4), "T not second rejected");
    expectKind(e4, ParseErrorKind::HeaderOrderInvalid, "missing T: second");

    ParseError e5;
    expect(!abc::buildAbcDocument(header("XTKL"), {}, doc, e5), "K not last rejected");
    expectKind(e5, ParseErrorKind::HeaderOrderInvalid, "K: not last");

    ParseError e6;
    expect(!abc::buildAbcDocument(header("XTK", "D"), {}, doc, e6), "key D rejected");
    expectKind(e6, ParseErrorKind::KeySignatureUnsupported, "key D");
}

static void testParseTune() {
    const AbcDocument doc = parseOk(
        "%abc\n"
        "X:1\n"
        "T:Tune\n"
        "M:4/4\n"
        "K:C ^F _B\n"
        "C D E F | G A B c |\n",
        "basic tune");

    expectEq(doc.fields.size(), 4, "four header fields");
    expectStrEq(doc.title(), "Tune", "title");
    expectStrEq(doc.keySignature(), "C ^F _B", "key value");
    expectStrEq(doc.fieldValue('M'), "4/4", "meter value");
    expect(doc.fieldValue('Q').isNull(), "absent field is null");
    expect(doc.hasField('M') && !doc.hasField('L'), "hasField");

    expectEq(doc.music.size(), 8, "eight notes");
    if (doc.music.size() == 8) {
        expect(doc.music[3].accidental == Accidental::Sharp && doc.music[3].pitchValue == 46, "F sharpened by key");
        expect(doc.music[6].accidental == Accidental::Flat && doc.music[6].pitchValue == 50, "B flattened by key");
        expect(doc.music[0].accidental == Accidental::None, "C untouched");
    }
    expectEq(doc.notes().size(), 8, "notes() filters nothing here");
}

static void testHeaderScanning() {
    AbcDocument doc = parseOk("%abc\n\nx:1\n\nt: My Tune\nk:C\nCDE\n", "blank lines and lower case keys");
    expectEq(doc.fields.size(), 3, "blank lines skipped");
    if (doc.fields.size() == 3) {
        expect(doc.fields[0].key == 'X' && doc.fields[2].key == 'K', "keys upper-cased");
    }
    expectStrEq(doc.title(), " My Tune", "value kept as written after ':'");
    expectEq(doc.music.size(), 3, "body after header");

    doc = parseOk("%abc\nX:1\nT:t\nK:C\nC2-\nC2 D\nz2\n", "multi-line body");
    expectEq(doc.music.size(), 3, "body lines joined before folding");
    if (doc.music.size() == 3) {
        expectEq(doc.music[0].duration, 4, "tie spans a line break");
        expect(doc.music[2].isRest() && doc.music[2].duration == 2, "trailing rest");
    }

    doc = parseOk("%abc\nX:1\nT:t\nK:C\nAB\ncd\n", "lines joined without separator");
    expectEq(doc.music.size(), 4, "AB + cd");

    doc = parseOk("  %abc  \r\nX:1\r\nT:t\r\nK:C\r\nC\r\n", "CRLF input");
    expectEq(doc.music.size(), 1, "CRLF body");
    expectStrEq(doc.keySignature(), "C", "CR stripped from key value");

    doc = parseOk("%abc\nX:1\nT:t\nK:C\n", "empty body");
    expect(doc.music.isEmpty(), "empty body is not an error here");

    doc = parseOk("%abc\nX:1\nT:t\nK:C ^f\n[F A c] f'2 F", "key signature through parser");
    expectEq(doc.music.size(), 5, "chord and notes");
    if (doc.music.size() == 5) {
        expectEq(doc.music[0].pitchValue, 46, "F in chord sharpened");
        expectEq(doc.music[1].duration, 0, "chord member zeroed");
        expectEq(doc.music[3].pitchValue, 70, "f' sharpened");
    }
}

static void testDuplicateFields() {
    AbcDocument doc = parseOk("%abc\nX:1\nT:a\nT:b\nK:C\nC", "repeated T:");
    expectEq(doc.fields.size(), 4, "repeated fields are all kept");
    expectStrEq(doc.title(), "a", "title comes from the first T:");
    if (doc.fields.size() == 4) expectStrEq(doc.fields[2].value, "b", "second T: kept in order");

    doc = parseOk("%abc\nX:1\nT:t\nK:C ^F\nK:C\nF", "repeated K:");
    expectEq(doc.fields.size(), 4, "both K: fields kept");
    expectStrEq(doc.keySignature(), "C ^F", "key signature comes from the first K:");
    if (doc.music.size() == 1) {
        expect(doc.music[0].accidental == Accidental::Sharp && doc.music[0].pitchValue == 46,
               "first K: sharpens F");
    } else {
        expectEq(doc.music.size(), 1, "repeated K: body");
    }

    // The last field only has to be K:; the first K: still decides the key.
    expectKind(parseFail("%abc\nX:1\nT:t\nK:G\nK:C\nC", "unsupported first K:"),
               ParseErrorKind::KeySignatureUnsupported, "first K: is G");
}

static void testParseErrors() {
    AbcDocument doc;
    ParseError err;
    expect(!abc::parseAbcLines({}, doc, err), "no lines");
    expectKind(err, ParseErrorKind::EmptyInput, "no lines");

    expectKind(parseFail("", "empty text"), ParseErrorKind::EmptyInput, "empty text");
    expectKind(parseFail("X:1\nT:t\nK:C\nC", "no marker"), ParseErrorKind::MissingMarker, "no marker");
    expectKind(parseFail("%abc-2.1\nX:1\nT:t\nK:C\nC", "versioned marker"), ParseErrorKind::MissingMarker, "marker must be exact");
    expectKind(parseFail("%abc\nX:1\nK:C\nC", "two fields"), ParseErrorKind::HeaderTooShort, "two fields");
    expectKind(parseFail("%abc\nT:t\nX:1\nK:C\nC", "T before X"), ParseErrorKind::HeaderOrderInvalid, "T before X");
    expectKind(parseFail("%abc\nX:1\nT:t\nK:C\nL:1/8\nC", "K not last"), ParseErrorKind::HeaderOrderInvalid, "K not last");
    expectKind(parseFail("%abc\nX:1\nT:t\nK:G\nC", "key G"), ParseErrorKind::KeySignatureUnsupported, "key G");
    expectKind(parseFail("%abc\nX:1\nT:t\nK:\nC", "empty key"), ParseErrorKind::KeySignatureUnsupported, "empty key");
    expectKind(parseFail("%abc\nX:1\nT:t\nK:C\nC !trill! D", "decoration letters"), ParseErrorKind::InvalidPitchLetter, "letters of a decoration");

    // Header problems win over body problems.
    expectKind(parseFail("%abc\nX:1\nK:C\nH", "bad header and body"), ParseErrorKind::HeaderTooShort, "header checked first");

    // The output document is untouched on failure.
    AbcDocument kept;
    kept.fields.push_back(InformationField{'X', "keep"});
    ParseError e;
    expect(!abc::parseAbcText("%abc\nX:1\nT:t\nK:D\nC", kept, e), "failing parse");
    expect(kept.fields.size() == 1 && kept.fields[0].value == "keep", "no partial document");

    expectStrEq(abc::parseErrorKindName(ParseErrorKind::KeySignatureUnsupported), "KeySignatureUnsupported", "kind name");
    expect(ParseError{}.ok(), "default error is ok");
}

static void testParseFile() {
    QTemporaryDir dir;
    expect(dir.isValid(), "temporary dir");
    const QString path = dir.filePath("tune.abc");
    {
        QFile f(path);
        expect(f.open(QIODevice::WriteOnly), "write tune file");
        f.write("%abc\nX:7\nT:From file\nK:C _E\nE2 z E\n");
    }

    AbcDocument doc;
    ParseError err;
    expect(abc::parseAbcFile(path, doc, err), "parseAbcFile: " + err.message);
    expectStrEq(doc.title(), "From file", "file title");
    expectEq(doc.music.size(), 3, "file events");
    if (!doc.music.isEmpty()) expectEq(doc.music[0].pitchValue, 43, "E flattened");

    ParseError missing;
    expect(!abc::parseAbcFile(dir.filePath("missing.abc"), doc, missing), "missing file");
    expectKind(missing, ParseErrorKind::FileUnreadable, "missing file");
}

static void testJson() {
    const AbcDocument doc = parseOk("%abc\nX:1\nT:t\nK:C ^F\nF2 z c", "json tune");
    const QJsonObject o = abc::documentToJson(doc);

    const QJsonArray fields = o.value("fields").toArray();
    expectEq(fields.size(), 3, "json fields");
    expectStrEq(fields.at(0).toObject().value("key").toString(), "X", "json first key");
    expectStrEq(fields.at(2).toObject().value("value").toString(), "C ^F", "json key value");

    const QJsonArray music = o.value("music").toArray();
    expectEq(music.size(), 3, "json music");
    if (music.size() == 3) {
        const QJsonObject f = music.at(0).toObject();
        expectStrEq(f.value("type").toString(), "note", "json note type");
        expectStrEq(f.value("name").toString(), "F", "json note name");
        expectStrEq(f.value("accidental").toString(), "sharp", "json accidental");
        expectEq(f.value("duration").toInt(), 2, "json duration");
        expectEq(f.value("pitch").toInt(), 46, "json pitch");

        const QJsonObject z = music.at(1).toObject();
        expectStrEq(z.value("type").toString(), "rest", "json rest type");
        expect(!z.contains("pitch"), "json rest has no pitch");

        expect(!music.at(2).toObject().contains("accidental"), "json accidental omitted when none");
    }
}

static void testSummary() {
    const AbcDocument doc = parseOk("%abc\nX:1\nT:t\nK:C\nz2 C2 [E G] c z", "summary tune");
    expectEq(doc.music.size(), 6, "summary events");

    const abc::TuneSummary s = abc::summarizeTune(doc.music);
    expectEq(s.totalBeats, 7, "total beats");
    expectEq(s.noteCount, 4, "note count");
    expectEq(s.restCount, 2, "rest count");
    expectEq(s.lowestPitch, 40, "lowest pitch");
    expectEq(s.highestPitch, 52, "highest pitch");
    expectEq(s.pitchSpan(), 13, "pitch span");
    expect(s.fitsComb(18) && s.fitsComb(13) && !s.fitsComb(12), "comb fit");

    const abc::TuneSummary empty = abc::summarizeTune({});
    expect(empty.pitchSpan() == 0 && empty.lowestPitch == -1, "empty summary");

    const AbcDocument padded = parseOk("%abc\nX:1\nT:t\nK:C\nz C E4 z2 x", "padded tune");
    const QVector<abc::MusicEvent> tape = abc::trimmedForTape(padded.music);
    expectEq(tape.size(), 2, "rests trimmed at both ends");
    if (tape.size() == 2) {
        expectStrEq(tape[0].name, "C", "first tape note");
        expectEq(tape[1].duration, 1, "final note shortened to one beat");
    }
    expect(abc::trimmedForTape({abc::MusicEvent::rest(2)}).isEmpty(), "all-rest tune trims to nothing");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    testHeaderValidation();
    testParseTune();
    testHeaderScanning();
    testDuplicateFields();
    testParseErrors();
    testParseFile();
    testJson();
    testSummary();

    if (g_failures == 0) {
        qInfo("AbcParserTests: PASS");
        return 0;
    }

    qWarning("AbcParserTests: FAIL (%d failures)", g_failures);
    return 1;
}
