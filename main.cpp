#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QJsonDocument>
#include <QTextStream>

#include "abc/AbcJson.h"
#include "abc/AbcParser.h"
#include "abc/TuneSummary.h"

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("abcinspect");

    QCommandLineParser cli;
    cli.setApplicationDescription("Resolve the notes and rests of an abc notation tune");
    cli.addHelpOption();
    cli.addPositionalArgument("file", "Input file in abc notation");
    const QCommandLineOption fileOpt("file", "Input file in abc notation.", "path");
    const QCommandLineOption jsonOpt("json", "Print the parsed document as JSON.");
    const QCommandLineOption summaryOpt("summary", "Print beat count and pitch range.");
    const QCommandLineOption trimOpt("trim", "Drop leading/trailing rests and shorten the final note to one beat.");
    const QCommandLineOption toothOpt("tooth-count", "Number of teeth on the music box comb.", "n", "18");
    cli.addOptions({fileOpt, jsonOpt, summaryOpt, trimOpt, toothOpt});
    cli.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    QString path = cli.value(fileOpt);
    if (path.isEmpty() && !cli.positionalArguments().isEmpty()) path = cli.positionalArguments().first();
    if (path.isEmpty()) {
        err << "abcinspect: no input file given\n";
        err.flush();
        cli.showHelp(1);
    }

    bool toothOk = false;
    const int toothCount = cli.value(toothOpt).toInt(&toothOk);
    if (!toothOk || toothCount <= 0) {
        err << "abcinspect: --tooth-count must be a positive number\n";
        return 1;
    }

    abc::AbcDocument doc;
    abc::ParseError error;
    if (!abc::parseAbcFile(path, doc, error)) {
        err << abc::parseErrorKindName(error.kind) << ": " << error.message << "\n";
        return 1;
    }

    if (cli.isSet(trimOpt)) {
        const int before = doc.music.size();
        doc.music = abc::trimmedForTape(doc.music);
        qInfo().noquote() << QString("abcinspect: trimmed %1 events").arg(before - doc.music.size());
    }

    if (cli.isSet(jsonOpt)) {
        out << QJsonDocument(abc::documentToJson(doc)).toJson(QJsonDocument::Indented);
    } else {
        out << doc.title() << "\n";
        for (const auto& e : doc.music) out << "  " << e.toString() << "\n";
    }

    if (cli.isSet(summaryOpt)) {
        const abc::TuneSummary s = abc::summarizeTune(doc.music);
        out << QString("%1 beats, %2 notes, %3 rests\n").arg(s.totalBeats).arg(s.noteCount).arg(s.restCount);
        if (s.noteCount > 0) {
            out << QString("pitch range %1..%2 (%3 steps)\n").arg(s.lowestPitch).arg(s.highestPitch).arg(s.pitchSpan());
        }
        if (!s.fitsComb(toothCount)) {
            out << QString("warning: range of %1 steps exceeds the comb's tooth count (%2)\n")
                       .arg(s.pitchSpan()).arg(toothCount);
        }
    }

    return 0;
}
