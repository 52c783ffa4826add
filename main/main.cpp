/****************************************************************************
**
** main.cpp -- sheetmusic-info, print the layout of a MusicXML file
**
****************************************************************************/

#include <cstdio>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "importmxml.h"
#include "mxmllogger.h"
#include "preferences.h"
#include "sheet.h"

using namespace SheetMusic;

static void printSheet(QTextStream& out, const Sheet& sheet, bool measures, bool notes)
{
    int systems = 0;
    for (const auto& page : sheet.pages()) {
        systems += page->systemCount();
    }
    out << "title: " << sheet.title() << "\n";
    if (!sheet.composer().isEmpty()) {
        out << "composer: " << sheet.composer() << "\n";
    }
    out << "pages: " << sheet.pages().size() << "\n";
    out << "systems: " << systems << "\n";
    out << "measures: " << sheet.measureCount() << "\n";
    if (!measures) {
        return;
    }
    for (const auto& page : sheet.pages()) {
        for (const auto& measure : page->measures()) {
            out << measure->toString() << "\n";
            if (notes) {
                for (const auto& note : measure->notes()) {
                    out << "    " << note->toString() << "\n";
                }
            }
        }
    }
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("sheetmusic-info");

    QCommandLineParser parser;
    parser.setApplicationDescription("Import a MusicXML file and print its layout.");
    parser.addHelpOption();
    const QCommandLineOption schemaOption("schema", "Validate against schema <file>.", "file");
    const QCommandLineOption noValidateOption("no-validate", "Do not validate the document.");
    const QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Log the import in detail.");
    const QCommandLineOption measuresOption("measures", "Print every measure.");
    const QCommandLineOption notesOption("notes", "Print every measure with its notes.");
    parser.addOption(schemaOption);
    parser.addOption(noValidateOption);
    parser.addOption(verboseOption);
    parser.addOption(measuresOption);
    parser.addOption(notesOption);
    parser.addPositionalArgument("file", "MusicXML file (.xml or .mxl).");

    if (!parser.parse(app.arguments())) {
        fprintf(stderr, "%s\n", qPrintable(parser.errorText()));
        return 2;
    }
    if (parser.isSet("help")) {
        parser.showHelp(0);
    }
    const auto files = parser.positionalArguments();
    if (files.size() != 1) {
        fprintf(stderr, "%s\n", qPrintable(parser.helpText()));
        return 2;
    }

    auto preferences = Preferences::fromEnvironment();
    if (parser.isSet(schemaOption)) {
        preferences.schemaPath = parser.value(schemaOption);
    }
    if (parser.isSet(noValidateOption)) {
        preferences.validate = false;
    }
    if (parser.isSet(verboseOption)) {
        preferences.loggingLevel = MxmlLogger::Level::MXML_TRACE;
        QLoggingCategory::setFilterRules("sheetmusic.import.debug=true");
    }

    std::unique_ptr<Sheet> sheet;
    QString errorText;
    const auto res = importMusicXml(preferences, files.first(), sheet, errorText);
    if (res != FileError::FILE_NO_ERROR) {
        fprintf(stderr, "%s: %s\n", qPrintable(fileErrorToString(res)), qPrintable(errorText));
        return 1;
    }

    QTextStream out(stdout);
    const auto notes = parser.isSet(notesOption);
    printSheet(out, *sheet, notes || parser.isSet(measuresOption), notes);
    return 0;
}
