#ifndef SHEETMUSIC_MXMLPARSER_H
#define SHEETMUSIC_MXMLPARSER_H

#include <initializer_list>
#include <optional>

#include <QByteArray>
#include <QXmlStreamReader>

#include "mxmldata.h"

namespace SheetMusic {

class MxmlLogger;

namespace MusicXML {

/**
 Reads a score-partwise document into the element tree.
 Only the first part is kept. Measure children outside the handled
 set are skipped while reading.
 Throws FormatError for a document that is not (well-formed) partwise
 MusicXML and MalformedInputError for unusable values.
 */

class MxmlParser
{
public:
    explicit MxmlParser(const MxmlLogger* logger);
    MxmlData parse(const QByteArray& content, const QString& path);

private:
    void parse();
    std::unique_ptr<Attributes> parseAttributes();
    std::unique_ptr<Backup> parseBackup();
    std::unique_ptr<Barline> parseBarline();
    Clef parseClef();
    QString parseCreator();
    Defaults parseDefaults();
    std::unique_ptr<Forward> parseForward();
    void parseIdentification();
    Measure parseMeasure();
    MeasureLayout parseMeasureLayout();
    std::unique_ptr<Note> parseNote();
    Accidental parseNoteAccidental();
    NoteBeam parseNoteBeam();
    Stem parseNoteStem();
    PageLayout parsePageLayout();
    PageMargins parsePageMargins();
    Part parsePart();
    Pitch parsePitch();
    std::unique_ptr<Print> parsePrint();
    void parseScorePartwise();
    StaffLayout parseStaffLayout();
    SystemLayout parseSystemLayout();
    Margins parseSystemMargins();
    void parseWork();

    std::optional<double> decimalAttribute(const char* name) const;
    Fraction readDuration();
    double readDecimal();
    int readInteger();
    bool ignoredElement(std::initializer_list<const char*> names);
    [[noreturn]] void malformed(const QString& text) const;
    void unexpectedElement();

    MxmlData m_data;
    QXmlStreamReader m_e;
    QString m_path;
    const MxmlLogger* const m_logger;
};

} // namespace MusicXML
} // namespace SheetMusic

#endif // SHEETMUSIC_MXMLPARSER_H
