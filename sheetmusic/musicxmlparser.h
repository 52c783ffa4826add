#ifndef SHEETMUSIC_MUSICXMLPARSER_H
#define SHEETMUSIC_MUSICXMLPARSER_H

#include <memory>

#include <QString>

#include "fraction.h"
#include "preferences.h"
#include "sheet.h"

namespace SheetMusic {

class MxmlLogger;
class SchemaValidator;
struct ParseContext;

namespace MusicXML {
struct Attributes;
struct Backup;
struct Barline;
struct Forward;
struct Measure;
struct Note;
}

//---------------------------------------------------------
//   MusicXMLParser
//---------------------------------------------------------

/**
 Imports a MusicXML document into a positioned Sheet.

 The document is loaded, validated against the schema (unless disabled
 in the preferences) and read into the element tree. The measures of
 the first part are then added to the sheet in document order: each
 measure is placed on a page, positioned and filled with its notes
 and beams.

 Any fault aborts the import with an ImportError, no partial sheet is
 returned. The schema is compiled once, parse() keeps no state between
 calls.
 */

class MusicXMLParser
{
public:
    MusicXMLParser(const Preferences& preferences, const MxmlLogger* logger);
    ~MusicXMLParser();
    MusicXMLParser(const MusicXMLParser&) = delete;
    MusicXMLParser& operator=(const MusicXMLParser&) = delete;

    std::unique_ptr<Sheet> parse(const QString& path) const;
    const Preferences& preferences() const { return _preferences; }
    const MxmlLogger* logger() const { return _logger; }

private:
    void handleMeasure(ParseContext& context, const MusicXML::Measure& node) const;
    void handleAttributes(ParseContext& context, const MusicXML::Attributes& attributes) const;
    void handleBackup(ParseContext& context, const MusicXML::Backup& backup) const;
    void handleBarline(ParseContext& context, const MusicXML::Barline& barline) const;
    void handleForward(ParseContext& context, const MusicXML::Forward& forward) const;
    void handleNote(ParseContext& context, const MusicXML::Note& note) const;
    Fraction noteDuration(const ParseContext& context, const Fraction& duration, qint64 line) const;

    Preferences _preferences;
    const MxmlLogger* const _logger;
    std::unique_ptr<SchemaValidator> _validator;
};

} // namespace SheetMusic

#endif // SHEETMUSIC_MUSICXMLPARSER_H
