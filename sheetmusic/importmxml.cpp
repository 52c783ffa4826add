/****************************************************************************
**
** importmxml.cpp -- MusicXML import returning a status code
**
****************************************************************************/

#include "importerrors.h"
#include "importmxml.h"
#include "musicxmlparser.h"
#include "mxmllogger.h"
#include "preferences.h"
#include "sheet.h"

namespace SheetMusic {

QString fileErrorToString(FileError error)
{
    switch (error) {
    case FileError::FILE_NO_ERROR: return "no error";
    case FileError::FILE_OPEN_ERROR: return "cannot open file";
    case FileError::FILE_BAD_FORMAT: return "bad format";
    case FileError::FILE_INVALID: return "invalid MusicXML";
    case FileError::FILE_CORRUPTED: return "corrupted MusicXML";
    case FileError::FILE_RESOURCE_ERROR: return "resource error";
    }
    return "";
}

static QString errorString(const ImportError& e)
{
    return QString::fromStdString(e.what());
}

//---------------------------------------------------------
//   importMusicXml
//---------------------------------------------------------

/**
 Import the document at path into sheet using parser.
 On failure sheet is left empty and errorText describes the problem.
 */

FileError importMusicXml(const MusicXMLParser& parser, const QString& path, std::unique_ptr<Sheet>& sheet,
                         QString& errorText)
{
    const auto logger = parser.logger();
    sheet.reset();
    errorText.clear();
    FileError res { FileError::FILE_NO_ERROR };

    try {
        sheet = parser.parse(path);
    }
    catch (const FileOpenError& e) {
        errorText = errorString(e);
        res = FileError::FILE_OPEN_ERROR;
    }
    catch (const FormatError& e) {
        errorText = errorString(e);
        res = FileError::FILE_BAD_FORMAT;
    }
    catch (const ValidateError& e) {
        errorText = errorString(e);
        res = FileError::FILE_INVALID;
    }
    catch (const MalformedInputError& e) {
        errorText = errorString(e);
        res = FileError::FILE_CORRUPTED;
    }
    catch (const ResourceError& e) {
        errorText = errorString(e);
        res = FileError::FILE_RESOURCE_ERROR;
    }

    if (res != FileError::FILE_NO_ERROR) {
        logger->logError(QString("%1: %2").arg(fileErrorToString(res), errorText));
    }
    return res;
}

FileError importMusicXml(const Preferences& preferences, const QString& path, std::unique_ptr<Sheet>& sheet,
                         QString& errorText)
{
    MxmlLogger logger;
    logger.setLoggingLevel(preferences.loggingLevel);
    sheet.reset();
    std::unique_ptr<MusicXMLParser> parser;
    try {
        parser.reset(new MusicXMLParser(preferences, &logger));
    }
    catch (const ResourceError& e) {
        errorText = errorString(e);
        logger.logError(QString("%1: %2").arg(fileErrorToString(FileError::FILE_RESOURCE_ERROR), errorText));
        return FileError::FILE_RESOURCE_ERROR;
    }
    return importMusicXml(*parser, path, sheet, errorText);
}

} // namespace SheetMusic
