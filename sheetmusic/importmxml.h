#ifndef SHEETMUSIC_IMPORTMXML_H
#define SHEETMUSIC_IMPORTMXML_H

#include <memory>

#include <QString>

namespace SheetMusic {

class MusicXMLParser;
class Sheet;
struct Preferences;

enum class FileError : char {
    FILE_NO_ERROR,
    FILE_OPEN_ERROR,
    FILE_BAD_FORMAT,
    FILE_INVALID,
    FILE_CORRUPTED,
    FILE_RESOURCE_ERROR
};

QString fileErrorToString(FileError error);

FileError importMusicXml(const MusicXMLParser& parser, const QString& path, std::unique_ptr<Sheet>& sheet,
                         QString& errorText);
FileError importMusicXml(const Preferences& preferences, const QString& path, std::unique_ptr<Sheet>& sheet,
                         QString& errorText);

} // namespace SheetMusic

#endif // SHEETMUSIC_IMPORTMXML_H
