#ifndef SHEETMUSIC_DOCUMENTLOADER_H
#define SHEETMUSIC_DOCUMENTLOADER_H

#include <QByteArray>
#include <QString>

namespace SheetMusic {

struct MxmlDocument {
    QString path;
    QByteArray content;     // well-formed xml
};

//---------------------------------------------------------
//   DocumentLoader
//---------------------------------------------------------

/**
 Extracts the MusicXML payload from a compressed (.mxl) container or a
 plain file. Entries under META-INF/ are skipped, the first other entry
 ending in .xml is used.
 Throws FileOpenError, or FormatError if no content is found or the
 content is not well-formed xml.
 */

class DocumentLoader
{
public:
    static MxmlDocument load(const QString& path);
    static bool isContainer(const QString& path);

private:
    static QByteArray readContainer(const QString& path);
    static QByteArray readRaw(const QString& path);
    static void checkWellFormed(const MxmlDocument& document);
};

} // namespace SheetMusic

#endif // SHEETMUSIC_DOCUMENTLOADER_H
