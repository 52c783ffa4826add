/****************************************************************************
**
** documentloader.cpp -- implementation of class DocumentLoader
**
****************************************************************************/

#include <QFile>
#include <QXmlStreamReader>

#include <private/qzipreader_p.h>

#include "documentloader.h"
#include "importerrors.h"

namespace SheetMusic {

static const char* const METADATA_PREFIX = "META-INF/";

// local file header or end of central directory (empty archive)

bool DocumentLoader::isContainer(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }
    const auto magic = file.read(4);
    return magic == QByteArray("PK\x03\x04", 4) || magic == QByteArray("PK\x05\x06", 4);
}

QByteArray DocumentLoader::readContainer(const QString& path)
{
    QZipReader zip(path);
    if (!zip.isReadable()) {
        throw FileOpenError(path, "cannot open container");
    }
    if (zip.status() != QZipReader::NoError) {
        throw FormatError(path, QString("cannot read container (status %1)").arg(int(zip.status())));
    }
    const auto entries = zip.fileInfoList();
    for (const auto& entry : entries) {
        if (!entry.isFile) {
            continue;
        }
        if (entry.filePath.startsWith(METADATA_PREFIX) || !entry.filePath.endsWith(".xml")) {
            continue;
        }
        return zip.fileData(entry.filePath);
    }
    return QByteArray();
}

QByteArray DocumentLoader::readRaw(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw FileOpenError(path, file.errorString());
    }
    return file.readAll();
}

void DocumentLoader::checkWellFormed(const MxmlDocument& document)
{
    QXmlStreamReader reader(document.content);
    while (!reader.atEnd()) {
        reader.readNext();
    }
    if (reader.hasError()) {
        throw FormatError(document.path, QString("not well-formed xml at line %1 column %2: %3")
                          .arg(reader.lineNumber())
                          .arg(reader.columnNumber())
                          .arg(reader.errorString()));
    }
}

MxmlDocument DocumentLoader::load(const QString& path)
{
    if (!QFile::exists(path)) {
        throw FileOpenError(path, "file does not exist");
    }
    MxmlDocument document;
    document.path = path;
    document.content = isContainer(path) ? readContainer(path) : readRaw(path);
    if (document.content.isEmpty()) {
        throw FormatError(path, "no MusicXML content found");
    }
    checkWellFormed(document);
    return document;
}

} // namespace SheetMusic
