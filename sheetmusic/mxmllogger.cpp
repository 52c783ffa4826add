/****************************************************************************
**
** mxmllogger.cpp -- implementation of class MxmlLogger
**
****************************************************************************/

#include <QXmlStreamReader>

#include "mxmllogger.h"

Q_LOGGING_CATEGORY(sheetmusicImport, "sheetmusic.import")

namespace SheetMusic {

static QString xmlLocation(const QXmlStreamReader* const xmlreader)
{
    QString loc;
    if (xmlreader) {
        loc = QString(" at line %1 col %2").arg(xmlreader->lineNumber()).arg(xmlreader->columnNumber());
    }
    return loc;
}

static QString lineLocation(qint64 line)
{
    QString loc;
    if (line > 0) {
        loc = QString(" at line %1").arg(line);
    }
    return loc;
}

void MxmlLogger::logDebugTrace(const QString& trace, const QXmlStreamReader* const xmlreader) const
{
    if (_level <= Level::MXML_TRACE) {
        qCDebug(sheetmusicImport, "Trace%s: %s", qPrintable(xmlLocation(xmlreader)), qPrintable(trace));
    }
}

void MxmlLogger::logDebugTrace(const QString& trace, qint64 line) const
{
    if (_level <= Level::MXML_TRACE) {
        qCDebug(sheetmusicImport, "Trace%s: %s", qPrintable(lineLocation(line)), qPrintable(trace));
    }
}

void MxmlLogger::logDebugInfo(const QString& info, const QXmlStreamReader* const xmlreader) const
{
    if (_level <= Level::MXML_INFO) {
        qCInfo(sheetmusicImport, "Info%s: %s", qPrintable(xmlLocation(xmlreader)), qPrintable(info));
    }
}

void MxmlLogger::logDebugInfo(const QString& info, qint64 line) const
{
    if (_level <= Level::MXML_INFO) {
        qCInfo(sheetmusicImport, "Info%s: %s", qPrintable(lineLocation(line)), qPrintable(info));
    }
}

void MxmlLogger::logError(const QString& error, const QXmlStreamReader* const xmlreader) const
{
    if (_level <= Level::MXML_ERROR) {
        qCWarning(sheetmusicImport, "Error%s: %s", qPrintable(xmlLocation(xmlreader)), qPrintable(error));
    }
}

void MxmlLogger::logError(const QString& error, qint64 line) const
{
    if (_level <= Level::MXML_ERROR) {
        qCWarning(sheetmusicImport, "Error%s: %s", qPrintable(lineLocation(line)), qPrintable(error));
    }
}

bool MxmlLogger::levelFromString(const QString& name, Level& level)
{
    const auto lower = name.trimmed().toLower();
    if (lower == "trace") {
        level = Level::MXML_TRACE;
    }
    else if (lower == "info") {
        level = Level::MXML_INFO;
    }
    else if (lower == "error") {
        level = Level::MXML_ERROR;
    }
    else {
        return false;
    }
    return true;
}

} // namespace SheetMusic
