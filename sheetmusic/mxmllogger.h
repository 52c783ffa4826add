#ifndef SHEETMUSIC_MXMLLOGGER_H
#define SHEETMUSIC_MXMLLOGGER_H

#include <QLoggingCategory>
#include <QString>

class QXmlStreamReader;

Q_DECLARE_LOGGING_CATEGORY(sheetmusicImport)

namespace SheetMusic {

//---------------------------------------------------------
//   MxmlLogger
//---------------------------------------------------------

class MxmlLogger
{
public:
    enum class Level : char {
        MXML_TRACE, MXML_INFO, MXML_ERROR
    };
    MxmlLogger() {}
    void logDebugTrace(const QString& trace, const QXmlStreamReader* const xmlreader = nullptr) const;
    void logDebugTrace(const QString& trace, qint64 line) const;
    void logDebugInfo(const QString& info, const QXmlStreamReader* const xmlreader = nullptr) const;
    void logDebugInfo(const QString& info, qint64 line) const;
    void logError(const QString& error, const QXmlStreamReader* const xmlreader = nullptr) const;
    void logError(const QString& error, qint64 line) const;
    Level loggingLevel() const { return _level; }
    void setLoggingLevel(const Level level) { _level = level; }

    static bool levelFromString(const QString& name, Level& level);

private:
    Level _level { Level::MXML_INFO };
};

} // namespace SheetMusic

#endif // SHEETMUSIC_MXMLLOGGER_H
