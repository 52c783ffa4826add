/****************************************************************************
**
** preferences.cpp -- implementation of struct Preferences
**
****************************************************************************/

#include <QFileInfo>
#include <QtGlobal>

#include "preferences.h"

namespace SheetMusic {

const char* const BUNDLED_SCHEMA_PATH = ":/schema/musicxml.xsd";

// the result is either a Qt resource path or an absolute file path,
// never relative to the working directory at load time

QString Preferences::resolvedSchemaPath() const
{
    if (schemaPath.isEmpty()) {
        return BUNDLED_SCHEMA_PATH;
    }
    if (schemaPath.startsWith(':')) {
        return schemaPath;
    }
    return QFileInfo(schemaPath).absoluteFilePath();
}

Preferences Preferences::fromEnvironment()
{
    Preferences preferences;
    const auto schema = qEnvironmentVariable("SHEETMUSIC_SCHEMA");
    if (!schema.isEmpty()) {
        preferences.schemaPath = QFileInfo(schema).absoluteFilePath();
    }
    const auto level = qEnvironmentVariable("SHEETMUSIC_LOG_LEVEL");
    if (!level.isEmpty() && !MxmlLogger::levelFromString(level, preferences.loggingLevel)) {
        qCWarning(sheetmusicImport, "ignoring unknown SHEETMUSIC_LOG_LEVEL '%s'", qPrintable(level));
    }
    return preferences;
}

} // namespace SheetMusic
