#ifndef SHEETMUSIC_PREFERENCES_H
#define SHEETMUSIC_PREFERENCES_H

#include <QString>

#include "mxmllogger.h"

namespace SheetMusic {

// location of the schema compiled into the library
extern const char* const BUNDLED_SCHEMA_PATH;

//---------------------------------------------------------
//   Preferences
//---------------------------------------------------------

/**
 Import settings, passed by value to the parser.
 An empty schemaPath selects the bundled schema.
 */

struct Preferences {
    QString schemaPath;
    bool validate { true };
    MxmlLogger::Level loggingLevel { MxmlLogger::Level::MXML_ERROR };

    QString resolvedSchemaPath() const;
    static Preferences fromEnvironment();
};

} // namespace SheetMusic

#endif // SHEETMUSIC_PREFERENCES_H
