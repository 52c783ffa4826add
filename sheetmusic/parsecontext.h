#ifndef SHEETMUSIC_PARSECONTEXT_H
#define SHEETMUSIC_PARSECONTEXT_H

#include <map>
#include <memory>

#include <QString>

#include "sheet.h"
#include "sheetelements.h"

namespace SheetMusic {

class MxmlLogger;

//---------------------------------------------------------
//   ParseContext
//---------------------------------------------------------

/**
 State of a single parse: the sheet under construction, the current
 page and measure, and the beams begun but not yet ended (by number).
 */

struct ParseContext {
    ParseContext(const QString& p_path, const MxmlLogger* p_logger)
        : path(p_path), logger(p_logger) {}
    QString path;
    const MxmlLogger* logger { nullptr };
    std::unique_ptr<Sheet> sheet;
    Page* page { nullptr };
    Measure* measure { nullptr };
    std::map<int, std::unique_ptr<Beam>> beams;
};

} // namespace SheetMusic

#endif // SHEETMUSIC_PARSECONTEXT_H
