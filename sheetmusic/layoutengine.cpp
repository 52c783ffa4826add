/****************************************************************************
**
** layoutengine.cpp -- implementation of class LayoutEngine
**
****************************************************************************/

#include "importerrors.h"
#include "layoutengine.h"
#include "mxmldata.h"
#include "mxmllogger.h"
#include "parsecontext.h"
#include "sheet.h"

namespace SheetMusic {

QString placementToString(Placement placement)
{
    switch (placement) {
    case Placement::NEW_PAGE: return "new page";
    case Placement::NEW_SYSTEM: return "new system";
    case Placement::CONTINUE: return "continue";
    }
    return "";
}

Placement LayoutEngine::placement(const Measure& measure, const MusicXML::Print& print)
{
    const auto first = measure.prev() == nullptr;
    if (first || MusicXML::isYes(print.newPage)) {
        return Placement::NEW_PAGE;
    }
    if (MusicXML::isYes(print.newSystem)) {
        return Placement::NEW_SYSTEM;
    }
    return Placement::CONTINUE;
}

double LayoutEngine::required(const ParseContext& context, const MusicXML::Print& print,
                              const std::optional<double>& value, const char* name)
{
    if (!value) {
        throw MalformedInputError(context.path, print.lineNumber,
                                  QString("print: missing required '%1'").arg(name));
    }
    return *value;
}

//---------------------------------------------------------
//   handlePrint
//---------------------------------------------------------

void LayoutEngine::handlePrint(ParseContext& context, const MusicXML::Print& print)
{
    auto measure = context.measure;
    const auto page = measure->page();

    if (print.staffSpacing) {
        measure->setStaffSpacing(*print.staffSpacing);
    }

    Margins systemMargins;
    if (print.systemLayout && print.systemLayout->systemMargins) {
        systemMargins = *print.systemLayout->systemMargins;
    }
    const std::optional<double> none;
    const auto& topSystemDistance = print.systemLayout ? print.systemLayout->topSystemDistance : none;
    const auto& systemDistance = print.systemLayout ? print.systemLayout->systemDistance : none;

    const auto where = placement(*measure, print);
    context.logger->logDebugTrace(QString("measure %1: %2").arg(measure->number(), placementToString(where)),
                                  print.lineNumber);

    switch (where) {
    case Placement::NEW_PAGE: {
        measure->setNewSystem(true);
        if (print.pageLayoutRead) {
            // page size and margins stay as in the defaults
            context.logger->logDebugInfo("ignoring page-layout in print", print.lineNumber);
        }
        const auto distance = required(context, print, topSystemDistance, "system-layout/top-system-distance");
        measure->setY(page->size().height() - page->margins().top - distance - measure->height());
        measure->setX(systemMargins.left + page->margins().left);
        break;
    }
    case Placement::NEW_SYSTEM: {
        measure->setNewSystem(true);
        const auto distance = required(context, print, systemDistance, "system-layout/system-distance");
        measure->setX(systemMargins.left + page->margins().left);
        measure->setY(measure->prev()->y() - distance - measure->height());
        break;
    }
    case Placement::CONTINUE:
        measure->followPrevLayout();
        if (print.measureLayout && print.measureLayout->measureDistance) {
            measure->setX(measure->x() + *print.measureLayout->measureDistance);
        }
        break;
    }
}

} // namespace SheetMusic
