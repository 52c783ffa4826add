#ifndef SHEETMUSIC_LAYOUTENGINE_H
#define SHEETMUSIC_LAYOUTENGINE_H

#include <optional>

#include <QString>

namespace SheetMusic {

class Measure;
struct ParseContext;

namespace MusicXML {
struct Print;
}

enum class Placement : char {
    NEW_PAGE, NEW_SYSTEM, CONTINUE
};

QString placementToString(Placement placement);

//---------------------------------------------------------
//   LayoutEngine
//---------------------------------------------------------

/**
 Positions the current measure from the print element it contains.

 Placement depends on the print attributes and on the measure being
 the first of the document:

   NEW_PAGE     first measure or new-page="yes"
   NEW_SYSTEM   new-system="yes"
   CONTINUE     otherwise

 A new page requires system-layout/top-system-distance, a new system
 requires system-layout/system-distance. For a continuation
 measure-layout/measure-distance is optional.
 Coordinates are in tenths, with y pointing up from the bottom of the page.
 */

class LayoutEngine
{
public:
    static Placement placement(const Measure& measure, const MusicXML::Print& print);
    static void handlePrint(ParseContext& context, const MusicXML::Print& print);

private:
    static double required(const ParseContext& context, const MusicXML::Print& print,
                           const std::optional<double>& value, const char* name);
};

} // namespace SheetMusic

#endif // SHEETMUSIC_LAYOUTENGINE_H
