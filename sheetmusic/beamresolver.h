#ifndef SHEETMUSIC_BEAMRESOLVER_H
#define SHEETMUSIC_BEAMRESOLVER_H

#include <QtGlobal>

namespace SheetMusic {

struct ParseContext;
struct Stem;

namespace MusicXML {
struct NoteBeam;
}

//---------------------------------------------------------
//   BeamResolver
//---------------------------------------------------------

/**
 Matches beam begin, continue and end by beam number.
 A begun beam stays in the parse context until its end, where it is
 handed to the current measure. Hooks carry no bracket and are ignored.
 Throws MalformedInputError on continue or end without begin, on a
 begin for a number already in use and on beams left open.
 */

class BeamResolver
{
public:
    static void resolve(ParseContext& context, const MusicXML::NoteBeam& beam, const Stem* stem, qint64 line);
    static void checkAllClosed(const ParseContext& context);
};

} // namespace SheetMusic

#endif // SHEETMUSIC_BEAMRESOLVER_H
