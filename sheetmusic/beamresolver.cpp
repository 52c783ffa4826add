/****************************************************************************
**
** beamresolver.cpp -- implementation of class BeamResolver
**
****************************************************************************/

#include <QStringList>

#include "beamresolver.h"
#include "importerrors.h"
#include "mxmldata.h"
#include "mxmllogger.h"
#include "parsecontext.h"

namespace SheetMusic {

void BeamResolver::resolve(ParseContext& context, const MusicXML::NoteBeam& beam, const Stem* stem, qint64 line)
{
    auto& beams = context.beams;
    const auto it = beams.find(beam.number);

    if (beam.value == "begin") {
        if (it != beams.end()) {
            throw MalformedInputError(context.path, line,
                                      QString("beam %1 begun while still open").arg(beam.number));
        }
        std::unique_ptr<Beam> newBeam(new Beam(beam.number));
        newBeam->addStem(stem);
        beams[beam.number] = std::move(newBeam);
    }
    else if (beam.value == "continue") {
        if (it == beams.end()) {
            throw MalformedInputError(context.path, line,
                                      QString("beam %1 continued without begin").arg(beam.number));
        }
        it->second->addStem(stem);
    }
    else if (beam.value == "end") {
        if (it == beams.end()) {
            throw MalformedInputError(context.path, line,
                                      QString("beam %1 ended without begin").arg(beam.number));
        }
        it->second->addStem(stem);
        context.measure->addBeam(std::move(it->second));
        beams.erase(it);
    }
    else {
        context.logger->logDebugTrace(QString("ignoring beam %1 '%2'").arg(beam.number).arg(beam.value), line);
    }
}

void BeamResolver::checkAllClosed(const ParseContext& context)
{
    if (context.beams.empty()) {
        return;
    }
    QStringList numbers;
    for (const auto& beam : context.beams) {
        numbers << QString::number(beam.first);
    }
    const qint64 line = 0;
    throw MalformedInputError(context.path, line, QString("beam %1 not ended").arg(numbers.join(", ")));
}

} // namespace SheetMusic
