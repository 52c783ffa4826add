/****************************************************************************
**
** musicxmlparser.cpp -- implementation of class MusicXMLParser
**
****************************************************************************/

#include <QPointF>

#include "beamresolver.h"
#include "documentloader.h"
#include "importerrors.h"
#include "layoutengine.h"
#include "musicxmlparser.h"
#include "mxmldata.h"
#include "mxmllogger.h"
#include "mxmlparser.h"
#include "parsecontext.h"
#include "schemavalidator.h"

namespace SheetMusic {

MusicXMLParser::MusicXMLParser(const Preferences& preferences, const MxmlLogger* logger)
    : _preferences(preferences), _logger(logger)
{
    if (_preferences.validate) {
        _validator.reset(new SchemaValidator(_preferences.resolvedSchemaPath()));
    }
}

MusicXMLParser::~MusicXMLParser()
{
    // nothing
}

//---------------------------------------------------------
//   parse
//---------------------------------------------------------

std::unique_ptr<Sheet> MusicXMLParser::parse(const QString& path) const
{
    const auto document = DocumentLoader::load(path);

    if (_validator) {
        QList<ValidationMessage> log;
        const auto valid = _validator->validate(document, &log);
        for (const auto& message : log) {
            if (!message.isError()) {
                _logger->logDebugInfo(message.description, message.line);
            }
        }
        if (!valid) {
            throw ValidateError(path, SchemaValidator::filterFromErrors(log));
        }
    }

    MusicXML::MxmlParser reader(_logger);
    const auto data = reader.parse(document.content, path);
    const auto& score = data.scorePartwise;
    if (score.parts.empty()) {
        const qint64 line = 0;
        throw MalformedInputError(path, line, "score contains no part");
    }

    ParseContext context(path, _logger);
    context.sheet.reset(new Sheet(score));
    context.page = context.sheet->newPage();

    for (const auto& node : score.parts.front().measures) {
        handleMeasure(context, node);
    }

    BeamResolver::checkAllClosed(context);
    context.sheet->finish();
    _logger->logDebugTrace(QString("imported %1 measures on %2 pages")
                           .arg(context.sheet->measureCount())
                           .arg(context.sheet->pages().size()));
    return std::move(context.sheet);
}

//---------------------------------------------------------
//   handleMeasure
//---------------------------------------------------------

void MusicXMLParser::handleMeasure(ParseContext& context, const MusicXML::Measure& node) const
{
    std::unique_ptr<Measure> measure(new Measure(node));
    const auto print = node.print();
    if (print && MusicXML::isYes(print->newPage)) {
        context.page = context.sheet->newPage();
    }
    context.measure = context.page->addMeasure(std::move(measure));

    if (print) {
        LayoutEngine::handlePrint(context, *print);
    }
    else {
        context.measure->followPrevLayout();
        _logger->logDebugTrace(QString("measure %1: %2")
                               .arg(context.measure->number(),
                                    placementToString(context.measure->prev() ? Placement::CONTINUE
                                                      : Placement::NEW_PAGE)), node.lineNumber);
    }

    for (const auto& element : node.elements) {
        switch (element->elementType) {
        case MusicXML::ElementType::ATTRIBUTES:
            handleAttributes(context, static_cast<const MusicXML::Attributes&>(*element));
            break;
        case MusicXML::ElementType::BACKUP:
            handleBackup(context, static_cast<const MusicXML::Backup&>(*element));
            break;
        case MusicXML::ElementType::BARLINE:
            handleBarline(context, static_cast<const MusicXML::Barline&>(*element));
            break;
        case MusicXML::ElementType::FORWARD:
            handleForward(context, static_cast<const MusicXML::Forward&>(*element));
            break;
        case MusicXML::ElementType::NOTE:
            handleNote(context, static_cast<const MusicXML::Note&>(*element));
            break;
        case MusicXML::ElementType::PRINT:
            // already done
            break;
        case MusicXML::ElementType::INVALID:
            break;
        }
    }

    context.measure->finish();
}

void MusicXMLParser::handleAttributes(ParseContext& context, const MusicXML::Attributes& attributes) const
{
    const auto measure = context.measure;
    if (attributes.divisions) {
        measure->setTimeDivisions(*attributes.divisions);
    }
    for (const auto& clef : attributes.clefs) {
        measure->setClef(clef);
    }
    // staves was used when the measure was created, time and key are not handled
}

void MusicXMLParser::handleBackup(ParseContext& context, const MusicXML::Backup& backup) const
{
    const auto duration = noteDuration(context, backup.duration, backup.lineNumber);
    if (!context.measure->changeTime(-duration)) {
        throw MalformedInputError(context.path, backup.lineNumber, "backup beyond measure start");
    }
}

void MusicXMLParser::handleBarline(ParseContext& context, const MusicXML::Barline& barline) const
{
    // repeats and endings are not handled
    _logger->logDebugTrace(QString("measure %1: barline %2").arg(context.measure->number(), barline.location),
                           barline.lineNumber);
}

void MusicXMLParser::handleForward(ParseContext& context, const MusicXML::Forward& forward) const
{
    const auto duration = noteDuration(context, forward.duration, forward.lineNumber);
    if (!context.measure->changeTime(duration)) {
        throw MalformedInputError(context.path, forward.lineNumber, "illegal forward");
    }
}

//---------------------------------------------------------
//   handleNote
//---------------------------------------------------------

/**
 Add a rest or a pitched note to the current measure and resolve
 its primary beam. Grace and cue notes are skipped. Unpitched notes are
 not stored but take their time like a forward.
 */

void MusicXMLParser::handleNote(ParseContext& context, const MusicXML::Note& note) const
{
    if (note.grace || note.cue) {
        _logger->logDebugInfo(QString("skipping %1 note").arg(note.grace ? "grace" : "cue"), note.lineNumber);
        return;
    }
    if (!note.duration.isValid()) {
        throw MalformedInputError(context.path, note.lineNumber, "note without duration");
    }

    const auto measure = context.measure;
    const auto duration = noteDuration(context, note.duration, note.lineNumber);

    if (note.unpitched) {
        if (!note.chord && !measure->skipNote(duration)) {
            throw MalformedInputError(context.path, note.lineNumber, "illegal unpitched note duration");
        }
        return;
    }

    std::optional<QPointF> pos;
    if (note.defaultX && note.defaultY) {
        pos = QPointF(*note.defaultX, *note.defaultY);
    }

    std::unique_ptr<Note> result;
    const Stem* stem { nullptr };
    if (note.rest) {
        result.reset(new Rest(pos, duration, note.dots, note.type, note.measureRest));
    }
    else if (note.pitch) {
        std::unique_ptr<Stem> noteStem;
        if (note.stem && !note.chord) {
            noteStem.reset(new Stem(*note.stem));
        }
        stem = noteStem.get();
        result.reset(new PitchedNote(pos, duration, note.dots, note.type, *note.pitch, std::move(noteStem),
                                     note.accidental));
    }
    else {
        throw MalformedInputError(context.path, note.lineNumber, "note without pitch, unpitched or rest");
    }

    if (!measure->addNote(std::move(result), note.chord)) {
        throw MalformedInputError(context.path, note.lineNumber, "duration out of range");
    }

    // only the first beam child (the primary beam) is resolved
    if (stem && !note.beams.empty()) {
        BeamResolver::resolve(context, note.beams.front(), stem, note.lineNumber);
    }
}

// duration in divisions to fraction of a whole note

Fraction MusicXMLParser::noteDuration(const ParseContext& context, const Fraction& duration, qint64 line) const
{
    const auto divisions = context.measure->timeDivisions();
    if (divisions <= 0) {
        throw MalformedInputError(context.path, line, "duration before divisions");
    }
    const auto result = duration / divisions / 4;
    if (!result.isValid()) {
        throw MalformedInputError(context.path, line, "duration out of range");
    }
    return result;
}

} // namespace SheetMusic
