/****************************************************************************
**
** mxmlparser.cpp -- implementation of class MxmlParser
**
****************************************************************************/

#include "importerrors.h"
#include "mxmllogger.h"
#include "mxmlparser.h"

namespace SheetMusic {
namespace MusicXML {

MxmlParser::MxmlParser(const MxmlLogger* logger)
    : m_logger(logger)
{
    // nothing
}

void MxmlParser::parse()
{
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "score-partwise") {
            m_data.scorePartwise.isFound = true;
            const auto version = m_e.attributes().value("version").toString();
            if (!version.isEmpty()) {
                m_data.scorePartwise.version = version;
            }
            parseScorePartwise();
        }
        else {
            const auto text = QString { "found '%1' instead of 'score-partwise'" }
                    .arg(m_e.name().toString());
            m_logger->logError(text, &m_e);
            m_e.skipCurrentElement();
        }
    }
}

// read and parse the document content

MxmlData MxmlParser::parse(const QByteArray& content, const QString& path)
{
    m_data = MxmlData();
    m_e.clear();
    m_e.addData(content);
    m_path = path;

    parse();

    if (m_e.hasError()) {
        throw FormatError(m_path, QString("error at line %1 column %2: %3")
                          .arg(m_e.lineNumber())
                          .arg(m_e.columnNumber())
                          .arg(m_e.errorString()));
    }
    if (!m_data.scorePartwise.isFound) {
        throw FormatError(m_path, "'score-partwise' not found");
    }
    if (m_data.scorePartwise.parts.empty()) {
        throw MalformedInputError(m_path, 0, "score contains no part");
    }
    return std::move(m_data);
}

std::unique_ptr<Attributes> MxmlParser::parseAttributes()
{
    std::unique_ptr<Attributes> attributes(new Attributes);
    attributes->lineNumber = m_e.lineNumber();
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "divisions") {
            const auto divisions = readInteger();
            if (divisions <= 0) {
                malformed(QString("illegal divisions %1").arg(divisions));
            }
            attributes->divisions = divisions;
        }
        else if (m_e.name() == "clef") {
            attributes->clefs.push_back(parseClef());
        }
        else if (m_e.name() == "staves") {
            const auto staves = readInteger();
            if (staves < 1) {
                malformed(QString("illegal staves %1").arg(staves));
            }
            attributes->staves = staves;
        }
        else if (ignoredElement({ "footnote", "level", "key", "time", "part-symbol", "instruments",
                                  "staff-details", "transpose", "for-part", "directive", "measure-style" })) {
            // time and key changes are not handled
        }
        else {
            unexpectedElement();
        }
    }
    return attributes;
}

std::unique_ptr<Backup> MxmlParser::parseBackup()
{
    std::unique_ptr<Backup> backup(new Backup);
    backup->lineNumber = m_e.lineNumber();
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "duration") {
            backup->duration = readDuration();
        }
        else if (ignoredElement({ "footnote", "level" })) {
        }
        else {
            unexpectedElement();
        }
    }
    if (!backup->duration.isValid()) {
        malformed("backup without duration");
    }
    return backup;
}

std::unique_ptr<Barline> MxmlParser::parseBarline()
{
    std::unique_ptr<Barline> barline(new Barline);
    barline->lineNumber = m_e.lineNumber();
    const auto location = m_e.attributes().value("location").toString();
    if (!location.isEmpty()) {
        barline->location = location;
    }
    // bar-style, repeat and ending are not handled
    m_e.skipCurrentElement();
    return barline;
}

Clef MxmlParser::parseClef()
{
    Clef clef;
    const auto number = m_e.attributes().value("number").toString();
    if (!number.isEmpty()) {
        bool ok;
        clef.number = number.toInt(&ok);
        if (!ok || clef.number < 1) {
            malformed(QString("illegal clef number '%1'").arg(number));
        }
    }
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "clef-octave-change") {
            clef.octaveChange = readInteger();
        }
        else if (m_e.name() == "line") {
            clef.line = readInteger();
        }
        else if (m_e.name() == "sign") {
            clef.sign = m_e.readElementText().trimmed();
        }
        else {
            unexpectedElement();
        }
    }
    return clef;
}

QString MxmlParser::parseCreator()
{
    const auto type = m_e.attributes().value("type").toString();
    const auto text = m_e.readElementText().trimmed();
    return type == "composer" ? text : QString();
}

Defaults MxmlParser::parseDefaults()
{
    Defaults defaults;
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "page-layout") {
            defaults.pageLayout = parsePageLayout();
        }
        else if (m_e.name() == "staff-layout") {
            defaults.staffLayouts.push_back(parseStaffLayout());
        }
        else if (m_e.name() == "system-layout") {
            defaults.systemLayout = parseSystemLayout();
        }
        else if (ignoredElement({ "scaling", "concert-score", "appearance", "music-font", "word-font",
                                  "lyric-font", "lyric-language" })) {
        }
        else {
            unexpectedElement();
        }
    }
    return defaults;
}

std::unique_ptr<Forward> MxmlParser::parseForward()
{
    std::unique_ptr<Forward> forward(new Forward);
    forward->lineNumber = m_e.lineNumber();
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "duration") {
            forward->duration = readDuration();
        }
        else if (ignoredElement({ "footnote", "level", "voice", "staff" })) {
        }
        else {
            unexpectedElement();
        }
    }
    if (!forward->duration.isValid()) {
        malformed("forward without duration");
    }
    return forward;
}

void MxmlParser::parseIdentification()
{
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "creator") {
            const auto composer = parseCreator();
            if (!composer.isEmpty() && m_data.scorePartwise.composer.isEmpty()) {
                m_data.scorePartwise.composer = composer;
            }
        }
        else if (ignoredElement({ "rights", "encoding", "source", "relation", "miscellaneous" })) {
        }
        else {
            unexpectedElement();
        }
    }
}

Measure MxmlParser::parseMeasure()
{
    Measure measure;
    measure.lineNumber = m_e.lineNumber();
    measure.number = m_e.attributes().value("number").toString();
    measure.width = decimalAttribute("width");
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "attributes") {
            measure.elements.push_back(parseAttributes());
        }
        else if (m_e.name() == "backup") {
            measure.elements.push_back(parseBackup());
        }
        else if (m_e.name() == "barline") {
            measure.elements.push_back(parseBarline());
        }
        else if (m_e.name() == "forward") {
            measure.elements.push_back(parseForward());
        }
        else if (m_e.name() == "note") {
            measure.elements.push_back(parseNote());
        }
        else if (m_e.name() == "print") {
            measure.elements.push_back(parsePrint());
        }
        else if (ignoredElement({ "direction", "harmony", "figured-bass", "bookmark", "link",
                                  "grouping", "sound", "listening" })) {
            // not handled
        }
        else {
            unexpectedElement();
        }
    }
    return measure;
}

MeasureLayout MxmlParser::parseMeasureLayout()
{
    MeasureLayout measureLayout;
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "measure-distance") {
            measureLayout.measureDistance = readDecimal();
        }
        else {
            unexpectedElement();
        }
    }
    return measureLayout;
}

std::unique_ptr<Note> MxmlParser::parseNote()
{
    std::unique_ptr<Note> note(new Note);
    note->lineNumber = m_e.lineNumber();
    note->defaultX = decimalAttribute("default-x");
    note->defaultY = decimalAttribute("default-y");
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "accidental") {
            note->accidental = parseNoteAccidental();
        }
        else if (m_e.name() == "beam") {
            note->beams.push_back(parseNoteBeam());
        }
        else if (m_e.name() == "chord") {
            note->chord = true;
            m_e.skipCurrentElement();
        }
        else if (m_e.name() == "cue") {
            note->cue = true;
            m_e.skipCurrentElement();
        }
        else if (m_e.name() == "dot") {
            note->dots++;
            m_e.skipCurrentElement();
        }
        else if (m_e.name() == "duration") {
            note->duration = readDuration();
        }
        else if (m_e.name() == "grace") {
            note->grace = true;
            m_e.skipCurrentElement();
        }
        else if (m_e.name() == "pitch") {
            note->pitch = parsePitch();
        }
        else if (m_e.name() == "rest") {
            note->rest = true;
            note->measureRest = isYes(m_e.attributes().value("measure").toString());
            m_e.skipCurrentElement();
        }
        else if (m_e.name() == "stem") {
            note->stem = parseNoteStem();
        }
        else if (m_e.name() == "type") {
            note->type = m_e.readElementText().trimmed();
        }
        else if (m_e.name() == "unpitched") {
            note->unpitched = true;
            m_e.skipCurrentElement();
        }
        else if (ignoredElement({ "tie", "instrument", "footnote", "level", "voice", "time-modification", "notehead",
                                  "notehead-text", "staff", "notations", "lyric", "play", "listen" })) {
        }
        else {
            unexpectedElement();
        }
    }
    return note;
}

Accidental MxmlParser::parseNoteAccidental()
{
    Accidental accidental;
    const auto attributes = m_e.attributes();
    accidental.cautionary = isYes(attributes.value("cautionary").toString());
    accidental.editorial = isYes(attributes.value("editorial").toString());
    accidental.parentheses = isYes(attributes.value("parentheses").toString());
    accidental.value = m_e.readElementText().trimmed();
    return accidental;
}

NoteBeam MxmlParser::parseNoteBeam()
{
    NoteBeam beam;
    const auto number = m_e.attributes().value("number").toString();
    if (!number.isEmpty()) {
        bool ok;
        beam.number = number.toInt(&ok);
        if (!ok || beam.number < 1 || beam.number > 8) {
            malformed(QString("illegal beam number '%1'").arg(number));
        }
    }
    beam.value = m_e.readElementText().trimmed();
    return beam;
}

Stem MxmlParser::parseNoteStem()
{
    Stem stem;
    stem.defaultY = decimalAttribute("default-y");
    const auto value = m_e.readElementText().trimmed();
    const auto direction = Stem::directionFromString(value);
    if (!direction) {
        malformed(QString("illegal stem value '%1'").arg(value));
    }
    stem.direction = *direction;
    return stem;
}

PageLayout MxmlParser::parsePageLayout()
{
    // page-height and page-width are both either present or not present
    // page-margins is optional, but all its children are required
    PageLayout pageLayout;
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "page-margins") {
            pageLayout.pageMargins.push_back(parsePageMargins());
        }
        else if (m_e.name() == "page-height") {
            pageLayout.pageHeight = readDecimal();
        }
        else if (m_e.name() == "page-width") {
            pageLayout.pageWidth = readDecimal();
        }
        else {
            unexpectedElement();
        }
    }
    return pageLayout;
}

PageMargins MxmlParser::parsePageMargins()
{
    PageMargins pageMargins;
    const auto type = m_e.attributes().value("type").toString();
    if (type == "odd" || type == "even" || type == "both") {
        pageMargins.type = type;
    }
    else if (!type.isEmpty()) {
        malformed(QString("illegal page-margins type '%1'").arg(type));
    }
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "left-margin") {
            pageMargins.margins.left = readDecimal();
        }
        else if (m_e.name() == "right-margin") {
            pageMargins.margins.right = readDecimal();
        }
        else if (m_e.name() == "top-margin") {
            pageMargins.margins.top = readDecimal();
        }
        else if (m_e.name() == "bottom-margin") {
            pageMargins.margins.bottom = readDecimal();
        }
        else {
            unexpectedElement();
        }
    }
    return pageMargins;
}

Part MxmlParser::parsePart()
{
    Part part;
    part.id = m_e.attributes().value("id").toString();
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "measure") {
            part.measures.push_back(parseMeasure());
        }
        else {
            unexpectedElement();
        }
    }
    return part;
}

Pitch MxmlParser::parsePitch()
{
    Pitch pitch;
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "alter") {
            pitch.alter = readDecimal();
        }
        else if (m_e.name() == "octave") {
            const auto octave = readInteger();
            if (octave < 0 || octave > 9) {
                malformed(QString("illegal octave %1").arg(octave));
            }
            pitch.octave = octave;
        }
        else if (m_e.name() == "step") {
            const auto step = m_e.readElementText().trimmed();
            if (step.size() != 1 || step.at(0) < 'A' || step.at(0) > 'G') {
                malformed(QString("illegal step '%1'").arg(step));
            }
            pitch.step = step.at(0).toLatin1();
        }
        else {
            unexpectedElement();
        }
    }
    return pitch;
}

std::unique_ptr<Print> MxmlParser::parsePrint()
{
    std::unique_ptr<Print> print(new Print);
    print->lineNumber = m_e.lineNumber();
    const auto attributes = m_e.attributes();
    print->newPage = attributes.value("new-page").toString();
    print->newSystem = attributes.value("new-system").toString();
    const auto staffSpacing = attributes.value("staff-spacing").toString();
    if (!staffSpacing.isEmpty()) {
        bool ok;
        print->staffSpacing = staffSpacing.toDouble(&ok);
        if (!ok) {
            malformed(QString("illegal staff-spacing '%1'").arg(staffSpacing));
        }
    }
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "page-layout") {
            print->pageLayoutRead = true;
            m_e.skipCurrentElement();
        }
        else if (m_e.name() == "system-layout") {
            print->systemLayout = parseSystemLayout();
        }
        else if (m_e.name() == "measure-layout") {
            print->measureLayout = parseMeasureLayout();
        }
        else if (ignoredElement({ "staff-layout", "measure-numbering", "part-name-display",
                                  "part-abbreviation-display" })) {
        }
        else {
            unexpectedElement();
        }
    }
    return print;
}

void MxmlParser::parseScorePartwise()
{
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "defaults") {
            m_data.scorePartwise.defaults = parseDefaults();
        }
        else if (m_e.name() == "identification") {
            parseIdentification();
        }
        else if (m_e.name() == "movement-title") {
            m_data.scorePartwise.movementTitle = m_e.readElementText().trimmed();
        }
        else if (m_e.name() == "part") {
            if (m_data.scorePartwise.parts.empty()) {
                m_data.scorePartwise.parts.push_back(parsePart());
            }
            else {
                // multi-part scores are not supported, only the first part is imported
                m_logger->logDebugInfo(QString("ignoring part '%1'")
                                       .arg(m_e.attributes().value("id").toString()), &m_e);
                m_e.skipCurrentElement();
            }
        }
        else if (m_e.name() == "work") {
            parseWork();
        }
        else if (ignoredElement({ "movement-number", "credit", "part-list" })) {
        }
        else {
            unexpectedElement();
        }
    }
}

StaffLayout MxmlParser::parseStaffLayout()
{
    StaffLayout staffLayout;
    const auto number = m_e.attributes().value("number").toString();
    if (!number.isEmpty()) {
        bool ok;
        staffLayout.number = number.toInt(&ok);
        if (!ok || staffLayout.number < 1) {
            malformed(QString("illegal staff-layout number '%1'").arg(number));
        }
    }
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "staff-distance") {
            staffLayout.staffDistance = readDecimal();
        }
        else {
            unexpectedElement();
        }
    }
    return staffLayout;
}

SystemLayout MxmlParser::parseSystemLayout()
{
    SystemLayout systemLayout;
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "system-margins") {
            systemLayout.systemMargins = parseSystemMargins();
        }
        else if (m_e.name() == "system-distance") {
            systemLayout.systemDistance = readDecimal();
        }
        else if (m_e.name() == "top-system-distance") {
            systemLayout.topSystemDistance = readDecimal();
        }
        else if (ignoredElement({ "system-dividers" })) {
        }
        else {
            unexpectedElement();
        }
    }
    return systemLayout;
}

Margins MxmlParser::parseSystemMargins()
{
    Margins margins;
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "left-margin") {
            margins.left = readDecimal();
        }
        else if (m_e.name() == "right-margin") {
            margins.right = readDecimal();
        }
        else {
            unexpectedElement();
        }
    }
    return margins;
}

void MxmlParser::parseWork()
{
    while (m_e.readNextStartElement()) {
        if (m_e.name() == "work-title") {
            m_data.scorePartwise.workTitle = m_e.readElementText().trimmed();
        }
        else if (ignoredElement({ "work-number", "opus" })) {
        }
        else {
            unexpectedElement();
        }
    }
}

// an attribute that is absent or not a number yields no value

std::optional<double> MxmlParser::decimalAttribute(const char* name) const
{
    const auto value = m_e.attributes().value(name).toString();
    if (value.isEmpty()) {
        return {};
    }
    bool ok;
    const auto result = value.toDouble(&ok);
    if (!ok) {
        return {};
    }
    return result;
}

Fraction MxmlParser::readDuration()
{
    const auto text = m_e.readElementText();
    bool ok;
    const auto duration = Fraction::fromString(text, &ok);
    if (!ok || duration <= Fraction(0, 1)) {
        malformed(QString("illegal duration '%1'").arg(text.trimmed()));
    }
    return duration;
}

double MxmlParser::readDecimal()
{
    const auto name = m_e.name().toString();
    const auto text = m_e.readElementText();
    bool ok;
    const auto result = text.trimmed().toDouble(&ok);
    if (!ok) {
        malformed(QString("illegal %1 '%2'").arg(name, text.trimmed()));
    }
    return result;
}

int MxmlParser::readInteger()
{
    const auto name = m_e.name().toString();
    const auto text = m_e.readElementText();
    bool ok;
    const auto result = text.trimmed().toInt(&ok);
    if (!ok) {
        malformed(QString("illegal %1 '%2'").arg(name, text.trimmed()));
    }
    return result;
}

// skip the current element if it is one of names, elements skipped
// this way are valid MusicXML but not used by the importer

bool MxmlParser::ignoredElement(std::initializer_list<const char*> names)
{
    for (const auto name : names) {
        if (m_e.name() == QLatin1String(name)) {
            m_logger->logDebugTrace(QString("ignoring '%1'").arg(name), &m_e);
            m_e.skipCurrentElement();
            return true;
        }
    }
    return false;
}

void MxmlParser::malformed(const QString& text) const
{
    throw MalformedInputError(m_path, m_e.lineNumber(), text);
}

void MxmlParser::unexpectedElement()
{
    const auto text = QString { "found unexpected element '%1'" }
            .arg(m_e.name().toString());
    m_logger->logError(text, &m_e);
    m_e.skipCurrentElement();
}

} // namespace MusicXML
} // namespace SheetMusic
