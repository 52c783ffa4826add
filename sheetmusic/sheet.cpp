/****************************************************************************
**
** sheet.cpp -- implementation of classes Sheet, Page and Measure
**
****************************************************************************/

#include <algorithm>

#include "mxmldata.h"
#include "sheet.h"

namespace SheetMusic {

//---------------------------------------------------------
//   Measure
//---------------------------------------------------------

Measure::Measure(const MusicXML::Measure& node)
    : _number(node.number), _width(node.width), _declaredStaves(node.staves())
{
    // nothing
}

//---------------------------------------------------------
//   attach
//---------------------------------------------------------

/**
 Link the measure into the document-wide chain after prev and
 take over the settings that persist from measure to measure.
 */

void Measure::attach(Page* page, Measure* prev)
{
    _page = page;
    _prev = prev;
    if (prev) {
        prev->_next = this;
        _timeDivisions = prev->_timeDivisions;
        _clefs = prev->_clefs;
        _staves = prev->_staves;
        _staffSpacing = prev->_staffSpacing;
    }
    else {
        _staffSpacing = page->sheet()->defaultStaffDistance();
    }
    if (_declaredStaves) {
        _staves = *_declaredStaves;
    }
}

double Measure::height() const
{
    return _staves * STAFF_HEIGHT + (_staves - 1) * _staffSpacing;
}

//---------------------------------------------------------
//   followPrevLayout
//---------------------------------------------------------

/**
 Continue on the line of the previous measure.
 The first measure of the document has no predecessor: it starts
 the first system, placed from the page margins and the document's
 default system layout.
 */

void Measure::followPrevLayout()
{
    if (_prev) {
        _x = _prev->_x;
        _y = _prev->_y;
        return;
    }
    _newSystem = true;
    if (!_page) {
        return;
    }
    const auto sheet = _page->sheet();
    const auto margins = _page->margins();
    _x = sheet->defaultSystemMargins().left + margins.left;
    _y = _page->size().height() - margins.top - sheet->defaultTopSystemDistance() - height();
}

Clef Measure::clef(int staff) const
{
    const auto it = _clefs.find(staff);
    if (it == _clefs.end()) {
        Clef clef;
        clef.number = staff;
        return clef;
    }
    return it->second;
}

void Measure::setClef(const Clef& clef)
{
    _clefs[clef.number] = clef;
}

//---------------------------------------------------------
//   changeTime
//---------------------------------------------------------

/**
 Move the time cursor by delta (negative for a backup).
 A backup opens the next voice layer. Moving before the start
 of the measure is refused and leaves the cursor unchanged.
 */

bool Measure::changeTime(const Fraction& delta)
{
    const auto time = _time + delta;
    if (!time.isValid() || time.isNegative()) {
        return false;
    }
    if (delta.isNegative()) {
        ++_voice;
    }
    _time = time;
    if (_time > _maxTime) {
        _maxTime = _time;
    }
    return true;
}

//---------------------------------------------------------
//   addNote
//---------------------------------------------------------

/**
 Add a note at the time cursor and advance the cursor.
 A chord note sounds together with the last note that was not
 a chord note, stored or not, and leaves the cursor alone.
 Returns false (and drops the note) if the cursor would overflow.
 */

bool Measure::addNote(std::unique_ptr<Note> note, bool isChord)
{
    if (isChord && _hasChordStart) {
        note->setTime(_chordTime);
        note->setVoice(_chordVoice);
    }
    else {
        if (!startNote(note->duration())) {
            return false;
        }
        note->setTime(_chordTime);
        note->setVoice(_chordVoice);
    }
    _notes.push_back(std::move(note));
    return true;
}

// a note that is not stored but takes its time

bool Measure::skipNote(const Fraction& duration)
{
    return startNote(duration);
}

bool Measure::startNote(const Fraction& duration)
{
    const auto time = _time + duration;
    if (!time.isValid()) {
        return false;
    }
    _chordTime = _time;
    _chordVoice = _voice;
    _hasChordStart = true;
    _time = time;
    if (_time > _maxTime) {
        _maxTime = _time;
    }
    return true;
}

void Measure::addBeam(std::unique_ptr<Beam> beam)
{
    _beams.push_back(std::move(beam));
}

void Measure::finish()
{
    _duration = _maxTime;
    _finished = true;
}

QString Measure::toString() const
{
    auto result = QString("measure %1 page %2 x %3 y %4%5")
                  .arg(_number)
                  .arg(_page ? _page->number() : 0)
                  .arg(_x)
                  .arg(_y)
                  .arg(_newSystem ? " new-system" : "");
    for (int staff = 1; staff <= _staves; ++staff) {
        result += " clef " + clef(staff).toString();
    }
    result += QString(" notes %1 beams %2 duration %3")
              .arg(_notes.size())
              .arg(_beams.size())
              .arg(_duration.toString());
    return result;
}

//---------------------------------------------------------
//   Page
//---------------------------------------------------------

Page::Page(Sheet* sheet, int number, const QSizeF& size, const Margins& margins)
    : _sheet(sheet), _number(number), _size(size), _margins(margins)
{
    // nothing
}

Measure* Page::addMeasure(std::unique_ptr<Measure> measure)
{
    const auto raw = measure.get();
    raw->attach(this, _sheet->_lastMeasure);
    if (!_sheet->_firstMeasure) {
        _sheet->_firstMeasure = raw;
    }
    _sheet->_lastMeasure = raw;
    _measures.push_back(std::move(measure));
    return raw;
}

int Page::systemCount() const
{
    return static_cast<int>(std::count_if(_measures.begin(), _measures.end(),
                                          [](const std::unique_ptr<Measure>& m) { return m->isNewSystem(); }));
}

//---------------------------------------------------------
//   Sheet
//---------------------------------------------------------

Sheet::Sheet(const MusicXML::ScorePartwise& score)
    : _composer(score.composer), _movementTitle(score.movementTitle), _workTitle(score.workTitle)
{
    if (!score.defaults) {
        return;
    }
    const auto& defaults = *score.defaults;
    if (defaults.pageLayout) {
        const auto& pageLayout = *defaults.pageLayout;
        if (pageLayout.pageHeight) {
            _pageSize.setHeight(*pageLayout.pageHeight);
        }
        if (pageLayout.pageWidth) {
            _pageSize.setWidth(*pageLayout.pageWidth);
        }
        for (const auto& pageMargins : pageLayout.pageMargins) {
            if (pageMargins.type == "odd" || pageMargins.type == "both") {
                _oddMargins = pageMargins.margins;
            }
            if (pageMargins.type == "even" || pageMargins.type == "both") {
                _evenMargins = pageMargins.margins;
            }
        }
    }
    if (defaults.systemLayout) {
        if (defaults.systemLayout->systemMargins) {
            _defaultSystemMargins = *defaults.systemLayout->systemMargins;
        }
        if (defaults.systemLayout->topSystemDistance) {
            _defaultTopSystemDistance = *defaults.systemLayout->topSystemDistance;
        }
    }
    for (const auto& staffLayout : defaults.staffLayouts) {
        if (staffLayout.staffDistance) {
            _defaultStaffDistance = *staffLayout.staffDistance;
        }
    }
}

QString Sheet::title() const
{
    return _workTitle.isEmpty() ? _movementTitle : _workTitle;
}

Margins Sheet::pageMargins(int pageNumber) const
{
    return pageNumber % 2 ? _oddMargins : _evenMargins;
}

//---------------------------------------------------------
//   newPage
//---------------------------------------------------------

/**
 Open the next page. A page that did not receive any measure
 yet is reused instead of leaving an empty page behind.
 */

Page* Sheet::newPage()
{
    if (!_pages.empty() && _pages.back()->measures().empty()) {
        return _pages.back().get();
    }
    const auto number = static_cast<int>(_pages.size()) + 1;
    _pages.push_back(std::make_unique<Page>(this, number, _pageSize, pageMargins(number)));
    return _pages.back().get();
}

int Sheet::measureCount() const
{
    int count = 0;
    for (const auto& page : _pages) {
        count += static_cast<int>(page->measures().size());
    }
    return count;
}

void Sheet::finish()
{
    for (const auto& page : _pages) {
        for (const auto& measure : page->measures()) {
            if (!measure->isFinished()) {
                measure->finish();
            }
        }
    }
    _finished = true;
}

} // namespace SheetMusic
