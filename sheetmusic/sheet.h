#ifndef SHEETMUSIC_SHEET_H
#define SHEETMUSIC_SHEET_H

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <QSizeF>
#include <QString>

#include "fraction.h"
#include "sheetelements.h"

namespace SheetMusic {

namespace MusicXML {
struct Measure;
struct ScorePartwise;
}

class Page;
class Sheet;

// height of a five line staff in tenths
const double STAFF_HEIGHT = 40.0;

const double DEFAULT_PAGE_HEIGHT = 1683.0;
const double DEFAULT_PAGE_WIDTH = 1190.0;
const double DEFAULT_PAGE_MARGIN = 70.0;
const double DEFAULT_STAFF_DISTANCE = 65.0;

//---------------------------------------------------------
//   Measure
//---------------------------------------------------------

/**
 One bar of the (single) part. Measures form a chain over the whole
 document through prev() and next().
 Divisions, clefs, staff count and staff spacing are inherited from
 the previous measure when the measure is added to a page.
 */

class Measure
{
public:
    explicit Measure(const MusicXML::Measure& node);
    Measure(const Measure&) = delete;
    Measure& operator=(const Measure&) = delete;

    QString number() const { return _number; }
    std::optional<double> width() const { return _width; }
    Page* page() const { return _page; }
    Measure* prev() const { return _prev; }
    Measure* next() const { return _next; }

    double x() const { return _x; }
    double y() const { return _y; }
    void setX(double x) { _x = x; }
    void setY(double y) { _y = y; }
    double height() const;
    int staves() const { return _staves; }
    double staffSpacing() const { return _staffSpacing; }
    void setStaffSpacing(double spacing) { _staffSpacing = spacing; }
    bool isNewSystem() const { return _newSystem; }
    void setNewSystem(bool val) { _newSystem = val; }
    void followPrevLayout();

    int timeDivisions() const { return _timeDivisions; }
    void setTimeDivisions(int divisions) { _timeDivisions = divisions; }
    Clef clef(int staff = 1) const;
    void setClef(const Clef& clef);

    Fraction currentTime() const { return _time; }
    int currentVoice() const { return _voice; }
    bool changeTime(const Fraction& delta);
    bool addNote(std::unique_ptr<Note> note, bool isChord);
    bool skipNote(const Fraction& duration);
    void addBeam(std::unique_ptr<Beam> beam);
    const std::vector<std::unique_ptr<Note>>& notes() const { return _notes; }
    const std::vector<std::unique_ptr<Beam>>& beams() const { return _beams; }

    void finish();
    bool isFinished() const { return _finished; }
    Fraction duration() const { return _duration; }
    QString toString() const;

private:
    friend class Page;
    void attach(Page* page, Measure* prev);
    bool startNote(const Fraction& duration);

    QString _number;
    std::optional<double> _width;
    Page* _page { nullptr };
    Measure* _prev { nullptr };
    Measure* _next { nullptr };
    double _x { 0.0 };
    double _y { 0.0 };
    std::optional<int> _declaredStaves;
    int _staves { 1 };
    double _staffSpacing { 0.0 };
    bool _newSystem { false };
    int _timeDivisions { 0 };
    std::map<int, Clef> _clefs;
    Fraction _time { 0, 1 };        // the time cursor
    Fraction _maxTime { 0, 1 };
    int _voice { 0 };
    bool _hasChordStart { false };  // start of the last non-chord note
    Fraction _chordTime { 0, 1 };
    int _chordVoice { 0 };
    std::vector<std::unique_ptr<Note>> _notes;
    std::vector<std::unique_ptr<Beam>> _beams;
    bool _finished { false };
    Fraction _duration { 0, 1 };
};

//---------------------------------------------------------
//   Page
//---------------------------------------------------------

class Page
{
public:
    Page(Sheet* sheet, int number, const QSizeF& size, const Margins& margins);
    Page(const Page&) = delete;
    Page& operator=(const Page&) = delete;

    Sheet* sheet() const { return _sheet; }
    int number() const { return _number; }
    QSizeF size() const { return _size; }
    Margins margins() const { return _margins; }
    Measure* addMeasure(std::unique_ptr<Measure> measure);
    const std::vector<std::unique_ptr<Measure>>& measures() const { return _measures; }
    int systemCount() const;

private:
    Sheet* const _sheet;
    const int _number;
    QSizeF _size;
    Margins _margins;
    std::vector<std::unique_ptr<Measure>> _measures;
};

//---------------------------------------------------------
//   Sheet
//---------------------------------------------------------

/**
 The imported score: pages holding the measures of the first part,
 positioned in tenths with the origin at the bottom left of the page.
 */

class Sheet
{
public:
    explicit Sheet(const MusicXML::ScorePartwise& score);
    Sheet(const Sheet&) = delete;
    Sheet& operator=(const Sheet&) = delete;

    QString title() const;
    QString composer() const { return _composer; }
    QString movementTitle() const { return _movementTitle; }
    QString workTitle() const { return _workTitle; }

    Page* newPage();
    const std::vector<std::unique_ptr<Page>>& pages() const { return _pages; }
    Measure* firstMeasure() const { return _firstMeasure; }
    Measure* lastMeasure() const { return _lastMeasure; }
    int measureCount() const;

    QSizeF pageSize() const { return _pageSize; }
    Margins pageMargins(int pageNumber) const;
    Margins defaultSystemMargins() const { return _defaultSystemMargins; }
    double defaultTopSystemDistance() const { return _defaultTopSystemDistance; }
    double defaultStaffDistance() const { return _defaultStaffDistance; }

    void finish();
    bool isFinished() const { return _finished; }

private:
    friend class Page;

    QString _composer;
    QString _movementTitle;
    QString _workTitle;
    QSizeF _pageSize { DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT };
    Margins _oddMargins { DEFAULT_PAGE_MARGIN, DEFAULT_PAGE_MARGIN, DEFAULT_PAGE_MARGIN, DEFAULT_PAGE_MARGIN };
    Margins _evenMargins { DEFAULT_PAGE_MARGIN, DEFAULT_PAGE_MARGIN, DEFAULT_PAGE_MARGIN, DEFAULT_PAGE_MARGIN };
    Margins _defaultSystemMargins;
    double _defaultTopSystemDistance { 0.0 };
    double _defaultStaffDistance { DEFAULT_STAFF_DISTANCE };
    std::vector<std::unique_ptr<Page>> _pages;
    Measure* _firstMeasure { nullptr };
    Measure* _lastMeasure { nullptr };
    bool _finished { false };
};

} // namespace SheetMusic

#endif // SHEETMUSIC_SHEET_H
