#ifndef SHEETMUSIC_MXMLDATA_H
#define SHEETMUSIC_MXMLDATA_H

#include <memory>
#include <optional>
#include <vector>

#include <QString>

#include "fraction.h"
#include "sheetelements.h"

namespace SheetMusic {
namespace MusicXML {

// the closed set of measure children kept in the tree
// everything else is dropped while reading
enum class ElementType {
    INVALID = 0,
    ATTRIBUTES,
    BACKUP,
    BARLINE,
    FORWARD,
    NOTE,
    PRINT,
};

struct Element {
    Element(const ElementType& p_elementType);
    virtual ~Element() {}
    ElementType elementType { ElementType::INVALID };
    qint64 lineNumber { 0 };
};

struct PageMargins {
    QString type { "both" };    // odd, even or both
    Margins margins;
};

struct PageLayout {
    std::optional<double> pageHeight;
    std::optional<double> pageWidth;
    std::vector<PageMargins> pageMargins;
};

struct SystemLayout {
    std::optional<Margins> systemMargins;   // left and right only
    std::optional<double> systemDistance;
    std::optional<double> topSystemDistance;
};

struct StaffLayout {
    int number { 1 };
    std::optional<double> staffDistance;
};

struct MeasureLayout {
    std::optional<double> measureDistance;
};

struct Defaults {
    std::optional<PageLayout> pageLayout;
    std::optional<SystemLayout> systemLayout;
    std::vector<StaffLayout> staffLayouts;
};

struct Attributes : public Element {
    Attributes();
    std::optional<int> divisions;
    std::optional<int> staves;
    std::vector<Clef> clefs;
};

struct Backup : public Element {
    Backup();
    Fraction duration { 0, 0 };     // in divisions, invalid until read
};

struct Barline : public Element {
    Barline();
    QString location { "right" };
};

struct Forward : public Element {
    Forward();
    Fraction duration { 0, 0 };     // in divisions, invalid until read
};

struct NoteBeam {
    int number { 1 };
    QString value;  // begin, continue, end, forward hook, backward hook
};

struct Note : public Element {
    Note();
    std::optional<Accidental> accidental;
    std::vector<NoteBeam> beams;
    bool chord { false };
    bool cue { false };
    std::optional<double> defaultX;     // unset when absent or unparsable
    std::optional<double> defaultY;
    unsigned int dots { 0 };
    Fraction duration { 0, 0 };         // in divisions, invalid until read
    bool grace { false };
    bool measureRest { false };
    std::optional<Pitch> pitch;
    bool rest { false };
    std::optional<Stem> stem;
    QString type;
    bool unpitched { false };
};

struct Print : public Element {
    Print();
    QString newPage;
    QString newSystem;
    bool pageLayoutRead { false };
    std::optional<double> staffSpacing;
    std::optional<SystemLayout> systemLayout;
    std::optional<MeasureLayout> measureLayout;
};

struct Measure {
    std::vector<std::unique_ptr<Element>> elements;
    qint64 lineNumber { 0 };
    QString number;
    std::optional<double> width;
    const Print* print() const;
    std::optional<int> staves() const;
};

struct Part {
    QString id;
    std::vector<Measure> measures;
};

struct ScorePartwise {
    QString composer;
    std::optional<Defaults> defaults;
    bool isFound { false };
    QString movementTitle;
    std::vector<Part> parts;
    QString version { "1.0" };
    QString workTitle;
};

struct MxmlData {
    ScorePartwise scorePartwise;
};

bool isYes(const QString& value);

} // namespace MusicXML
} // namespace SheetMusic

#endif // SHEETMUSIC_MXMLDATA_H
