#ifndef SHEETMUSIC_SHEETELEMENTS_H
#define SHEETMUSIC_SHEETELEMENTS_H

#include <memory>
#include <optional>
#include <vector>

#include <QPointF>
#include <QString>

#include "fraction.h"

namespace SheetMusic {

struct Margins {
    double left { 0.0 };
    double right { 0.0 };
    double top { 0.0 };
    double bottom { 0.0 };
};

struct Pitch {
    char step { 'C' };
    double alter { 0.0 };   // semitones, may be microtonal
    int octave { 4 };
    QString toString() const;
};

enum class StemDirection : char {
    NONE, UP, DOWN, DOUBLE
};

struct Stem {
    StemDirection direction { StemDirection::UP };
    std::optional<double> defaultY;
    static std::optional<StemDirection> directionFromString(const QString& value);
};

struct Accidental {
    QString value;      // e.g. "sharp", "flat", "natural"
    bool cautionary { false };
    bool editorial { false };
    bool parentheses { false };
};

struct Clef {
    int number { 1 };   // staff, 1-based
    QString sign { "G" };
    int line { 2 };
    int octaveChange { 0 };
    QString toString() const;
};

//---------------------------------------------------------
//   Beam
//---------------------------------------------------------

/**
 A beam groups the stems of consecutive notes. The stems are owned
 by their notes, the beam only refers to them in document order.
 */

class Beam
{
public:
    explicit Beam(int number = 1) : _number(number) {}
    int number() const { return _number; }
    const std::vector<const Stem*>& stems() const { return _stems; }
    void addStem(const Stem* stem) { _stems.push_back(stem); }

private:
    int _number;
    std::vector<const Stem*> _stems;
};

//---------------------------------------------------------
//   Note
//---------------------------------------------------------

/**
 Shared part of pitched notes and rests: position hint, duration
 (fraction of a whole note), number of dots and glyph type.
 Start time and voice layer are assigned when the note is added
 to a measure.
 */

class Note
{
public:
    Note(const std::optional<QPointF>& pos, const Fraction& duration, int dots, const QString& type);
    virtual ~Note() {}
    virtual bool isRest() const = 0;
    const std::optional<QPointF>& pos() const { return _pos; }
    Fraction duration() const { return _duration; }
    int dots() const { return _dots; }
    QString type() const { return _type; }
    Fraction time() const { return _time; }
    void setTime(const Fraction& time) { _time = time; }
    int voice() const { return _voice; }
    void setVoice(int voice) { _voice = voice; }
    virtual QString toString() const;

private:
    std::optional<QPointF> _pos;
    Fraction _duration;
    int _dots { 0 };
    QString _type;
    Fraction _time;
    int _voice { 0 };
};

class PitchedNote : public Note
{
public:
    PitchedNote(const std::optional<QPointF>& pos, const Fraction& duration, int dots, const QString& type,
                const Pitch& pitch, std::unique_ptr<Stem> stem, const std::optional<Accidental>& accidental);
    bool isRest() const override { return false; }
    const Pitch& pitch() const { return _pitch; }
    const Stem* stem() const { return _stem.get(); }
    const std::optional<Accidental>& accidental() const { return _accidental; }
    QString toString() const override;

private:
    Pitch _pitch;
    std::unique_ptr<Stem> _stem;
    std::optional<Accidental> _accidental;
};

class Rest : public Note
{
public:
    Rest(const std::optional<QPointF>& pos, const Fraction& duration, int dots, const QString& type,
         bool measureRest = false);
    bool isRest() const override { return true; }
    bool isMeasureRest() const { return _measureRest; }
    QString toString() const override;

private:
    bool _measureRest { false };
};

} // namespace SheetMusic

#endif // SHEETMUSIC_SHEETELEMENTS_H
