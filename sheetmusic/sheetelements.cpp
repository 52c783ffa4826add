/****************************************************************************
**
** sheetelements.cpp -- implementation of the note and value classes
**
****************************************************************************/

#include "sheetelements.h"

namespace SheetMusic {

QString Pitch::toString() const
{
    QString result { QChar(step) };
    if (alter > 0.0) {
        result += QString(qRound(alter), '#');
    }
    else if (alter < 0.0) {
        result += QString(qRound(-alter), 'b');
    }
    return result + QString::number(octave);
}

std::optional<StemDirection> Stem::directionFromString(const QString& value)
{
    if (value == "up") {
        return StemDirection::UP;
    }
    else if (value == "down") {
        return StemDirection::DOWN;
    }
    else if (value == "double") {
        return StemDirection::DOUBLE;
    }
    else if (value == "none") {
        return StemDirection::NONE;
    }
    return {};
}

QString Clef::toString() const
{
    auto result = QString("%1%2").arg(sign).arg(line);
    if (octaveChange) {
        result += QString("%1%2").arg(octaveChange > 0 ? "+" : "").arg(octaveChange);
    }
    return result;
}

Note::Note(const std::optional<QPointF>& pos, const Fraction& duration, int dots, const QString& type)
    : _pos(pos), _duration(duration), _dots(dots), _type(type)
{
    // nothing
}

QString Note::toString() const
{
    auto result = QString("time %1 duration %2").arg(_time.toString()).arg(_duration.toString());
    if (!_type.isEmpty()) {
        result += QString(" type %1").arg(_type);
    }
    if (_dots) {
        result += QString(" dots %1").arg(_dots);
    }
    if (_voice) {
        result += QString(" voice %1").arg(_voice);
    }
    return result;
}

PitchedNote::PitchedNote(const std::optional<QPointF>& pos, const Fraction& duration, int dots, const QString& type,
                         const Pitch& pitch, std::unique_ptr<Stem> stem, const std::optional<Accidental>& accidental)
    : Note(pos, duration, dots, type), _pitch(pitch), _stem(std::move(stem)), _accidental(accidental)
{
    // nothing
}

QString PitchedNote::toString() const
{
    auto result = "note " + _pitch.toString() + " " + Note::toString();
    if (_accidental) {
        result += " accidental " + _accidental->value;
    }
    return result;
}

Rest::Rest(const std::optional<QPointF>& pos, const Fraction& duration, int dots, const QString& type,
           bool measureRest)
    : Note(pos, duration, dots, type), _measureRest(measureRest)
{
    // nothing
}

QString Rest::toString() const
{
    return QString(_measureRest ? "measure rest " : "rest ") + Note::toString();
}

} // namespace SheetMusic
