#ifndef SHEETMUSIC_FRACTION_H
#define SHEETMUSIC_FRACTION_H

#include <QString>
#include <QtGlobal>

namespace SheetMusic {

//---------------------------------------------------------
//   Fraction
//---------------------------------------------------------

/**
 Exact rational number used for all time accounting (durations, time cursor).
 A fraction with denominator 0 is invalid. Results of arithmetic are always
 reduced and carry a positive denominator. Arithmetic on an invalid fraction,
 or arithmetic that overflows qint64, yields an invalid fraction.
 */

class Fraction
{
public:
    Fraction() = default;
    Fraction(qint64 z, qint64 n = 1);

    qint64 numerator() const { return _numerator; }
    qint64 denominator() const { return _denominator; }
    bool isValid() const { return _denominator != 0; }
    bool isZero() const { return _numerator == 0; }
    bool isNegative() const { return _numerator < 0; }
    void set(qint64 z, qint64 n);
    Fraction reduced() const;
    Fraction absValue() const { return Fraction(qAbs(_numerator), _denominator); }
    QString toString() const;

    static Fraction fromString(const QString& text, bool* ok = nullptr);

    Fraction& operator+=(const Fraction& val);
    Fraction& operator-=(const Fraction& val);
    Fraction& operator*=(const Fraction& val);
    Fraction& operator/=(const Fraction& val);
    Fraction& operator/=(qint64 val);

    Fraction operator+(const Fraction& v) const { return Fraction(*this) += v; }
    Fraction operator-(const Fraction& v) const { return Fraction(*this) -= v; }
    Fraction operator-() const;
    Fraction operator*(const Fraction& v) const { return Fraction(*this) *= v; }
    Fraction operator/(const Fraction& v) const { return Fraction(*this) /= v; }
    Fraction operator/(qint64 v) const { return Fraction(*this) /= v; }

    bool operator==(const Fraction& v) const;
    bool operator!=(const Fraction& v) const { return !(*this == v); }
    bool operator<(const Fraction& v) const;
    bool operator<=(const Fraction& v) const { return !(v < *this); }
    bool operator>(const Fraction& v) const { return v < *this; }
    bool operator>=(const Fraction& v) const { return !(*this < v); }

private:
    void reduce();
    void invalidate();

    qint64 _numerator { 0 };
    qint64 _denominator { 1 };
};

} // namespace SheetMusic

#endif // SHEETMUSIC_FRACTION_H
