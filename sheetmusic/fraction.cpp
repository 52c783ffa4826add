/****************************************************************************
**
** fraction.cpp -- implementation of class Fraction
**
****************************************************************************/

#include <limits>
#include <numeric>

#include "fraction.h"

namespace SheetMusic {

// qint64 arithmetic reporting overflow instead of wrapping

static bool multiply(qint64 a, qint64 b, qint64* result)
{
    return !__builtin_mul_overflow(a, b, result);
}

static bool add(qint64 a, qint64 b, qint64* result)
{
    return !__builtin_add_overflow(a, b, result);
}

Fraction::Fraction(qint64 z, qint64 n)
    : _numerator(z), _denominator(n)
{
    reduce();
}

void Fraction::set(qint64 z, qint64 n)
{
    _numerator = z;
    _denominator = n;
    reduce();
}

// normalize sign into the numerator and divide out the gcd
// invalid fractions (denominator 0) are left untouched
// the smallest qint64 cannot be negated, such a fraction becomes invalid

void Fraction::reduce()
{
    if (_denominator == 0) {
        return;
    }
    const auto min = std::numeric_limits<qint64>::min();
    if (_numerator == min || _denominator == min) {
        invalidate();
        return;
    }
    if (_denominator < 0) {
        _numerator = -_numerator;
        _denominator = -_denominator;
    }
    const auto g = std::gcd(_numerator, _denominator);
    if (g > 1) {
        _numerator /= g;
        _denominator /= g;
    }
}

void Fraction::invalidate()
{
    _numerator = 0;
    _denominator = 0;
}

Fraction Fraction::reduced() const
{
    Fraction f(*this);
    f.reduce();
    return f;
}

QString Fraction::toString() const
{
    return QString("%1/%2").arg(_numerator).arg(_denominator);
}

// parse "n", "n/d" or a decimal "n.ddd" exactly
// on failure an invalid fraction is returned and *ok is set to false

Fraction Fraction::fromString(const QString& text, bool* ok)
{
    if (ok) {
        *ok = false;
    }
    const auto s = text.trimmed();
    if (s.isEmpty()) {
        return Fraction(0, 0);
    }

    const auto slash = s.indexOf('/');
    if (slash >= 0) {
        bool zOk = false;
        bool nOk = false;
        const auto z = s.left(slash).trimmed().toLongLong(&zOk);
        const auto n = s.mid(slash + 1).trimmed().toLongLong(&nOk);
        const Fraction result(z, n);
        if (!zOk || !nOk || !result.isValid()) {
            return Fraction(0, 0);
        }
        if (ok) {
            *ok = true;
        }
        return result;
    }

    auto digits = s;
    bool negative = false;
    if (digits.startsWith('-') || digits.startsWith('+')) {
        negative = digits.startsWith('-');
        digits.remove(0, 1);
    }
    const auto dot = digits.indexOf('.');
    QString intPart = dot >= 0 ? digits.left(dot) : digits;
    QString fracPart = dot >= 0 ? digits.mid(dot + 1) : QString();
    if (intPart.isEmpty() && fracPart.isEmpty()) {
        return Fraction(0, 0);
    }
    // qint64 holds 18 decimal digits safely
    if (intPart.size() + fracPart.size() > 18) {
        return Fraction(0, 0);
    }
    for (const auto c : intPart + fracPart) {
        if (!c.isDigit()) {
            return Fraction(0, 0);
        }
    }

    qint64 denominator = 1;
    for (int i = 0; i < fracPart.size(); ++i) {
        denominator *= 10;
    }
    const auto numerator = (intPart + fracPart).isEmpty() ? 0 : (intPart + fracPart).toLongLong();
    if (ok) {
        *ok = true;
    }
    return Fraction(negative ? -numerator : numerator, denominator);
}

// an overflowing result invalidates the fraction

Fraction& Fraction::operator+=(const Fraction& val)
{
    if (!isValid() || !val.isValid()) {
        invalidate();
        return *this;
    }
    const auto g = std::gcd(_denominator, val._denominator);
    qint64 denominator = 0;
    qint64 z1 = 0;
    qint64 z2 = 0;
    qint64 numerator = 0;
    if (!multiply(_denominator / g, val._denominator, &denominator)
        || !multiply(_numerator, val._denominator / g, &z1)
        || !multiply(val._numerator, _denominator / g, &z2)
        || !add(z1, z2, &numerator)) {
        invalidate();
        return *this;
    }
    _numerator = numerator;
    _denominator = denominator;
    reduce();
    return *this;
}

Fraction& Fraction::operator-=(const Fraction& val)
{
    return *this += -val;
}

Fraction Fraction::operator-() const
{
    if (!isValid()) {
        return Fraction(0, 0);
    }
    return Fraction(-_numerator, _denominator);
}

Fraction& Fraction::operator*=(const Fraction& val)
{
    if (!isValid() || !val.isValid()) {
        invalidate();
        return *this;
    }
    // cross-reduce first to keep the intermediate products small
    const auto g1 = std::gcd(_numerator, val._denominator);
    const auto g2 = std::gcd(val._numerator, _denominator);
    const auto z1 = g1 ? _numerator / g1 : _numerator;
    const auto n2 = g1 ? val._denominator / g1 : val._denominator;
    const auto z2 = g2 ? val._numerator / g2 : val._numerator;
    const auto n1 = g2 ? _denominator / g2 : _denominator;
    qint64 numerator = 0;
    qint64 denominator = 0;
    if (!multiply(z1, z2, &numerator) || !multiply(n1, n2, &denominator)) {
        invalidate();
        return *this;
    }
    _numerator = numerator;
    _denominator = denominator;
    reduce();
    return *this;
}

Fraction& Fraction::operator/=(const Fraction& val)
{
    if (!val.isValid() || val._numerator == 0) {
        invalidate();
        return *this;
    }
    return *this *= Fraction(val._denominator, val._numerator);
}

Fraction& Fraction::operator/=(qint64 val)
{
    return *this /= Fraction(val, 1);
}

bool Fraction::operator==(const Fraction& v) const
{
    return _numerator == v._numerator && _denominator == v._denominator;
}

bool Fraction::operator<(const Fraction& v) const
{
    // the cross products may exceed qint64
    return static_cast<__int128>(_numerator) * v._denominator < static_cast<__int128>(v._numerator) * _denominator;
}

} // namespace SheetMusic
