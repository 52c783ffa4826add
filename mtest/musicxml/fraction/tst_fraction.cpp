/****************************************************************************
**
** tst_fraction.cpp -- tests for class Fraction
**
****************************************************************************/

#include <limits>

#include <QtTest/QtTest>

#include "fraction.h"

using namespace SheetMusic;

//---------------------------------------------------------
//   TestFraction
//---------------------------------------------------------

class TestFraction : public QObject
{
    Q_OBJECT

private slots:
    void reduce();
    void arithmetic();
    void compare();
    void invalid();
    void overflow();
    void compareLarge();
    void fromString_data();
    void fromString();
    void fromStringFails_data();
    void fromStringFails();
    void noteDurations();
    void cursorRoundTrip();
};

void TestFraction::reduce()
{
    const Fraction f(6, 8);
    QCOMPARE(f.numerator(), qint64(3));
    QCOMPARE(f.denominator(), qint64(4));
    const Fraction g(3, -9);
    QCOMPARE(g.numerator(), qint64(-1));
    QCOMPARE(g.denominator(), qint64(3));
    QCOMPARE(Fraction().toString(), QString("0/1"));
    QVERIFY(Fraction().isZero());
}

void TestFraction::arithmetic()
{
    QCOMPARE(Fraction(1, 4) + Fraction(1, 8), Fraction(3, 8));
    QCOMPARE(Fraction(1, 4) - Fraction(1, 2), Fraction(-1, 4));
    QCOMPARE(Fraction(2, 3) * Fraction(3, 4), Fraction(1, 2));
    QCOMPARE(Fraction(1, 2) / Fraction(1, 4), Fraction(2));
    QCOMPARE(Fraction(3) / 4, Fraction(3, 4));
    QCOMPARE(-Fraction(1, 8), Fraction(-1, 8));
    Fraction f(1, 3);
    f += Fraction(1, 6);
    QCOMPARE(f, Fraction(1, 2));
    f -= Fraction(1, 2);
    QVERIFY(f.isZero());
    QCOMPARE(f.denominator(), qint64(1));
}

void TestFraction::compare()
{
    QVERIFY(Fraction(1, 3) < Fraction(1, 2));
    QVERIFY(Fraction(-1, 2) < Fraction(0));
    QVERIFY(Fraction(2, 4) == Fraction(1, 2));
    QVERIFY(Fraction(3, 8) >= Fraction(3, 8));
    QVERIFY(Fraction(5, 8) > Fraction(1, 2));
    QVERIFY(Fraction(-1, 16).isNegative());
    QCOMPARE(Fraction(-3, 4).absValue(), Fraction(3, 4));
}

void TestFraction::invalid()
{
    const Fraction bad(1, 0);
    QVERIFY(!bad.isValid());
    QVERIFY(!(bad + Fraction(1, 4)).isValid());
    QVERIFY(!(Fraction(1, 4) * bad).isValid());
    QVERIFY(!(Fraction(1, 4) / Fraction(0)).isValid());
    QVERIFY(!(Fraction(1, 4) / 0).isValid());
}

// results that do not fit into qint64 are invalid, never wrapped

void TestFraction::overflow()
{
    const auto max = std::numeric_limits<qint64>::max();
    QVERIFY(!(Fraction(max) + Fraction(1)).isValid());
    QVERIFY(!(Fraction(-max) - Fraction(2)).isValid());
    QVERIFY(!(Fraction(max) * Fraction(2)).isValid());
    QVERIFY(!(Fraction(1, 100000000000000000LL) / 100).isValid());
    QVERIFY(!(Fraction(1, 100000000000000000LL) / 100 / 4).isValid());
    // coprime denominators whose product exceeds qint64
    QVERIFY(!(Fraction(1, 4294967291LL) + Fraction(1, 4294967279LL)).isValid());
    QVERIFY(!(Fraction(1, 4294967291LL) * Fraction(1, 4294967279LL)).isValid());
    QVERIFY(!(-Fraction(1, 0)).isValid());
    QVERIFY(!Fraction(std::numeric_limits<qint64>::min(), 1).isValid());
    // an overflow is not cured by later arithmetic
    QVERIFY(!((Fraction(max) + Fraction(1)) - Fraction(1)).isValid());
    // large values that still fit
    QCOMPARE(Fraction(max - 1) + Fraction(1), Fraction(max));
    QCOMPARE(Fraction(1, 100000000000000000LL) / 10, Fraction(1, 1000000000000000000LL));
}

void TestFraction::compareLarge()
{
    // the cross products exceed qint64
    const Fraction a(4294967290LL, 4294967291LL);
    const Fraction b(4294967278LL, 4294967279LL);
    QVERIFY(b < a);
    QVERIFY(!(a < b));
    QVERIFY(a > b);
}

void TestFraction::fromString_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<qint64>("numerator");
    QTest::addColumn<qint64>("denominator");

    QTest::newRow("integer") << "12" << qint64(12) << qint64(1);
    QTest::newRow("spaces") << " 4 " << qint64(4) << qint64(1);
    QTest::newRow("ratio") << "6/8" << qint64(3) << qint64(4);
    QTest::newRow("decimal") << "1.5" << qint64(3) << qint64(2);
    QTest::newRow("small decimal") << "0.25" << qint64(1) << qint64(4);
    QTest::newRow("leading dot") << ".5" << qint64(1) << qint64(2);
    QTest::newRow("trailing dot") << "3." << qint64(3) << qint64(1);
    QTest::newRow("negative") << "-0.125" << qint64(-1) << qint64(8);
}

void TestFraction::fromString()
{
    QFETCH(QString, text);
    QFETCH(qint64, numerator);
    QFETCH(qint64, denominator);

    bool ok = false;
    const auto f = Fraction::fromString(text, &ok);
    QVERIFY(ok);
    QCOMPARE(f.numerator(), numerator);
    QCOMPARE(f.denominator(), denominator);
}

void TestFraction::fromStringFails_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("empty") << "";
    QTest::newRow("dot") << ".";
    QTest::newRow("letters") << "four";
    QTest::newRow("exponent") << "1e3";
    QTest::newRow("zero denominator") << "1/0";
    QTest::newRow("two dots") << "1.2.3";
    QTest::newRow("too long") << "1234567890.1234567890";
    QTest::newRow("smallest integer") << "-9223372036854775808/1";
}

void TestFraction::fromStringFails()
{
    QFETCH(QString, text);

    bool ok = true;
    const auto f = Fraction::fromString(text, &ok);
    QVERIFY(!ok);
    QVERIFY(!f.isValid());
}

// duration / divisions / 4 gives the fraction of a whole note

void TestFraction::noteDurations()
{
    QCOMPARE(Fraction(4) / 4 / 4, Fraction(1, 4));
    QCOMPARE(Fraction(12) / 8 / 4, Fraction(3, 8));
    QCOMPARE(Fraction::fromString("0.5") / 2 / 4, Fraction(1, 16));
    QCOMPARE(Fraction(1) / 3 / 4, Fraction(1, 12));
}

void TestFraction::cursorRoundTrip()
{
    const Fraction start(5, 12);
    for (const auto& d : { Fraction(1, 3), Fraction(7, 16), Fraction(1, 1000) }) {
        QCOMPARE(start + d + -d, start);
    }
    Fraction third;
    for (int i = 0; i < 3; ++i) {
        third += Fraction(1, 3);
    }
    QCOMPARE(third, Fraction(1));
}

QTEST_GUILESS_MAIN(TestFraction)

#include "tst_fraction.moc"
