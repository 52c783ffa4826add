/****************************************************************************
**
** tst_musicxmlparser.cpp -- tests for the MusicXML import
**
****************************************************************************/

#include <QtTest/QtTest>

#include <private/qzipwriter_p.h>

#include "importerrors.h"
#include "musicxmlparser.h"
#include "sheet.h"
#include "testutils.h"

#define DIR QString("musicxml/parser/")

using namespace SheetMusic;

static const QByteArray DIVISIONS { "<attributes><divisions>4</divisions></attributes>\n" };

static const PitchedNote* pitched(const Note* note)
{
    return note->isRest() ? nullptr : static_cast<const PitchedNote*>(note);
}

//---------------------------------------------------------
//   TestMusicXMLParser
//---------------------------------------------------------

class TestMusicXMLParser : public QObject, public MTest
{
    Q_OBJECT

    std::unique_ptr<Sheet> readMeasures(const QByteArray& measures, bool validate = true);
    void malformed(const QByteArray& measures, const QString& text, bool validate = true);

private slots:
    void initTestCase();
    void metadata();
    void firstPartOnly();
    void voices();
    void noteFields();
    void chord();
    void graceAndCueSkipped();
    void divisionsChange();
    void unpitched();
    void measureRest();
    void clefsInherited();
    void decimalDuration();
    void forwardAndBackup();
    void descriptions();
    void container();
    void parserReused();
    void durationBeforeDivisions();
    void backupBeyondMeasureStart();
    void noteWithoutDuration();
    void durationOutOfRange();
    void cursorOutOfRange();
    void chordAfterUnpitched();
    void illegalDivisions_data();
    void illegalDivisions();
    void noPart();
    void notPartwise();
    void missingFile();
};

void TestMusicXMLParser::initTestCase()
{
    initMTest();
}

std::unique_ptr<Sheet> TestMusicXMLParser::readMeasures(const QByteArray& measures, bool validate)
{
    return readSheet(writeFile("parser.xml", scoreXml(measures)), validate);
}

void TestMusicXMLParser::malformed(const QByteArray& measures, const QString& text, bool validate)
{
    try {
        readMeasures(measures, validate);
        QFAIL("no MalformedInputError thrown");
    }
    catch (const MalformedInputError& e) {
        QVERIFY2(e.message().contains(text), qPrintable(e.message()));
    }
}

void TestMusicXMLParser::metadata()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    QCOMPARE(sheet->title(), QString("Voices"));
    QCOMPARE(sheet->workTitle(), QString("Voices"));
    QVERIFY(sheet->movementTitle().isEmpty());
    QCOMPARE(sheet->composer(), QString("J. Doe"));
    QCOMPARE(sheet->measureCount(), 3);
    QCOMPARE(sheet->pages().size(), size_t(1));
}

// the second part would fault on its beam if it was read

void TestMusicXMLParser::firstPartOnly()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    QCOMPARE(sheet->lastMeasure()->number(), QString("3"));
    QVERIFY(!sheet->lastMeasure()->next());
}

void TestMusicXMLParser::voices()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto m1 = sheet->firstMeasure();
    const auto& notes = m1->notes();
    QCOMPARE(notes.size(), size_t(5));

    const Fraction times[] = { Fraction(0), Fraction(1, 4), Fraction(1, 2), Fraction(0), Fraction(0) };
    const int voices[] = { 0, 0, 0, 1, 1 };
    for (size_t i = 0; i < notes.size(); ++i) {
        QCOMPARE(notes[i]->time(), times[i]);
        QCOMPARE(notes[i]->voice(), voices[i]);
    }
    QCOMPARE(notes[2]->duration(), Fraction(1, 2));
    QCOMPARE(m1->currentTime(), Fraction(1));
    QCOMPARE(m1->currentVoice(), 1);
    QCOMPARE(m1->duration(), Fraction(1));
    QCOMPARE(m1->timeDivisions(), 4);
}

void TestMusicXMLParser::noteFields()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto& notes = sheet->firstMeasure()->notes();

    const auto c = pitched(notes[0].get());
    QVERIFY(c);
    QVERIFY(c->pos());
    QCOMPARE(*c->pos(), QPointF(10, -20));
    QCOMPARE(c->duration(), Fraction(1, 4));
    QCOMPARE(c->type(), QString("quarter"));
    QCOMPARE(c->dots(), 0);
    QCOMPARE(c->pitch().step, 'C');
    QCOMPARE(c->pitch().alter, 1.0);
    QCOMPARE(c->pitch().octave, 5);
    QVERIFY(c->accidental());
    QCOMPARE(c->accidental()->value, QString("sharp"));
    QVERIFY(c->accidental()->cautionary);
    QVERIFY(!c->accidental()->parentheses);
    QVERIFY(c->stem());
    QVERIFY(c->stem()->direction == StemDirection::UP);
    QCOMPARE(*c->stem()->defaultY, 5.0);

    // default-x without default-y gives no position
    const auto d = pitched(notes[1].get());
    QVERIFY(d);
    QVERIFY(!d->pos());
    QVERIFY(!d->accidental());

    const auto g = pitched(notes[3].get());
    QVERIFY(g->stem()->direction == StemDirection::DOWN);
    QVERIFY(!g->stem()->defaultY);
}

void TestMusicXMLParser::chord()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto& notes = sheet->firstMeasure()->notes();
    const auto b = pitched(notes[4].get());
    QVERIFY(b);
    QCOMPARE(b->pitch().step, 'B');
    QCOMPARE(b->time(), notes[3]->time());
    QCOMPARE(b->voice(), notes[3]->voice());
    QVERIFY(!b->stem());
}

void TestMusicXMLParser::graceAndCueSkipped()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    for (const auto& note : sheet->firstMeasure()->notes()) {
        const auto p = pitched(note.get());
        QVERIFY(p);
        QVERIFY(!(p->pitch().step == 'A' && p->pitch().octave == 4));
        QVERIFY(!(p->pitch().step == 'B' && p->type() == "eighth"));
    }
}

void TestMusicXMLParser::divisionsChange()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto m2 = sheet->firstMeasure()->next();
    QCOMPARE(m2->timeDivisions(), 8);
    const auto& notes = m2->notes();
    QCOMPARE(notes.size(), size_t(2));
    QCOMPARE(notes[0]->duration(), Fraction(3, 8));
    QCOMPARE(notes[0]->dots(), 1);
    QVERIFY(notes[1]->isRest());
    QCOMPARE(notes[1]->duration(), Fraction(1, 2));
    QCOMPARE(m2->duration(), Fraction(1));
}

// not stored, but later notes keep their timing

void TestMusicXMLParser::unpitched()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto m2 = sheet->firstMeasure()->next();
    QCOMPARE(m2->notes()[1]->time(), Fraction(1, 2));
}

void TestMusicXMLParser::measureRest()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto m3 = sheet->lastMeasure();
    QCOMPARE(m3->timeDivisions(), 8);
    QCOMPARE(m3->notes().size(), size_t(1));
    const auto rest = static_cast<const Rest*>(m3->notes().front().get());
    QVERIFY(rest->isRest());
    QVERIFY(rest->isMeasureRest());
    QCOMPARE(rest->duration(), Fraction(1));
}

void TestMusicXMLParser::clefsInherited()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto m1 = sheet->firstMeasure();
    QCOMPARE(m1->clef().sign, QString("G"));
    QCOMPARE(m1->clef().line, 2);
    QCOMPARE(m1->next()->clef().sign, QString("F"));
    QCOMPARE(m1->next()->clef().line, 4);
    QCOMPARE(sheet->lastMeasure()->clef().sign, QString("F"));
    // no clef for staff 2, the default is returned
    QCOMPARE(m1->clef(2).number, 2);
    QCOMPARE(m1->clef(2).sign, QString("G"));
}

void TestMusicXMLParser::decimalDuration()
{
    const auto sheet = readMeasures("<measure number=\"1\">" + DIVISIONS
                                    + "<note><rest/><duration>1.5</duration></note>"
                                    "<note><rest/><duration>0.5</duration></note>"
                                    "</measure>");
    const auto& notes = sheet->firstMeasure()->notes();
    QCOMPARE(notes[0]->duration(), Fraction(3, 32));
    QCOMPARE(notes[1]->time(), Fraction(3, 32));
    QCOMPARE(sheet->firstMeasure()->duration(), Fraction(1, 8));
}

void TestMusicXMLParser::forwardAndBackup()
{
    const auto sheet = readMeasures("<measure number=\"1\">" + DIVISIONS
                                    + "<forward><duration>4</duration></forward>"
                                    "<note><rest/><duration>4</duration></note>"
                                    "<backup><duration>8</duration></backup>"
                                    "<note><rest/><duration>2</duration></note>"
                                    "<backup><duration>2</duration></backup>"
                                    "<note><rest/><duration>2</duration></note>"
                                    "</measure>");
    const auto m1 = sheet->firstMeasure();
    const auto& notes = m1->notes();
    QCOMPARE(notes[0]->time(), Fraction(1, 4));
    QCOMPARE(notes[0]->voice(), 0);
    QCOMPARE(notes[1]->time(), Fraction(0));
    QCOMPARE(notes[1]->voice(), 1);
    QCOMPARE(notes[2]->time(), Fraction(0));
    QCOMPARE(notes[2]->voice(), 2);
    // the furthest point reached, not the final cursor
    QCOMPARE(m1->currentTime(), Fraction(1, 8));
    QCOMPARE(m1->duration(), Fraction(1, 2));
}

// the text sheetmusic-info prints for measures and notes

void TestMusicXMLParser::descriptions()
{
    const auto sheet = readSheet(DIR + "voices.xml");
    const auto m1 = sheet->firstMeasure();
    const auto m2 = m1->next();
    const auto m3 = m2->next();

    QCOMPARE(m1->notes()[0]->toString(), QString("note C#5 time 0/1 duration 1/4 type quarter accidental sharp"));
    QVERIFY(m1->notes()[4]->toString().endsWith("voice 1"));
    QVERIFY(m2->notes()[0]->toString().contains("dots 1"));
    QCOMPARE(m2->notes()[1]->toString(), QString("rest time 1/2 duration 1/2 type half"));
    QCOMPARE(m3->notes()[0]->toString(), QString("measure rest time 0/1 duration 1/1"));

    const auto text = m2->toString();
    QVERIFY2(text.startsWith("measure 2 page 1 "), qPrintable(text));
    QVERIFY2(text.contains(" clef F4 notes 2 beams 0 duration 1/1"), qPrintable(text));
    QVERIFY(m1->toString().contains(" new-system clef G2 "));

    Pitch flat;
    flat.step = 'B';
    flat.alter = -2.0;
    flat.octave = 3;
    QCOMPARE(flat.toString(), QString("Bbb3"));
    Clef treble8vb;
    treble8vb.octaveChange = -1;
    QCOMPARE(treble8vb.toString(), QString("G2-1"));
}

void TestMusicXMLParser::container()
{
    QFile file(root + "/" + DIR + "voices.xml");
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto path = tmp.filePath("voices.mxl");
    QZipWriter zip(path);
    zip.addFile("META-INF/container.xml", "<container/>");
    zip.addFile("voices.xml", file.readAll());
    zip.close();
    const auto sheet = readSheet(path);
    QCOMPARE(sheet->title(), QString("Voices"));
    QCOMPARE(sheet->measureCount(), 3);
}

void TestMusicXMLParser::parserReused()
{
    MusicXMLParser parser(testPreferences(), &logger);
    const auto first = parser.parse(root + "/" + DIR + "voices.xml");
    const auto second = parser.parse(root + "/musicxml/layout/layout.xml");
    const auto third = parser.parse(root + "/" + DIR + "voices.xml");
    QCOMPARE(first->measureCount(), 3);
    QCOMPARE(second->measureCount(), 6);
    QCOMPARE(third->firstMeasure()->notes().size(), first->firstMeasure()->notes().size());
}

void TestMusicXMLParser::durationBeforeDivisions()
{
    malformed("<measure number=\"1\"><note><rest/><duration>4</duration></note></measure>",
              "duration before divisions");
}

void TestMusicXMLParser::backupBeyondMeasureStart()
{
    try {
        readMeasures("<measure number=\"1\">" + DIVISIONS
                     + "<note><rest/><duration>4</duration></note>\n"
                     "<backup><duration>8</duration></backup>\n"
                     "</measure>");
        QFAIL("no MalformedInputError thrown");
    }
    catch (const MalformedInputError& e) {
        QVERIFY(e.message().contains("backup beyond measure start"));
        QCOMPARE(e.line(), qint64(7));
    }
}

void TestMusicXMLParser::noteWithoutDuration()
{
    malformed("<measure number=\"1\">" + DIVISIONS
              + "<note><pitch><step>C</step><octave>4</octave></pitch></note></measure>",
              "note without duration", false);
}

// a valid decimal whose whole note fraction does not fit

void TestMusicXMLParser::durationOutOfRange()
{
    try {
        readMeasures("<measure number=\"1\"><attributes><divisions>100</divisions></attributes>\n"
                     "<note><rest/><duration>0.00000000000000001</duration></note>\n"
                     "</measure>");
        QFAIL("no MalformedInputError thrown");
    }
    catch (const MalformedInputError& e) {
        QVERIFY2(e.message().contains("duration out of range"), qPrintable(e.message()));
        QCOMPARE(e.line(), qint64(6));
    }
}

// each duration fits, their sum on the time cursor does not

void TestMusicXMLParser::cursorOutOfRange()
{
    malformed("<measure number=\"1\">"
              "<attributes><divisions>2147483647</divisions></attributes>"
              "<note><rest/><duration>1</duration></note>"
              "<attributes><divisions>2147483629</divisions></attributes>"
              "<note><rest/><duration>1</duration></note>"
              "</measure>",
              "duration out of range");
}

// the unpitched note is not stored, the chord still starts with it

void TestMusicXMLParser::chordAfterUnpitched()
{
    const auto sheet = readMeasures("<measure number=\"1\">" + DIVISIONS
                                    + "<note><pitch><step>C</step><octave>4</octave></pitch><duration>4</duration></note>"
                                    "<note><unpitched/><duration>4</duration></note>"
                                    "<note><chord/><pitch><step>E</step><octave>4</octave></pitch>"
                                    "<duration>4</duration></note>"
                                    "<note><pitch><step>G</step><octave>4</octave></pitch><duration>4</duration></note>"
                                    "</measure>");
    const auto& notes = sheet->firstMeasure()->notes();
    QCOMPARE(notes.size(), size_t(3));
    QCOMPARE(notes[0]->time(), Fraction(0));
    QCOMPARE(notes[1]->time(), Fraction(1, 4));
    QCOMPARE(pitched(notes[1].get())->pitch().step, 'E');
    QCOMPARE(notes[2]->time(), Fraction(1, 2));
    QCOMPARE(sheet->firstMeasure()->duration(), Fraction(3, 4));
}

void TestMusicXMLParser::illegalDivisions_data()
{
    QTest::addColumn<QByteArray>("divisions");

    QTest::newRow("decimal") << QByteArray("1.5");
    QTest::newRow("zero") << QByteArray("0");
    QTest::newRow("negative") << QByteArray("-4");
    QTest::newRow("text") << QByteArray("four");
}

void TestMusicXMLParser::illegalDivisions()
{
    QFETCH(QByteArray, divisions);
    malformed("<measure number=\"1\"><attributes><divisions>" + divisions + "</divisions></attributes></measure>",
              "divisions", false);
}

void TestMusicXMLParser::noPart()
{
    const auto path = writeFile("nopart.xml", "<score-partwise><part-list/></score-partwise>");
    MusicXMLParser parser(testPreferences(false), &logger);
    try {
        parser.parse(path);
        QFAIL("no MalformedInputError thrown");
    }
    catch (const MalformedInputError& e) {
        QVERIFY(e.message().contains("no part"));
    }
}

void TestMusicXMLParser::notPartwise()
{
    const auto path = writeFile("timewise.xml", "<score-timewise><part-list/></score-timewise>");
    MusicXMLParser parser(testPreferences(false), &logger);
    QVERIFY_EXCEPTION_THROWN(parser.parse(path), FormatError);
    MusicXMLParser validating(testPreferences(), &logger);
    QVERIFY_EXCEPTION_THROWN(validating.parse(path), ValidateError);
}

void TestMusicXMLParser::missingFile()
{
    QVERIFY_EXCEPTION_THROWN(readSheet(tmp.filePath("missing.xml")), FileOpenError);
}

QTEST_GUILESS_MAIN(TestMusicXMLParser)

#include "tst_musicxmlparser.moc"
