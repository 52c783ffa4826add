/****************************************************************************
**
** tst_beams.cpp -- tests for beam resolution
**
****************************************************************************/

#include <QtTest/QtTest>

#include "beamresolver.h"
#include "importerrors.h"
#include "mxmldata.h"
#include "parsecontext.h"
#include "sheet.h"
#include "testutils.h"

#define DIR QString("musicxml/beams/")

using namespace SheetMusic;

static QByteArray beamedNote(const char* step, const char* beams, bool chord = false)
{
    QByteArray note { "<note>" };
    if (chord) {
        note += "<chord/>";
    }
    note += QByteArray("<pitch><step>") + step + "</step><octave>4</octave></pitch><duration>1</duration>";
    if (!chord) {
        note += "<stem>up</stem>";
    }
    note += beams;
    note += "</note>\n";
    return note;
}

static const QByteArray FIRST { "<measure number=\"1\">\n<attributes><divisions>2</divisions></attributes>\n" };

//---------------------------------------------------------
//   TestBeams
//---------------------------------------------------------

class TestBeams : public QObject, public MTest
{
    Q_OBJECT

    std::unique_ptr<Sheet> readMeasures(const QByteArray& measures);
    void malformed(const QByteArray& measures, const QString& text, qint64 line);
    static std::vector<const Stem*> stems(const Measure* measure);

private slots:
    void initTestCase();
    void resolver();
    void resolverFaults();
    void beamsFile();
    void crossBarline();
    void nestedLevels();
    void secondaryBeamsIgnored();
    void chordNotesIgnored();
    void restBeamIgnored();
    void continueWithoutBegin();
    void endWithoutBegin();
    void beginTwice();
    void notEnded();
};

void TestBeams::initTestCase()
{
    initMTest();
}

std::unique_ptr<Sheet> TestBeams::readMeasures(const QByteArray& measures)
{
    return readSheet(writeFile("beams.xml", scoreXml(measures)));
}

void TestBeams::malformed(const QByteArray& measures, const QString& text, qint64 line)
{
    try {
        readMeasures(measures);
        QFAIL("no MalformedInputError thrown");
    }
    catch (const MalformedInputError& e) {
        QVERIFY2(e.message().contains(text), qPrintable(e.message()));
        QCOMPARE(e.line(), line);
    }
}

// the stems of the pitched notes of a measure in document order

std::vector<const Stem*> TestBeams::stems(const Measure* measure)
{
    std::vector<const Stem*> result;
    for (const auto& note : measure->notes()) {
        if (!note->isRest()) {
            const auto stem = static_cast<const PitchedNote*>(note.get())->stem();
            if (stem) {
                result.push_back(stem);
            }
        }
    }
    return result;
}

//---------------------------------------------------------
//   resolver
//   begin, continue and end on a bare context
//---------------------------------------------------------

void TestBeams::resolver()
{
    MusicXML::ScorePartwise score;
    ParseContext context("test", &logger);
    context.sheet.reset(new Sheet(score));
    context.page = context.sheet->newPage();
    MusicXML::Measure node;
    context.measure = context.page->addMeasure(std::unique_ptr<Measure>(new Measure(node)));

    const Stem s1 {}, s2 {}, s3 {};
    MusicXML::NoteBeam beam;
    beam.value = "begin";
    BeamResolver::resolve(context, beam, &s1, 1);
    QCOMPARE(context.beams.size(), size_t(1));
    beam.value = "continue";
    BeamResolver::resolve(context, beam, &s2, 2);
    beam.value = "forward hook";
    BeamResolver::resolve(context, beam, &s2, 2);
    beam.value = "end";
    BeamResolver::resolve(context, beam, &s3, 3);

    QVERIFY(context.beams.empty());
    BeamResolver::checkAllClosed(context);
    QCOMPARE(context.measure->beams().size(), size_t(1));
    const auto& result = *context.measure->beams().front();
    QCOMPARE(result.number(), 1);
    QCOMPARE(result.stems().size(), size_t(3));
    QCOMPARE(result.stems()[0], &s1);
    QCOMPARE(result.stems()[1], &s2);
    QCOMPARE(result.stems()[2], &s3);
}

void TestBeams::resolverFaults()
{
    MusicXML::ScorePartwise score;
    ParseContext context("test", &logger);
    context.sheet.reset(new Sheet(score));
    context.page = context.sheet->newPage();
    MusicXML::Measure node;
    context.measure = context.page->addMeasure(std::unique_ptr<Measure>(new Measure(node)));

    const Stem stem {};
    MusicXML::NoteBeam beam;
    beam.number = 3;
    beam.value = "continue";
    QVERIFY_EXCEPTION_THROWN(BeamResolver::resolve(context, beam, &stem, 5), MalformedInputError);
    beam.value = "end";
    QVERIFY_EXCEPTION_THROWN(BeamResolver::resolve(context, beam, &stem, 5), MalformedInputError);
    beam.value = "begin";
    BeamResolver::resolve(context, beam, &stem, 5);
    QVERIFY_EXCEPTION_THROWN(BeamResolver::resolve(context, beam, &stem, 6), MalformedInputError);
    QVERIFY_EXCEPTION_THROWN(BeamResolver::checkAllClosed(context), MalformedInputError);
    QVERIFY(context.measure->beams().empty());
}

void TestBeams::beamsFile()
{
    const auto sheet = readSheet(DIR + "beams.xml");
    const auto m1 = sheet->firstMeasure();
    QCOMPARE(m1->notes().size(), size_t(6));
    QCOMPARE(m1->beams().size(), size_t(1));

    const auto& beam = *m1->beams().front();
    QCOMPARE(beam.number(), 1);
    const auto expected = stems(m1);
    QCOMPARE(expected.size(), size_t(5));
    QCOMPARE(beam.stems().size(), size_t(4));
    for (size_t i = 0; i < 4; ++i) {
        QCOMPARE(beam.stems()[i], expected[i]);
    }
    QCOMPARE(m1->duration(), Fraction(1));
}

// a beam ends in the measure after the one it begins in

void TestBeams::crossBarline()
{
    const auto sheet = readSheet(DIR + "beams.xml");
    const auto m2 = sheet->firstMeasure()->next();
    const auto m3 = m2->next();
    QVERIFY(m2->beams().empty());
    QCOMPARE(m3->beams().size(), size_t(1));
    const auto& beam = *m3->beams().front();
    QCOMPARE(beam.stems().size(), size_t(3));
    const auto s2 = stems(m2);
    const auto s3 = stems(m3);
    QCOMPARE(beam.stems()[0], s2[1]);
    QCOMPARE(beam.stems()[1], s2[2]);
    QCOMPARE(beam.stems()[2], s3[0]);
}

// the second beam level of the sixteenths is not resolved

void TestBeams::nestedLevels()
{
    const auto sheet = readSheet(DIR + "beams.xml");
    const auto m4 = sheet->lastMeasure();
    QCOMPARE(m4->number(), QString("4"));
    QCOMPARE(m4->beams().size(), size_t(2));
    QCOMPARE(m4->beams()[0]->number(), 1);
    QCOMPARE(m4->beams()[0]->stems().size(), size_t(4));
    QCOMPARE(m4->beams()[1]->number(), 1);
    QCOMPARE(m4->beams()[1]->stems().size(), size_t(2));
    const auto s4 = stems(m4);
    QCOMPARE(m4->beams()[1]->stems()[0], s4[4]);
    QCOMPARE(m4->beams()[1]->stems()[1], s4[5]);

    // sixteenths from decimal durations
    QCOMPARE(m4->notes()[0]->duration(), Fraction(1, 16));
    QCOMPARE(m4->notes()[3]->time(), Fraction(3, 16));
    QCOMPARE(m4->notes()[4]->time(), Fraction(1, 4));
    QCOMPARE(m4->duration(), Fraction(1));
}

// beam children after the first one never open or close a beam

void TestBeams::secondaryBeamsIgnored()
{
    const auto sheet = readMeasures(FIRST
                                    + beamedNote("C", "<beam number=\"1\">begin</beam><beam number=\"2\">begin</beam>")
                                    + beamedNote("D", "<beam number=\"1\">end</beam><beam number=\"3\">end</beam>")
                                    + "</measure>");
    const auto m1 = sheet->firstMeasure();
    QCOMPARE(m1->beams().size(), size_t(1));
    QCOMPARE(m1->beams().front()->number(), 1);
    QCOMPARE(m1->beams().front()->stems().size(), size_t(2));
}

void TestBeams::chordNotesIgnored()
{
    const auto sheet = readMeasures(FIRST
                                    + beamedNote("C", "<beam>begin</beam>")
                                    + beamedNote("E", "<beam>begin</beam>", true)
                                    + beamedNote("D", "<beam>end</beam>")
                                    + beamedNote("F", "<beam>end</beam>", true)
                                    + "</measure>");
    const auto m1 = sheet->firstMeasure();
    QCOMPARE(m1->notes().size(), size_t(4));
    QCOMPARE(m1->beams().size(), size_t(1));
    QCOMPARE(m1->beams().front()->stems().size(), size_t(2));
}

void TestBeams::restBeamIgnored()
{
    const auto sheet = readMeasures(FIRST
                                    + "<note><rest/><duration>1</duration><beam>begin</beam></note>\n"
                                    + beamedNote("C", "<beam>begin</beam>")
                                    + beamedNote("D", "<beam>end</beam>")
                                    + "</measure>");
    QCOMPARE(sheet->firstMeasure()->beams().size(), size_t(1));
}

void TestBeams::continueWithoutBegin()
{
    malformed(FIRST + beamedNote("C", "<beam number=\"2\">continue</beam>") + "</measure>",
              "beam 2 continued without begin", 7);
}

void TestBeams::endWithoutBegin()
{
    malformed(FIRST + beamedNote("C", "<beam>begin</beam>")
              + beamedNote("D", "<beam>end</beam>")
              + beamedNote("E", "<beam>end</beam>") + "</measure>",
              "beam 1 ended without begin", 9);
}

void TestBeams::beginTwice()
{
    malformed(FIRST + beamedNote("C", "<beam>begin</beam>")
              + beamedNote("D", "<beam>begin</beam>") + "</measure>",
              "beam 1 begun while still open", 8);
}

void TestBeams::notEnded()
{
    malformed(FIRST + beamedNote("C", "<beam>begin</beam>")
              + beamedNote("D", "<beam>continue</beam>") + "</measure>"
              "<measure number=\"2\">" + beamedNote("E", "<beam number=\"2\">begin</beam>") + "</measure>",
              "beam 1, 2 not ended", 0);
}

QTEST_GUILESS_MAIN(TestBeams)

#include "tst_beams.moc"
