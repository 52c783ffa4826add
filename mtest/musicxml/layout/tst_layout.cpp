/****************************************************************************
**
** tst_layout.cpp -- tests for page, system and measure placement
**
****************************************************************************/

#include <QtTest/QtTest>

#include "importerrors.h"
#include "layoutengine.h"
#include "mxmldata.h"
#include "sheet.h"
#include "testutils.h"

#define DIR QString("musicxml/layout/")

using namespace SheetMusic;

static const QByteArray PAGE_DEFAULTS {
    "<defaults><page-layout><page-height>1500</page-height><page-width>1000</page-width>"
    "<page-margins type=\"both\"><left-margin>70</left-margin><right-margin>70</right-margin>"
    "<top-margin>100</top-margin><bottom-margin>100</bottom-margin></page-margins></page-layout></defaults>\n"
};

static const QByteArray REST {
    "<note><rest/><duration>4</duration></note>"
};

//---------------------------------------------------------
//   TestLayout
//---------------------------------------------------------

class TestLayout : public QObject, public MTest
{
    Q_OBJECT

    std::unique_ptr<Sheet> readMeasures(const QByteArray& measures, const QByteArray& defaults = PAGE_DEFAULTS,
                                        bool validate = true);
    static std::vector<Measure*> measures(const Sheet& sheet);

private slots:
    void initTestCase();
    void placement();
    void layoutFile();
    void pagesPartitionMeasures();
    void firstMeasureWithPrint();
    void firstMeasureNewPage();
    void defaultPage();
    void defaultSystemLayout();
    void oddEvenMargins();
    void stavesAndSpacing();
    void caseInsensitiveYes();
    void missingSystemDistance();
    void missingTopSystemDistance();
    void firstPrintWithoutTopSystemDistance();
    void pageLayoutInPrintIgnored();
};

void TestLayout::initTestCase()
{
    initMTest();
}

std::unique_ptr<Sheet> TestLayout::readMeasures(const QByteArray& measures, const QByteArray& defaults, bool validate)
{
    return readSheet(writeFile("layout.xml", scoreXml(measures, defaults)), validate);
}

std::vector<Measure*> TestLayout::measures(const Sheet& sheet)
{
    std::vector<Measure*> result;
    for (auto m = sheet.firstMeasure(); m; m = m->next()) {
        result.push_back(m);
    }
    return result;
}

//---------------------------------------------------------
//   placement
//   first measure and new-page select a new page
//---------------------------------------------------------

void TestLayout::placement()
{
    MusicXML::ScorePartwise score;
    Sheet sheet(score);
    const auto page = sheet.newPage();
    MusicXML::Measure node;
    const auto m1 = page->addMeasure(std::unique_ptr<Measure>(new Measure(node)));
    const auto m2 = page->addMeasure(std::unique_ptr<Measure>(new Measure(node)));

    MusicXML::Print print;
    QVERIFY(LayoutEngine::placement(*m1, print) == Placement::NEW_PAGE);
    QVERIFY(LayoutEngine::placement(*m2, print) == Placement::CONTINUE);
    print.newSystem = "yes";
    QVERIFY(LayoutEngine::placement(*m1, print) == Placement::NEW_PAGE);
    QVERIFY(LayoutEngine::placement(*m2, print) == Placement::NEW_SYSTEM);
    print.newPage = "Yes";
    QVERIFY(LayoutEngine::placement(*m2, print) == Placement::NEW_PAGE);
    print.newPage = "no";
    print.newSystem = "no";
    QVERIFY(LayoutEngine::placement(*m2, print) == Placement::CONTINUE);
}

void TestLayout::layoutFile()
{
    const auto sheet = readSheet(DIR + "layout.xml");
    QCOMPARE(sheet->title(), QString("Layout"));
    QCOMPARE(sheet->movementTitle(), QString("First movement"));
    QCOMPARE(sheet->composer(), QString("Anonymous"));
    QCOMPARE(sheet->pages().size(), size_t(2));
    QCOMPARE(sheet->measureCount(), 6);

    const auto m = measures(*sheet);
    QCOMPARE(m.size(), size_t(6));

    // first measure without print: page margins and default system layout
    QVERIFY(m[0]->isNewSystem());
    QCOMPARE(m[0]->x(), 70.0);
    QCOMPARE(m[0]->y(), 1360.0);
    QCOMPARE(m[0]->height(), 40.0);
    QCOMPARE(*m[0]->width(), 200.0);

    // new system: y = prev.y - system-distance - height
    QVERIFY(m[1]->isNewSystem());
    QCOMPARE(m[1]->x(), 90.0);
    QCOMPARE(m[1]->y(), 1360.0 - 80.0 - m[1]->height());

    // continuation
    QVERIFY(!m[2]->isNewSystem());
    QCOMPARE(m[2]->x(), 90.0);
    QCOMPARE(m[2]->y(), 1240.0);
    QVERIFY(!m[2]->width());

    // continuation with measure-distance
    QVERIFY(!m[3]->isNewSystem());
    QCOMPARE(m[3]->x(), 105.0);
    QCOMPARE(m[3]->y(), 1240.0);

    // new page
    QVERIFY(m[4]->isNewSystem());
    QCOMPARE(m[4]->page()->number(), 2);
    QCOMPARE(m[4]->x(), 80.0);
    QCOMPARE(m[4]->y(), 1310.0);

    QVERIFY(!m[5]->isNewSystem());
    QCOMPARE(m[5]->x(), 80.0);
    QCOMPARE(m[5]->y(), 1310.0);

    QCOMPARE(sheet->pages().at(0)->systemCount(), 2);
    QCOMPARE(sheet->pages().at(1)->systemCount(), 1);
}

void TestLayout::pagesPartitionMeasures()
{
    const auto sheet = readSheet(DIR + "layout.xml");
    const auto chain = measures(*sheet);
    size_t i = 0;
    for (const auto& page : sheet->pages()) {
        QVERIFY(!page->measures().empty());
        for (const auto& measure : page->measures()) {
            QVERIFY(i < chain.size());
            QCOMPARE(measure.get(), chain[i]);
            QCOMPARE(measure->page(), page.get());
            QCOMPARE(measure->number(), QString::number(i + 1));
            QVERIFY(measure->isFinished());
            ++i;
        }
    }
    QCOMPARE(i, chain.size());
    QCOMPARE(sheet->lastMeasure(), chain.back());
    QVERIFY(sheet->isFinished());
}

void TestLayout::firstMeasureWithPrint()
{
    const auto sheet = readMeasures(
        "<measure number=\"1\"><print><system-layout><system-margins><left-margin>5</left-margin>"
        "<right-margin>0</right-margin></system-margins><top-system-distance>30</top-system-distance>"
        "</system-layout></print><attributes><divisions>1</divisions></attributes>" + REST + "</measure>"
        "<measure number=\"2\">" + REST + "</measure>");
    QCOMPARE(sheet->pages().size(), size_t(1));
    const auto m1 = sheet->firstMeasure();
    QVERIFY(m1->isNewSystem());
    QCOMPARE(m1->x(), 75.0);
    QCOMPARE(m1->y(), 1500.0 - 100.0 - 30.0 - 40.0);
    QCOMPARE(m1->next()->x(), 75.0);
    QCOMPARE(m1->next()->y(), m1->y());
}

void TestLayout::firstMeasureNewPage()
{
    const auto sheet = readMeasures(
        "<measure number=\"1\"><print new-page=\"yes\"><system-layout>"
        "<top-system-distance>30</top-system-distance></system-layout></print>"
        "<attributes><divisions>1</divisions></attributes>" + REST + "</measure>");
    QCOMPARE(sheet->pages().size(), size_t(1));
    QCOMPARE(sheet->firstMeasure()->page()->number(), 1);
    QCOMPARE(sheet->firstMeasure()->x(), 70.0);
    QCOMPARE(sheet->firstMeasure()->y(), 1330.0);
}

void TestLayout::defaultPage()
{
    const auto sheet = readMeasures("<measure number=\"1\"><attributes><divisions>1</divisions></attributes>"
                                    + REST + "</measure>", QByteArray());
    const auto page = sheet->pages().front().get();
    QCOMPARE(page->size(), QSizeF(DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT));
    QCOMPARE(page->margins().top, DEFAULT_PAGE_MARGIN);
    QCOMPARE(sheet->firstMeasure()->x(), DEFAULT_PAGE_MARGIN);
    QCOMPARE(sheet->firstMeasure()->y(), DEFAULT_PAGE_HEIGHT - DEFAULT_PAGE_MARGIN - 40.0);
}

void TestLayout::defaultSystemLayout()
{
    QByteArray defaults { PAGE_DEFAULTS };
    defaults.replace("</defaults>", "<system-layout><system-margins><left-margin>30</left-margin>"
                     "<right-margin>0</right-margin></system-margins>"
                     "<top-system-distance>120</top-system-distance></system-layout></defaults>");
    const auto sheet = readMeasures("<measure number=\"1\"><attributes><divisions>1</divisions></attributes>"
                                    + REST + "</measure>", defaults);
    QCOMPARE(sheet->defaultTopSystemDistance(), 120.0);
    QCOMPARE(sheet->firstMeasure()->x(), 100.0);
    QCOMPARE(sheet->firstMeasure()->y(), 1500.0 - 100.0 - 120.0 - 40.0);
}

void TestLayout::oddEvenMargins()
{
    const QByteArray defaults {
        "<defaults><page-layout><page-height>1500</page-height><page-width>1000</page-width>"
        "<page-margins type=\"odd\"><left-margin>100</left-margin><right-margin>50</right-margin>"
        "<top-margin>50</top-margin><bottom-margin>50</bottom-margin></page-margins>"
        "<page-margins type=\"even\"><left-margin>60</left-margin><right-margin>90</right-margin>"
        "<top-margin>40</top-margin><bottom-margin>50</bottom-margin></page-margins>"
        "</page-layout></defaults>\n"
    };
    const QByteArray newPage {
        "<print new-page=\"yes\"><system-layout><top-system-distance>10</top-system-distance>"
        "</system-layout></print>"
    };
    const auto sheet = readMeasures(
        "<measure number=\"1\"><attributes><divisions>1</divisions></attributes>" + REST + "</measure>"
        "<measure number=\"2\">" + newPage + REST + "</measure>"
        "<measure number=\"3\">" + newPage + REST + "</measure>", defaults);
    QCOMPARE(sheet->pages().size(), size_t(3));
    const auto m = measures(*sheet);
    QCOMPARE(m[0]->x(), 100.0);
    QCOMPARE(m[0]->y(), 1500.0 - 50.0 - 40.0);
    QCOMPARE(m[1]->page()->margins().left, 60.0);
    QCOMPARE(m[1]->x(), 60.0);
    QCOMPARE(m[1]->y(), 1500.0 - 40.0 - 10.0 - 40.0);
    QCOMPARE(m[2]->x(), 100.0);
    QCOMPARE(m[2]->y(), 1500.0 - 50.0 - 10.0 - 40.0);
}

// height = staves * 40 + (staves - 1) * staff spacing

void TestLayout::stavesAndSpacing()
{
    const auto sheet = readMeasures(
        "<measure number=\"1\"><attributes><divisions>1</divisions><staves>2</staves></attributes>"
        + REST + "</measure>"
        "<measure number=\"2\"><print new-system=\"yes\" staff-spacing=\"50\"><system-layout>"
        "<system-distance>80</system-distance></system-layout></print>" + REST + "</measure>"
        "<measure number=\"3\">" + REST + "</measure>"
        "<measure number=\"4\"><attributes><staves>1</staves></attributes>" + REST + "</measure>");
    const auto m = measures(*sheet);
    QCOMPARE(m[0]->staves(), 2);
    QCOMPARE(m[0]->staffSpacing(), DEFAULT_STAFF_DISTANCE);
    QCOMPARE(m[0]->height(), 80.0 + DEFAULT_STAFF_DISTANCE);
    QCOMPARE(m[0]->y(), 1500.0 - 100.0 - m[0]->height());
    QCOMPARE(m[1]->height(), 130.0);
    QCOMPARE(m[1]->y(), m[0]->y() - 80.0 - 130.0);
    QCOMPARE(m[2]->staves(), 2);
    QCOMPARE(m[2]->staffSpacing(), 50.0);
    QCOMPARE(m[2]->y(), m[1]->y());
    QCOMPARE(m[3]->staves(), 1);
    QCOMPARE(m[3]->height(), 40.0);
}

void TestLayout::caseInsensitiveYes()
{
    const auto sheet = readMeasures(
        "<measure number=\"1\"><attributes><divisions>1</divisions></attributes>" + REST + "</measure>"
        "<measure number=\"2\"><print new-system=\"YES\"><system-layout>"
        "<system-distance>80</system-distance></system-layout></print>" + REST + "</measure>"
        "<measure number=\"3\"><print new-page=\"Yes\"><system-layout>"
        "<top-system-distance>0</top-system-distance></system-layout></print>" + REST + "</measure>",
        PAGE_DEFAULTS, false);
    const auto m = measures(*sheet);
    QVERIFY(m[1]->isNewSystem());
    QCOMPARE(m[1]->y(), 1360.0 - 80.0 - 40.0);
    QCOMPARE(m[2]->page()->number(), 2);
    QCOMPARE(m[2]->y(), 1360.0);
}

void TestLayout::missingSystemDistance()
{
    try {
        readMeasures("<measure number=\"1\"><attributes><divisions>1</divisions></attributes>" + REST + "</measure>"
                     "\n<measure number=\"2\">\n<print new-system=\"yes\"/>" + REST + "</measure>");
        QFAIL("no MalformedInputError thrown");
    }
    catch (const MalformedInputError& e) {
        QVERIFY(e.message().contains("system-layout/system-distance"));
        QCOMPARE(e.line(), qint64(8));
    }
}

void TestLayout::missingTopSystemDistance()
{
    QVERIFY_EXCEPTION_THROWN(readMeasures(
        "<measure number=\"1\"><attributes><divisions>1</divisions></attributes>" + REST + "</measure>"
        "<measure number=\"2\"><print new-page=\"yes\"><system-layout><system-distance>80</system-distance>"
        "</system-layout></print>" + REST + "</measure>"), MalformedInputError);
}

void TestLayout::firstPrintWithoutTopSystemDistance()
{
    QVERIFY_EXCEPTION_THROWN(readMeasures(
        "<measure number=\"1\"><print new-system=\"yes\"><system-layout><system-distance>80</system-distance>"
        "</system-layout></print><attributes><divisions>1</divisions></attributes>" + REST + "</measure>"),
        MalformedInputError);
}

// page size and margins are not changed by a print element

void TestLayout::pageLayoutInPrintIgnored()
{
    const auto sheet = readMeasures(
        "<measure number=\"1\"><attributes><divisions>1</divisions></attributes>" + REST + "</measure>"
        "<measure number=\"2\"><print new-page=\"yes\"><page-layout><page-height>3000</page-height>"
        "<page-width>2000</page-width></page-layout><system-layout>"
        "<top-system-distance>0</top-system-distance></system-layout></print>" + REST + "</measure>");
    const auto page = sheet->pages().at(1).get();
    QCOMPARE(page->size(), QSizeF(1000, 1500));
    QCOMPARE(sheet->lastMeasure()->y(), 1360.0);
}

QTEST_GUILESS_MAIN(TestLayout)

#include "tst_layout.moc"
