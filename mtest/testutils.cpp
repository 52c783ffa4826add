/****************************************************************************
**
** testutils.cpp -- helpers shared by the tests
**
****************************************************************************/

#include <QFile>
#include <QFileInfo>
#include <QtTest/QtTest>

#include "musicxmlparser.h"
#include "sheet.h"
#include "testutils.h"

using namespace SheetMusic;

//---------------------------------------------------------
//   initMTest
//---------------------------------------------------------

void MTest::initMTest()
{
    root = SHEETMUSIC_TEST_DATA_DIR;
    logger.setLoggingLevel(MxmlLogger::Level::MXML_ERROR);
    QVERIFY(tmp.isValid());
}

Preferences MTest::testPreferences(bool validate) const
{
    Preferences preferences;
    preferences.validate = validate;
    preferences.loggingLevel = logger.loggingLevel();
    return preferences;
}

//---------------------------------------------------------
//   readSheet
//   import a file, relative names are relative to the test data root
//---------------------------------------------------------

std::unique_ptr<Sheet> MTest::readSheet(const QString& name, bool validate) const
{
    const auto path = QFileInfo(name).isAbsolute() ? name : root + "/" + name;
    MusicXMLParser parser(testPreferences(validate), &logger);
    return parser.parse(path);
}

QString MTest::writeFile(const QString& name, const QByteArray& content) const
{
    const auto path = tmp.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(content) != content.size()) {
        qWarning("cannot write %s", qPrintable(path));
    }
    return path;
}

//---------------------------------------------------------
//   scoreXml
//   a single part score around the given measures
//---------------------------------------------------------

QByteArray MTest::scoreXml(const QByteArray& measures, const QByteArray& defaults)
{
    QByteArray xml;
    xml += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    xml += "<score-partwise version=\"3.1\">\n";
    xml += defaults;
    xml += "<part-list><score-part id=\"P1\"><part-name>Music</part-name></score-part></part-list>\n";
    xml += "<part id=\"P1\">\n";
    xml += measures;
    xml += "</part>\n";
    xml += "</score-partwise>\n";
    return xml;
}
