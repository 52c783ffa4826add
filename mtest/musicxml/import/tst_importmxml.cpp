/****************************************************************************
**
** tst_importmxml.cpp -- tests for the status code import
**
****************************************************************************/

#include <QtTest/QtTest>

#include "importmxml.h"
#include "musicxmlparser.h"
#include "preferences.h"
#include "sheet.h"
#include "testutils.h"

using namespace SheetMusic;

Q_DECLARE_METATYPE(SheetMusic::FileError)

//---------------------------------------------------------
//   TestImportMxml
//---------------------------------------------------------

class TestImportMxml : public QObject, public MTest
{
    Q_OBJECT

private slots:
    void initTestCase();
    void success();
    void errors_data();
    void errors();
    void resourceError();
    void preferencesFromEnvironment();
    void schemaPathResolved();
};

void TestImportMxml::initTestCase()
{
    initMTest();
}

void TestImportMxml::success()
{
    MusicXMLParser parser(testPreferences(), &logger);
    std::unique_ptr<Sheet> sheet;
    QString errorText { "stale" };
    const auto res = importMusicXml(parser, root + "/musicxml/layout/layout.xml", sheet, errorText);
    QVERIFY(res == FileError::FILE_NO_ERROR);
    QVERIFY(sheet);
    QVERIFY(errorText.isEmpty());
    QCOMPARE(sheet->measureCount(), 6);
}

void TestImportMxml::errors_data()
{
    QTest::addColumn<QByteArray>("content");
    QTest::addColumn<FileError>("expected");

    QTest::newRow("empty") << QByteArray() << FileError::FILE_BAD_FORMAT;
    QTest::newRow("not xml") << QByteArray("<score-partwise>") << FileError::FILE_BAD_FORMAT;
    QTest::newRow("invalid") << scoreXml("<measure/>") << FileError::FILE_INVALID;
    QTest::newRow("corrupted") << scoreXml("<measure number=\"1\"><note><rest/><duration>4</duration></note></measure>")
                               << FileError::FILE_CORRUPTED;
}

void TestImportMxml::errors()
{
    QFETCH(QByteArray, content);
    QFETCH(FileError, expected);

    const auto path = writeFile("import.xml", content);
    MusicXMLParser parser(testPreferences(), &logger);
    std::unique_ptr<Sheet> sheet;
    QString errorText;
    const auto res = importMusicXml(parser, path, sheet, errorText);
    QVERIFY(res == expected);
    QVERIFY(!sheet);
    QVERIFY(errorText.startsWith(path));

    const auto missing = importMusicXml(parser, tmp.filePath("missing.xml"), sheet, errorText);
    QVERIFY(missing == FileError::FILE_OPEN_ERROR);
}

void TestImportMxml::resourceError()
{
    auto preferences = testPreferences();
    preferences.schemaPath = tmp.filePath("missing.xsd");
    std::unique_ptr<Sheet> sheet;
    QString errorText;
    const auto res = importMusicXml(preferences, root + "/musicxml/layout/layout.xml", sheet, errorText);
    QVERIFY(res == FileError::FILE_RESOURCE_ERROR);
    QVERIFY(!sheet);
    QVERIFY(errorText.contains("missing.xsd"));

    // without validation the schema is not needed
    preferences.validate = false;
    QVERIFY(importMusicXml(preferences, root + "/musicxml/layout/layout.xml", sheet, errorText)
            == FileError::FILE_NO_ERROR);
    QVERIFY(sheet);
}

void TestImportMxml::preferencesFromEnvironment()
{
    qputenv("SHEETMUSIC_SCHEMA", "custom.xsd");
    qputenv("SHEETMUSIC_LOG_LEVEL", "Trace");
    auto preferences = Preferences::fromEnvironment();
    QVERIFY(QFileInfo(preferences.schemaPath).isAbsolute());
    QVERIFY(preferences.schemaPath.endsWith("custom.xsd"));
    QVERIFY(preferences.loggingLevel == MxmlLogger::Level::MXML_TRACE);
    QVERIFY(preferences.validate);

    qputenv("SHEETMUSIC_LOG_LEVEL", "loud");
    preferences = Preferences::fromEnvironment();
    QVERIFY(preferences.loggingLevel == MxmlLogger::Level::MXML_ERROR);

    qunsetenv("SHEETMUSIC_SCHEMA");
    qunsetenv("SHEETMUSIC_LOG_LEVEL");
    preferences = Preferences::fromEnvironment();
    QVERIFY(preferences.schemaPath.isEmpty());
}

void TestImportMxml::schemaPathResolved()
{
    Preferences preferences;
    QCOMPARE(preferences.resolvedSchemaPath(), QString(BUNDLED_SCHEMA_PATH));
    preferences.schemaPath = ":/other.xsd";
    QCOMPARE(preferences.resolvedSchemaPath(), QString(":/other.xsd"));
    preferences.schemaPath = "relative/musicxml.xsd";
    QCOMPARE(preferences.resolvedSchemaPath(), QDir::current().absoluteFilePath("relative/musicxml.xsd"));
}

QTEST_GUILESS_MAIN(TestImportMxml)

#include "tst_importmxml.moc"
