/****************************************************************************
**
** tst_schemavalidator.cpp -- tests for class SchemaValidator
**
****************************************************************************/

#include <QtTest/QtTest>

#include "documentloader.h"
#include "importerrors.h"
#include "musicxmlparser.h"
#include "preferences.h"
#include "schemavalidator.h"
#include "testutils.h"

#define DIR QString("musicxml/schema/")

using namespace SheetMusic;

//---------------------------------------------------------
//   TestSchemaValidator
//---------------------------------------------------------

class TestSchemaValidator : public QObject, public MTest
{
    Q_OBJECT

    std::unique_ptr<SchemaValidator> validator;

private slots:
    void initTestCase();
    void cleanupTestCase();
    void validDocument();
    void validMeasureContent();
    void invalidDocument();
    void strictContent_data();
    void strictContent();
    void noLog();
    void doctypeIgnored();
    void parserRaisesValidateError();
    void parserWithoutValidation();
    void filterFromErrors();
    void missingSchema();
    void brokenSchema();
    void customSchema();
    void importsFromSchemaDir();
};

void TestSchemaValidator::initTestCase()
{
    initMTest();
    validator.reset(new SchemaValidator(BUNDLED_SCHEMA_PATH));
}

void TestSchemaValidator::cleanupTestCase()
{
    validator.reset();
}

void TestSchemaValidator::validDocument()
{
    const auto document = DocumentLoader::load(root + "/musicxml/loader/hello.xml");
    QList<ValidationMessage> log;
    QVERIFY(validator->validate(document, &log));
    QVERIFY(SchemaValidator::filterFromErrors(log).isEmpty());
}

void TestSchemaValidator::validMeasureContent()
{
    const auto path = writeFile("content.xml", scoreXml(
        "<measure number=\"1\">"
        "<attributes><divisions>2</divisions></attributes>"
        "<note default-x=\"12.5\" default-y=\"-10\"><pitch><step>D</step><alter>-1</alter><octave>5</octave></pitch>"
        "<duration>1</duration><voice>1</voice><type>eighth</type><accidental cautionary=\"yes\">flat</accidental>"
        "<stem default-y=\"20\">down</stem><staff>1</staff><beam number=\"1\">begin</beam></note>"
        "<note><chord/><pitch><step>F</step><octave>5</octave></pitch>"
        "<duration>1</duration><voice>1</voice><type>eighth</type><beam number=\"1\">begin</beam></note>"
        "<note><pitch><step>E</step><octave>5</octave></pitch>"
        "<duration>1</duration><voice>1</voice><type>eighth</type><stem>down</stem>"
        "<beam number=\"1\">end</beam></note>"
        "<backup><duration>2</duration></backup>"
        "<forward><duration>2</duration><voice>2</voice></forward>"
        "<direction placement=\"above\"><direction-type><words>dolce</words></direction-type></direction>"
        "<barline location=\"right\"><bar-style>light-heavy</bar-style></barline>"
        "</measure>"));
    QList<ValidationMessage> log;
    QVERIFY(validator->validate(DocumentLoader::load(path), &log));
}

void TestSchemaValidator::invalidDocument()
{
    const auto document = DocumentLoader::load(root + "/" + DIR + "invalid.xml");
    QList<ValidationMessage> log;
    QVERIFY(!validator->validate(document, &log));
    const auto errors = SchemaValidator::filterFromErrors(log);
    // step H, stem sideways and the measure without number
    QVERIFY(errors.size() >= 3);
    for (const auto& error : errors) {
        QVERIFY(error.isError());
        QVERIFY(error.line > 0);
        QVERIFY(!error.description.isEmpty());
    }
}

// content outside what MusicXML allows in the part list, notes,
// attributes and barlines

void TestSchemaValidator::strictContent_data()
{
    QTest::addColumn<QByteArray>("from");
    QTest::addColumn<QByteArray>("to");

    const QByteArray note { "<note><pitch><step>C</step><octave>4</octave></pitch><duration>2</duration></note>" };
    QTest::newRow("note type") << note << QByteArray("<note><pitch><step>C</step><octave>4</octave></pitch>"
                                                     "<duration>2</duration><type>quarterish</type></note>");
    QTest::newRow("tie without type") << note << QByteArray("<note><pitch><step>C</step><octave>4</octave></pitch>"
                                                            "<duration>2</duration><tie/></note>");
    QTest::newRow("dot with text") << note << QByteArray("<note><pitch><step>C</step><octave>4</octave></pitch>"
                                                         "<duration>2</duration><dot>x</dot></note>");
    QTest::newRow("unpitched step") << note << QByteArray("<note><unpitched><display-step>H</display-step>"
                                                          "<display-octave>4</display-octave></unpitched>"
                                                          "<duration>2</duration></note>");
    QTest::newRow("key without fifths") << QByteArray("<divisions>2</divisions>")
                                        << QByteArray("<divisions>2</divisions><key><mode>major</mode></key>");
    QTest::newRow("time without beat-type") << QByteArray("<divisions>2</divisions>")
                                            << QByteArray("<divisions>2</divisions><time><beats>4</beats></time>");
    QTest::newRow("bar-style") << QByteArray("</measure>")
                               << QByteArray("<barline><bar-style>thick</bar-style></barline></measure>");
    QTest::newRow("repeat without direction") << QByteArray("</measure>")
                                              << QByteArray("<barline><repeat/></barline></measure>");
    QTest::newRow("empty part list") << QByteArray("<part-list><score-part id=\"P1\"><part-name>Music</part-name>"
                                                   "</score-part></part-list>")
                                     << QByteArray("<part-list/>");
    QTest::newRow("score-part without name") << QByteArray("<part-name>Music</part-name>") << QByteArray();
    QTest::newRow("undeclared part") << QByteArray("<part id=\"P1\">") << QByteArray("<part id=\"P9\">");
}

void TestSchemaValidator::strictContent()
{
    QFETCH(QByteArray, from);
    QFETCH(QByteArray, to);

    auto xml = scoreXml("<measure number=\"1\"><attributes><divisions>2</divisions></attributes>"
                        "<note><pitch><step>C</step><octave>4</octave></pitch><duration>2</duration></note>"
                        "</measure>");
    const auto valid = writeFile("strict-valid.xml", xml);
    QVERIFY(validator->validate(DocumentLoader::load(valid), nullptr));

    QVERIFY(xml.contains(from));
    xml.replace(from, to);
    const auto invalid = writeFile("strict-invalid.xml", xml);
    QList<ValidationMessage> log;
    QVERIFY(!validator->validate(DocumentLoader::load(invalid), &log));
    QVERIFY(!SchemaValidator::filterFromErrors(log).isEmpty());
}

void TestSchemaValidator::noLog()
{
    const auto document = DocumentLoader::load(root + "/" + DIR + "invalid.xml");
    QVERIFY(!validator->validate(document, nullptr));
}

void TestSchemaValidator::doctypeIgnored()
{
    auto xml = scoreXml("<measure number=\"1\"/>");
    xml.replace("<score-partwise", "<!DOCTYPE score-partwise PUBLIC \"-//Recordare//DTD MusicXML 3.1 Partwise//EN\" "
                "\"http://www.musicxml.org/dtds/partwise.dtd\">\n<score-partwise");
    const auto path = writeFile("doctype.xml", xml);
    QVERIFY(validator->validate(DocumentLoader::load(path), nullptr));
}

void TestSchemaValidator::parserRaisesValidateError()
{
    MusicXMLParser parser(testPreferences(), &logger);
    const auto path = root + "/" + DIR + "invalid.xml";
    try {
        parser.parse(path);
        QFAIL("no ValidateError thrown");
    }
    catch (const ValidateError& e) {
        QCOMPARE(e.path(), path);
        QVERIFY(!e.errors().isEmpty());
        for (const auto& error : e.errors()) {
            QVERIFY(error.isError());
        }
    }
}

// without validation the same document fails later, on the step

void TestSchemaValidator::parserWithoutValidation()
{
    MusicXMLParser parser(testPreferences(false), &logger);
    QVERIFY_EXCEPTION_THROWN(parser.parse(root + "/" + DIR + "invalid.xml"), MalformedInputError);
}

void TestSchemaValidator::filterFromErrors()
{
    QList<ValidationMessage> log;
    ValidationMessage warning;
    warning.type = QtWarningMsg;
    warning.description = "warning";
    ValidationMessage error;
    error.type = QtCriticalMsg;
    error.description = "error";
    ValidationMessage fatal;
    fatal.type = QtFatalMsg;
    fatal.description = "fatal";
    log << warning << error << fatal;
    const auto errors = SchemaValidator::filterFromErrors(log);
    QCOMPARE(errors.size(), 2);
    QCOMPARE(errors.at(0).description, QString("error"));
    QCOMPARE(errors.at(1).description, QString("fatal"));
}

void TestSchemaValidator::missingSchema()
{
    QVERIFY_EXCEPTION_THROWN(SchemaValidator missing(tmp.filePath("missing.xsd")), ResourceError);
    Preferences preferences = testPreferences();
    preferences.schemaPath = tmp.filePath("missing.xsd");
    QVERIFY_EXCEPTION_THROWN(MusicXMLParser parser(preferences, &logger), ResourceError);
}

void TestSchemaValidator::brokenSchema()
{
    const auto path = writeFile("broken.xsd",
        "<?xml version=\"1.0\"?>\n"
        "<xs:schema xmlns:xs=\"http://www.w3.org/2001/XMLSchema\">\n"
        "<xs:element name=\"score-partwise\" type=\"no-such-type\"/>\n"
        "</xs:schema>\n");
    QVERIFY_EXCEPTION_THROWN(SchemaValidator broken(path), ResourceError);
}

// any schema can replace the bundled one, here one that requires a work title

void TestSchemaValidator::customSchema()
{
    const auto path = writeFile("strict.xsd",
        "<?xml version=\"1.0\"?>\n"
        "<xs:schema xmlns:xs=\"http://www.w3.org/2001/XMLSchema\">\n"
        "<xs:element name=\"score-partwise\">\n"
        " <xs:complexType>\n"
        "  <xs:sequence>\n"
        "   <xs:element name=\"work\"><xs:complexType><xs:sequence>\n"
        "    <xs:element name=\"work-title\" type=\"xs:string\"/>\n"
        "   </xs:sequence></xs:complexType></xs:element>\n"
        "   <xs:any minOccurs=\"0\" maxOccurs=\"unbounded\" processContents=\"skip\"/>\n"
        "  </xs:sequence>\n"
        "  <xs:anyAttribute processContents=\"skip\"/>\n"
        " </xs:complexType>\n"
        "</xs:element>\n"
        "</xs:schema>\n");
    const SchemaValidator strict(path);
    QCOMPARE(strict.schemaPath(), path);
    QVERIFY(strict.validate(DocumentLoader::load(root + "/musicxml/loader/hello.xml"), nullptr));
    const auto untitled = writeFile("untitled.xml", scoreXml("<measure number=\"1\"/>"));
    QVERIFY(!strict.validate(DocumentLoader::load(untitled), nullptr));
}

// imports naming a web location are read from the schema's directory,
// the way the official schema imports xml.xsd and xlink.xsd

void TestSchemaValidator::importsFromSchemaDir()
{
    writeFile("versions.xsd",
        "<?xml version=\"1.0\"?>\n"
        "<xs:schema xmlns:xs=\"http://www.w3.org/2001/XMLSchema\"\n"
        "           targetNamespace=\"http://www.example.org/versions\">\n"
        "<xs:simpleType name=\"version\">\n"
        " <xs:restriction base=\"xs:token\">\n"
        "  <xs:enumeration value=\"3.0\"/>\n"
        "  <xs:enumeration value=\"3.1\"/>\n"
        " </xs:restriction>\n"
        "</xs:simpleType>\n"
        "</xs:schema>\n");
    const auto path = writeFile("importing.xsd",
        "<?xml version=\"1.0\"?>\n"
        "<xs:schema xmlns:xs=\"http://www.w3.org/2001/XMLSchema\"\n"
        "           xmlns:v=\"http://www.example.org/versions\">\n"
        "<xs:import namespace=\"http://www.example.org/versions\"\n"
        "           schemaLocation=\"http://www.example.org/xsd/versions.xsd\"/>\n"
        "<xs:element name=\"score-partwise\">\n"
        " <xs:complexType>\n"
        "  <xs:sequence>\n"
        "   <xs:any minOccurs=\"0\" maxOccurs=\"unbounded\" processContents=\"skip\"/>\n"
        "  </xs:sequence>\n"
        "  <xs:attribute name=\"version\" type=\"v:version\" use=\"required\"/>\n"
        " </xs:complexType>\n"
        "</xs:element>\n"
        "</xs:schema>\n");
    const SchemaValidator importing(path);
    auto xml = scoreXml("<measure number=\"1\"/>");
    QVERIFY(importing.validate(DocumentLoader::load(writeFile("version31.xml", xml)), nullptr));
    xml.replace("version=\"3.1\"", "version=\"9.9\"");
    QVERIFY(!importing.validate(DocumentLoader::load(writeFile("version99.xml", xml)), nullptr));
}

QTEST_GUILESS_MAIN(TestSchemaValidator)

#include "tst_schemavalidator.moc"
