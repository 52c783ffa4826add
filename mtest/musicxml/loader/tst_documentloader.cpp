/****************************************************************************
**
** tst_documentloader.cpp -- tests for class DocumentLoader
**
****************************************************************************/

#include <QtTest/QtTest>

#include <private/qzipwriter_p.h>

#include "documentloader.h"
#include "importerrors.h"
#include "testutils.h"

#define DIR QString("musicxml/loader/")

using namespace SheetMusic;

//---------------------------------------------------------
//   TestDocumentLoader
//---------------------------------------------------------

class TestDocumentLoader : public QObject, public MTest
{
    Q_OBJECT

    QByteArray hello() const;
    QString writeContainer(const QString& name, const QList<QPair<QString, QByteArray>>& entries) const;

private slots:
    void initTestCase();
    void rawFile();
    void container();
    void containerSkipsMetadata();
    void containerWithoutScore();
    void corruptContainer();
    void missingFile();
    void emptyFile();
    void notWellFormed();
};

void TestDocumentLoader::initTestCase()
{
    initMTest();
}

QByteArray TestDocumentLoader::hello() const
{
    QFile file(root + "/" + DIR + "hello.xml");
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

//---------------------------------------------------------
//   writeContainer
//   a compressed MusicXML file holding the given entries in order
//---------------------------------------------------------

QString TestDocumentLoader::writeContainer(const QString& name, const QList<QPair<QString, QByteArray>>& entries) const
{
    const auto path = tmp.filePath(name);
    QZipWriter zip(path);
    zip.setCompressionPolicy(QZipWriter::AlwaysCompress);
    for (const auto& entry : entries) {
        zip.addFile(entry.first, entry.second);
    }
    zip.close();
    return path;
}

void TestDocumentLoader::rawFile()
{
    const auto path = root + "/" + DIR + "hello.xml";
    QVERIFY(!DocumentLoader::isContainer(path));
    const auto document = DocumentLoader::load(path);
    QCOMPARE(document.path, path);
    QCOMPARE(document.content, hello());
}

void TestDocumentLoader::container()
{
    const auto path = writeContainer("hello.mxl", { { "hello.xml", hello() } });
    QVERIFY(DocumentLoader::isContainer(path));
    const auto document = DocumentLoader::load(path);
    QCOMPARE(document.content, hello());
}

void TestDocumentLoader::containerSkipsMetadata()
{
    const QByteArray container {
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<container><rootfiles><rootfile full-path=\"score.xml\"/></rootfiles></container>\n"
    };
    const auto path = writeContainer("meta.mxl", {
        { "META-INF/container.xml", container },
        { "readme.txt", "not a score" },
        { "score.xml", hello() },
        { "other.xml", "<other/>" }
    });
    const auto document = DocumentLoader::load(path);
    QCOMPARE(document.content, hello());
}

void TestDocumentLoader::containerWithoutScore()
{
    const auto path = writeContainer("noscore.mxl", {
        { "META-INF/container.xml", "<container/>" },
        { "readme.txt", "no score here" }
    });
    QVERIFY_EXCEPTION_THROWN(DocumentLoader::load(path), FormatError);
}

void TestDocumentLoader::corruptContainer()
{
    QByteArray content("PK\x03\x04", 4);
    content += "this is not a zip archive";
    const auto path = writeFile("corrupt.mxl", content);
    QVERIFY(DocumentLoader::isContainer(path));
    QVERIFY_EXCEPTION_THROWN(DocumentLoader::load(path), FormatError);
}

void TestDocumentLoader::missingFile()
{
    QVERIFY_EXCEPTION_THROWN(DocumentLoader::load(tmp.filePath("missing.xml")), FileOpenError);
}

void TestDocumentLoader::emptyFile()
{
    const auto path = writeFile("empty.xml", QByteArray());
    QVERIFY_EXCEPTION_THROWN(DocumentLoader::load(path), FormatError);
}

void TestDocumentLoader::notWellFormed()
{
    const auto path = writeFile("broken.xml", "<?xml version=\"1.0\"?>\n<score-partwise>\n<part>\n</score-partwise>\n");
    try {
        DocumentLoader::load(path);
        QFAIL("no FormatError thrown");
    }
    catch (const FormatError& e) {
        QCOMPARE(e.path(), path);
        QVERIFY(e.message().startsWith("not well-formed xml at line"));
    }
}

QTEST_GUILESS_MAIN(TestDocumentLoader)

#include "tst_documentloader.moc"
