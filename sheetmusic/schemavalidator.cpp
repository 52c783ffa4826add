/****************************************************************************
**
** schemavalidator.cpp -- implementation of class SchemaValidator
**
****************************************************************************/

#include <algorithm>

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/internal/XMLGrammarPoolImpl.hpp>
#include <xercesc/sax/ErrorHandler.hpp>
#include <xercesc/sax/SAXParseException.hpp>
#include <xercesc/sax2/DefaultHandler.hpp>
#include <xercesc/sax2/SAX2XMLReader.hpp>
#include <xercesc/sax2/XMLReaderFactory.hpp>
#include <xercesc/util/OutOfMemoryException.hpp>
#include <xercesc/util/XMLEntityResolver.hpp>
#include <xercesc/util/XMLResourceIdentifier.hpp>
#include <xercesc/util/XMLException.hpp>
#include <xercesc/util/XMLUni.hpp>
#include <xercesc/validators/common/Grammar.hpp>

#include "documentloader.h"
#include "schemavalidator.h"

XERCES_CPP_NAMESPACE_USE

// the schema resource lives in the static library
static void initSchemaResource()
{
    Q_INIT_RESOURCE(schema);
}

namespace SheetMusic {

static QString toQString(const XMLCh* text)
{
    if (!text) {
        return QString();
    }
    return QString::fromUtf16(reinterpret_cast<const ushort*>(text));
}

//---------------------------------------------------------
//   ValidationHandler
//---------------------------------------------------------

/**
 Collects the parser's warnings and errors, parsing continues after
 (non-fatal) errors so that all problems are reported.
 */

class ValidationHandler : public DefaultHandler
{
public:
    void warning(const SAXParseException& e) override { add(QtWarningMsg, e); }
    void error(const SAXParseException& e) override { add(QtCriticalMsg, e); }
    void fatalError(const SAXParseException& e) override { add(QtFatalMsg, e); }
    void resetErrors() override { _messages.clear(); }
    void add(QtMsgType type, const QString& description, qint64 line = 0, qint64 column = 0);
    const QList<ValidationMessage>& messages() const { return _messages; }
    bool hasErrors() const;

private:
    void add(QtMsgType type, const SAXParseException& e);
    QList<ValidationMessage> _messages;
};

void ValidationHandler::add(QtMsgType type, const QString& description, qint64 line, qint64 column)
{
    ValidationMessage message;
    message.type = type;
    message.description = description;
    message.line = line;
    message.column = column;
    _messages.append(message);
}

void ValidationHandler::add(QtMsgType type, const SAXParseException& e)
{
    add(type, toQString(e.getMessage()), static_cast<qint64>(e.getLineNumber()),
        static_cast<qint64>(e.getColumnNumber()));
}

bool ValidationHandler::hasErrors() const
{
    for (const auto& message : _messages) {
        if (message.isError()) {
            return true;
        }
    }
    return false;
}

//---------------------------------------------------------
//   SchemaResolver
//---------------------------------------------------------

/**
 Serves the schema documents imported or included by a schema from
 the directory of that schema, looked up by file name. This works for
 the bundled resource as well as for a copy of the official MusicXML
 schema, whose imports of xml.xsd and xlink.xsd name web locations.
 Anything not found there is left to the default resolution.
 */

class SchemaResolver : public XMLEntityResolver
{
public:
    explicit SchemaResolver(const QString& schemaPath)
        : _dir(QFileInfo(schemaPath).dir()) {}
    InputSource* resolveEntity(XMLResourceIdentifier* resource) override;

private:
    QDir _dir;
};

InputSource* SchemaResolver::resolveEntity(XMLResourceIdentifier* resource)
{
    switch (resource->getResourceIdentifierType()) {
    case XMLResourceIdentifier::SchemaGrammar:
    case XMLResourceIdentifier::SchemaImport:
    case XMLResourceIdentifier::SchemaInclude:
    case XMLResourceIdentifier::SchemaRedefine:
        break;
    default:
        return nullptr;
    }
    auto location = toQString(resource->getSchemaLocation());
    if (location.isEmpty()) {
        location = toQString(resource->getSystemId());
    }
    const auto name = location.section('/', -1);
    if (name.isEmpty() || !_dir.exists(name)) {
        return nullptr;
    }
    QFile file(_dir.filePath(name));
    if (!file.open(QIODevice::ReadOnly)) {
        return nullptr;
    }
    const auto content = file.readAll();
    // the source adopts the buffer
    auto buffer = new XMLByte[static_cast<size_t>(content.size())];
    std::copy(content.constBegin(), content.constEnd(), buffer);
    const QByteArray systemId = file.fileName().toUtf8();
    return new MemBufInputSource(buffer, static_cast<XMLSize_t>(content.size()), systemId.constData(), true);
}

//---------------------------------------------------------
//   createReader
//---------------------------------------------------------

// a validating reader that only accepts the grammar from the pool

static std::unique_ptr<SAX2XMLReader> createReader(XMLGrammarPool* pool)
{
    std::unique_ptr<SAX2XMLReader> reader(XMLReaderFactory::createXMLReader(XMLPlatformUtils::fgMemoryManager, pool));
    reader->setFeature(XMLUni::fgSAX2CoreNameSpaces, true);
    reader->setFeature(XMLUni::fgSAX2CoreValidation, true);
    reader->setFeature(XMLUni::fgXercesDynamic, false);
    reader->setFeature(XMLUni::fgXercesSchema, true);
    reader->setFeature(XMLUni::fgXercesSchemaFullChecking, true);
    reader->setFeature(XMLUni::fgXercesUseCachedGrammarInParse, true);
    reader->setFeature(XMLUni::fgXercesLoadSchema, false);
    reader->setFeature(XMLUni::fgXercesLoadExternalDTD, false);
    reader->setFeature(XMLUni::fgXercesSkipDTDValidation, true);
    return reader;
}

//---------------------------------------------------------
//   SchemaValidator
//---------------------------------------------------------

SchemaValidator::SchemaValidator(const QString& schemaPath)
    : _schemaPath(schemaPath)
{
    initSchemaResource();
    loadSchema();
}

void SchemaValidator::loadSchema()
{
    QFile file(_schemaPath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ResourceError(_schemaPath, QString("cannot open schema: %1").arg(file.errorString()));
    }
    const auto schema = file.readAll();

    _grammarPool.reset(new XMLGrammarPoolImpl(XMLPlatformUtils::fgMemoryManager));
    ValidationHandler handler;
    SchemaResolver resolver(_schemaPath);
    Grammar* grammar { nullptr };
    try {
        auto reader = createReader(_grammarPool.get());
        reader->setErrorHandler(&handler);
        reader->setXMLEntityResolver(&resolver);
        const QByteArray systemId = _schemaPath.toUtf8();
        MemBufInputSource source(reinterpret_cast<const XMLByte*>(schema.constData()),
                                 static_cast<XMLSize_t>(schema.size()), systemId.constData());
        grammar = reader->loadGrammar(source, Grammar::SchemaGrammarType, true);
    }
    catch (const XMLException& e) {
        throw ResourceError(_schemaPath, QString("cannot load schema: %1").arg(toQString(e.getMessage())));
    }
    catch (const SAXException& e) {
        throw ResourceError(_schemaPath, QString("cannot load schema: %1").arg(toQString(e.getMessage())));
    }
    if (!grammar || handler.hasErrors()) {
        const auto errors = filterFromErrors(handler.messages());
        const auto text = errors.isEmpty() ? QString("no grammar") : errors.first().toString();
        throw ResourceError(_schemaPath, QString("invalid schema: %1").arg(text));
    }
    _grammarPool->lockPool();
}

//---------------------------------------------------------
//   validate
//---------------------------------------------------------

/**
 Validate the document content, appending every message to log
 (if not null). Returns true if no error was reported.
 */

bool SchemaValidator::validate(const MxmlDocument& document, QList<ValidationMessage>* log) const
{
    ValidationHandler handler;
    try {
        auto reader = createReader(_grammarPool.get());
        reader->setErrorHandler(&handler);
        const QByteArray systemId = document.path.toUtf8();
        MemBufInputSource source(reinterpret_cast<const XMLByte*>(document.content.constData()),
                                 static_cast<XMLSize_t>(document.content.size()), systemId.constData());
        reader->parse(source);
    }
    catch (const OutOfMemoryException&) {
        handler.add(QtFatalMsg, "out of memory");
    }
    catch (const XMLException& e) {
        handler.add(QtFatalMsg, toQString(e.getMessage()));
    }
    catch (const SAXException& e) {
        handler.add(QtFatalMsg, toQString(e.getMessage()));
    }
    if (log) {
        log->append(handler.messages());
    }
    return !handler.hasErrors();
}

QList<ValidationMessage> SchemaValidator::filterFromErrors(const QList<ValidationMessage>& log)
{
    QList<ValidationMessage> errors;
    for (const auto& message : log) {
        if (message.isError()) {
            errors.append(message);
        }
    }
    return errors;
}

} // namespace SheetMusic
