#ifndef SHEETMUSIC_SCHEMAVALIDATOR_H
#define SHEETMUSIC_SCHEMAVALIDATOR_H

#include <memory>

#include <QList>
#include <QString>

#include <xercesc/framework/XMLGrammarPool.hpp>
#include <xercesc/util/PlatformUtils.hpp>

#include "importerrors.h"

namespace SheetMusic {

struct MxmlDocument;

// keeps the Xerces-C library initialized while a validator exists

class XercesInitializer
{
public:
    XercesInitializer() { xercesc::XMLPlatformUtils::Initialize(); }
    ~XercesInitializer() { xercesc::XMLPlatformUtils::Terminate(); }
    XercesInitializer(const XercesInitializer&) = delete;
    XercesInitializer& operator=(const XercesInitializer&) = delete;
};

//---------------------------------------------------------
//   SchemaValidator
//---------------------------------------------------------

/**
 Validates documents against a MusicXML schema.
 The schema is compiled once into a locked grammar pool at construction
 (throws ResourceError if that fails), each validate() uses its own
 reader on the shared pool.
 */

class SchemaValidator
{
public:
    explicit SchemaValidator(const QString& schemaPath);
    SchemaValidator(const SchemaValidator&) = delete;
    SchemaValidator& operator=(const SchemaValidator&) = delete;

    QString schemaPath() const { return _schemaPath; }
    bool validate(const MxmlDocument& document, QList<ValidationMessage>* log) const;
    static QList<ValidationMessage> filterFromErrors(const QList<ValidationMessage>& log);

private:
    void loadSchema();

    XercesInitializer _xerces;     // first in, last out
    QString _schemaPath;
    std::unique_ptr<xercesc::XMLGrammarPool> _grammarPool;
};

} // namespace SheetMusic

#endif // SHEETMUSIC_SCHEMAVALIDATOR_H
