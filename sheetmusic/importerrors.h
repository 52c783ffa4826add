#ifndef SHEETMUSIC_IMPORTERRORS_H
#define SHEETMUSIC_IMPORTERRORS_H

#include <stdexcept>

#include <QList>
#include <QString>
#include <QtGlobal>

namespace SheetMusic {

/**
 Base of all errors raised while importing a document.
 Carries the path of the document being imported.
 */

class ImportError : public std::runtime_error
{
public:
    ImportError(const QString& path, const QString& message);
    QString path() const { return _path; }
    QString message() const { return _message; }

private:
    QString _path;
    QString _message;
};

class FileOpenError : public ImportError
{
public:
    using ImportError::ImportError;
};

// container or xml malformed, or no content at all
class FormatError : public ImportError
{
public:
    using ImportError::ImportError;
};

class ResourceError : public ImportError
{
public:
    using ImportError::ImportError;
};

struct ValidationMessage {
    QtMsgType type { QtFatalMsg };
    QString description;
    qint64 line { 0 };
    qint64 column { 0 };
    bool isError() const { return type != QtWarningMsg && type != QtDebugMsg && type != QtInfoMsg; }
    QString toString() const;
};

class ValidateError : public ImportError
{
public:
    ValidateError(const QString& path, const QList<ValidationMessage>& errors);
    const QList<ValidationMessage>& errors() const { return _errors; }

private:
    QList<ValidationMessage> _errors;
};

/**
 Structural fault the schema cannot express, e.g. a beam continued
 without having been begun or a layout value missing for the chosen
 placement. The line refers to the offending element (0 if unknown).
 */

class MalformedInputError : public ImportError
{
public:
    MalformedInputError(const QString& path, qint64 line, const QString& message);
    qint64 line() const { return _line; }

private:
    qint64 _line { 0 };
};

} // namespace SheetMusic

#endif // SHEETMUSIC_IMPORTERRORS_H
