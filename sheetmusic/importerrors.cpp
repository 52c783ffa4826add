/****************************************************************************
**
** importerrors.cpp -- implementation of the import error classes
**
****************************************************************************/

#include "importerrors.h"

namespace SheetMusic {

static QString locatedText(const QString& path, const QString& message)
{
    return QString("%1: %2").arg(path, message);
}

ImportError::ImportError(const QString& path, const QString& message)
    : std::runtime_error(locatedText(path, message).toStdString()), _path(path), _message(message)
{
    // nothing
}

QString ValidationMessage::toString() const
{
    return QString("%1:%2: %3").arg(line).arg(column).arg(description);
}

static QString validationSummary(const QList<ValidationMessage>& errors)
{
    QString result { "document does not match the MusicXML schema" };
    for (const auto& error : errors) {
        result += "\n  " + error.toString();
    }
    return result;
}

ValidateError::ValidateError(const QString& path, const QList<ValidationMessage>& errors)
    : ImportError(path, validationSummary(errors)), _errors(errors)
{
    // nothing
}

MalformedInputError::MalformedInputError(const QString& path, qint64 line, const QString& message)
    : ImportError(path, line > 0 ? QString("line %1: %2").arg(line).arg(message) : message), _line(line)
{
    // nothing
}

} // namespace SheetMusic
