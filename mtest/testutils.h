#ifndef SHEETMUSIC_TESTUTILS_H
#define SHEETMUSIC_TESTUTILS_H

#include <memory>

#include <QByteArray>
#include <QString>
#include <QTemporaryDir>

#include "mxmllogger.h"
#include "preferences.h"

namespace SheetMusic {
class Sheet;
}

//---------------------------------------------------------
//   MTest
//---------------------------------------------------------

class MTest
{
protected:
    QString root;                       // root of the test data
    SheetMusic::MxmlLogger logger;
    QTemporaryDir tmp;                  // scratch files, removed at exit

    void initMTest();
    SheetMusic::Preferences testPreferences(bool validate = true) const;
    std::unique_ptr<SheetMusic::Sheet> readSheet(const QString& name, bool validate = true) const;
    QString writeFile(const QString& name, const QByteArray& content) const;
    static QByteArray scoreXml(const QByteArray& measures, const QByteArray& defaults = QByteArray());
};

#endif // SHEETMUSIC_TESTUTILS_H
