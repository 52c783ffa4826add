/****************************************************************************
**
** mxmldata.cpp -- implementation of the MusicXML element tree
**
****************************************************************************/

#include "mxmldata.h"

namespace SheetMusic {
namespace MusicXML {

Attributes::Attributes()
    : Element(ElementType::ATTRIBUTES)
{
    // nothing
}

Backup::Backup()
    : Element(ElementType::BACKUP)
{
    // nothing
}

Barline::Barline()
    : Element(ElementType::BARLINE)
{
    // nothing
}

Element::Element(const ElementType& p_elementType)
{
    elementType = p_elementType;
}

Forward::Forward()
    : Element(ElementType::FORWARD)
{
    // nothing
}

const Print* Measure::print() const
{
    for (const auto& element : elements) {
        if (element->elementType == ElementType::PRINT) {
            return static_cast<const Print*>(element.get());
        }
    }
    return nullptr;
}

std::optional<int> Measure::staves() const
{
    for (const auto& element : elements) {
        if (element->elementType == ElementType::ATTRIBUTES) {
            const auto attributes = static_cast<const Attributes*>(element.get());
            if (attributes->staves) {
                return attributes->staves;
            }
        }
    }
    return {};
}

Note::Note()
    : Element(ElementType::NOTE)
{
    // nothing
}

Print::Print()
    : Element(ElementType::PRINT)
{
    // nothing
}

// MusicXML yes-no values, compared case-insensitively

bool isYes(const QString& value)
{
    return value.compare("yes", Qt::CaseInsensitive) == 0;
}

} // namespace MusicXML
} // namespace SheetMusic
