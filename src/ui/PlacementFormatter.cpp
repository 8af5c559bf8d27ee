#include "timeslot/ui/PlacementFormatter.hpp"

namespace timeslot {
namespace ui {

DefaultPlacementFormatter::DefaultPlacementFormatter(QString linkTemplate)
    : m_linkTemplate(std::move(linkTemplate))
{
}

PresentationUnit DefaultPlacementFormatter::format(const core::GridCell &cell) const
{
    PresentationUnit unit;
    if (cell.isEmpty()) {
        return unit;
    }
    const auto &placement = *cell.placement;
    unit.cssClass = placement.visualClass();
    if (cell.continuation) {
        unit.label = QString::fromLatin1(ContinuationMarker);
        return unit;
    }
    const auto &occasion = placement.occasion();
    unit.label = occasion.title;
    unit.link = m_linkTemplate.arg(occasion.eventId.toString(QUuid::WithoutBraces),
                                   occasion.id.toString(QUuid::WithoutBraces));
    return unit;
}

} // namespace ui
} // namespace timeslot
