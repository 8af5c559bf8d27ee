#pragma once

#include <QString>

#include "timeslot/core/Grid.hpp"

namespace timeslot {
namespace ui {

struct PresentationUnit
{
    QString label;
    QString link;
    QString cssClass;
};

class PlacementFormatter
{
public:
    virtual ~PlacementFormatter() = default;

    // Only called for occupied cells.
    virtual PresentationUnit format(const core::GridCell &cell) const = 0;
};

// Title and link on the first cell of an occasion, a "^" marker on its
// continuation cells.
class DefaultPlacementFormatter : public PlacementFormatter
{
public:
    static constexpr auto ContinuationMarker = "^";

    // %1 is replaced by the event id, %2 by the occasion id.
    explicit DefaultPlacementFormatter(QString linkTemplate = QStringLiteral("/events/%1/%2/"));

    PresentationUnit format(const core::GridCell &cell) const override;

private:
    QString m_linkTemplate;
};

} // namespace ui
} // namespace timeslot
