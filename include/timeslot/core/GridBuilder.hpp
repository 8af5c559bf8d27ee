#pragma once

#include <QDate>
#include <vector>

#include "timeslot/core/Grid.hpp"
#include "timeslot/core/GridConfig.hpp"
#include "timeslot/data/Occasion.hpp"

namespace timeslot {
namespace core {

class VisualClassCycler;

/*
 * Lays occasions out on the time slots of one day.
 *
 * Rows run from day + startTime to day + startTime + spanDuration, both ends
 * included, one per slotInterval. Occasions are taken in (start, end) order
 * and each claims the lowest free column of its first row, then keeps that
 * column in every following row it covers. Columns grow as needed; the grid
 * is never narrower than minColumns.
 *
 * Occasions that end before the grid starts, or whose (clamped) start is not
 * a slot key, are left out. This is a rendering policy, not an error.
 */
class GridBuilder
{
public:
    // Throws InvalidConfigError before any row is built.
    Grid build(const QDate &day,
               const GridConfig &config,
               std::vector<data::Occasion> occasions,
               VisualClassCycler *cycler = nullptr) const;
};

} // namespace core
} // namespace timeslot
