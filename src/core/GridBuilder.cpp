#include "timeslot/core/GridBuilder.hpp"

#include "timeslot/core/Logging.hpp"
#include "timeslot/core/VisualClassCycler.hpp"

#include <algorithm>
#include <map>

namespace timeslot {
namespace core {

Grid GridBuilder::build(const QDate &day,
                        const GridConfig &config,
                        std::vector<data::Occasion> occasions,
                        VisualClassCycler *cycler) const
{
    config.validate();

    const QDateTime gridStart = config.gridStart(day);
    const QDateTime gridEnd = config.gridEnd(day);

    const std::vector<QDateTime> keys = config.slotKeys(day);
    std::map<QDateTime, std::size_t> rowIndex;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        rowIndex.emplace(keys[i], i);
    }
    // Occupied cells per row, keyed by column.
    std::vector<std::map<int, GridCell>> slots(keys.size());

    std::stable_sort(occasions.begin(), occasions.end());

    for (const auto &occasion : occasions) {
        if (occasion.end <= gridStart) {
            qCDebug(lcGrid) << "skipping" << occasion.title << "ending" << occasion.end
                            << "before grid start" << gridStart;
            continue;
        }

        const QDateTime rowKey = occasion.start > gridStart ? occasion.start : gridStart;
        const auto found = rowIndex.find(rowKey);
        if (found == rowIndex.end()) {
            qCDebug(lcGrid) << "skipping" << occasion.title << "starting" << rowKey
                            << "off the" << config.slotInterval.count() << "minute slot boundaries";
            continue;
        }

        auto &firstRow = slots[found->second];
        int column = 0;
        while (firstRow.count(column) > 0) {
            ++column;
        }

        auto placement = std::make_shared<Placement>(occasion, column, rowKey);
        firstRow[column] = GridCell{ placement, false };

        // The last row is inclusive: an occasion ending on the grid end shows there too.
        for (std::size_t row = found->second + 1; row < keys.size(); ++row) {
            const QDateTime &key = keys[row];
            const bool covered = key < occasion.end || (key == gridEnd && occasion.end == gridEnd);
            if (!covered) {
                break;
            }
            slots[row][column] = GridCell{ placement, true };
        }
    }

    int columnCount = config.minColumns;
    for (const auto &slot : slots) {
        if (!slot.empty()) {
            columnCount = std::max(columnCount, slot.rbegin()->first + 1);
        }
    }

    std::vector<TimeslotRow> rows;
    rows.reserve(keys.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        TimeslotRow row;
        row.key = keys[i];
        row.cells.resize(static_cast<std::size_t>(columnCount));
        for (const auto &entry : slots[i]) {
            row.cells[static_cast<std::size_t>(entry.first)] = entry.second;
        }
        rows.push_back(std::move(row));
    }

    if (cycler) {
        for (const auto &row : rows) {
            for (const auto &cell : row.cells) {
                if (cell.isEmpty() || !cell.placement->visualClass().isEmpty()) {
                    continue;
                }
                cell.placement->setVisualClass(
                    cycler->next(cell.placement->column(), cell.placement->occasion().eventType));
            }
        }
    }

    qCDebug(lcGrid) << "built grid for" << day << "with" << rows.size() << "rows and" << columnCount
                    << "columns";
    return Grid(std::move(rows), columnCount);
}

} // namespace core
} // namespace timeslot
