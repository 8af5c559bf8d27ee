#include "timeslot/core/Grid.hpp"

#include <algorithm>
#include <stdexcept>

namespace timeslot {
namespace core {

Placement::Placement(data::Occasion occasion, int column, QDateTime startKey)
    : m_occasion(std::move(occasion))
    , m_column(column)
    , m_startKey(std::move(startKey))
{
}

void Placement::setVisualClass(QString visualClass)
{
    m_visualClass = std::move(visualClass);
}

Grid::Grid(std::vector<TimeslotRow> rows, int columnCount)
    : m_rows(std::move(rows))
    , m_columnCount(columnCount)
{
}

const GridCell &Grid::cell(int row, int column) const
{
    if (row < 0 || row >= rowCount() || column < 0 || column >= m_columnCount) {
        throw std::out_of_range("grid cell index out of range");
    }
    return m_rows[static_cast<std::size_t>(row)].cells[static_cast<std::size_t>(column)];
}

std::vector<std::shared_ptr<Placement>> Grid::placements() const
{
    std::vector<std::shared_ptr<Placement>> result;
    for (const auto &row : m_rows) {
        for (const auto &cell : row.cells) {
            if (cell.isEmpty() || cell.continuation) {
                continue;
            }
            if (std::find(result.begin(), result.end(), cell.placement) == result.end()) {
                result.push_back(cell.placement);
            }
        }
    }
    return result;
}

} // namespace core
} // namespace timeslot
