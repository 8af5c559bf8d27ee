#include "timeslot/ui/models/TimeslotTableModel.hpp"

#include "timeslot/core/TimeFormat.hpp"
#include "timeslot/ui/PlacementFormatter.hpp"

namespace timeslot {
namespace ui {

TimeslotTableModel::TimeslotTableModel(const PlacementFormatter &formatter, QObject *parent)
    : QAbstractTableModel(parent)
    , m_formatter(formatter)
{
}

int TimeslotTableModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_grid.rowCount();
}

int TimeslotTableModel::columnCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_grid.columnCount();
}

QVariant TimeslotTableModel::data(const QModelIndex &index, int role) const
{
    const core::GridCell *cell = cellAt(index);
    if (!cell || cell->isEmpty()) {
        return {};
    }

    switch (role) {
    case Qt::DisplayRole:
        return m_formatter.format(*cell).label;
    case Qt::ToolTipRole: {
        const auto &occasion = cell->placement->occasion();
        return tr("%1 (%2 - %3)")
            .arg(occasion.title,
                 core::formatTime(occasion.start.time(), m_timeFormat),
                 core::formatTime(occasion.end.time(), m_timeFormat));
    }
    case LinkRole:
        return m_formatter.format(*cell).link;
    case CssClassRole:
        return m_formatter.format(*cell).cssClass;
    case ContinuationRole:
        return cell->continuation;
    default:
        return {};
    }
}

QVariant TimeslotTableModel::headerData(int section, Qt::Orientation orientation, int role) const
{
    if (role != Qt::DisplayRole) {
        return {};
    }
    if (orientation == Qt::Vertical) {
        if (section < 0 || section >= m_grid.rowCount()) {
            return {};
        }
        return core::formatTime(m_grid.rows()[static_cast<std::size_t>(section)].key.time(), m_timeFormat);
    }
    return QString::number(section + 1);
}

void TimeslotTableModel::setGrid(core::Grid grid)
{
    beginResetModel();
    m_grid = std::move(grid);
    endResetModel();
}

const core::Grid &TimeslotTableModel::grid() const
{
    return m_grid;
}

void TimeslotTableModel::setTimeFormat(QString format)
{
    m_timeFormat = std::move(format);
    if (m_grid.rowCount() > 0) {
        emit headerDataChanged(Qt::Vertical, 0, m_grid.rowCount() - 1);
    }
}

const core::Placement *TimeslotTableModel::placementAt(const QModelIndex &index) const
{
    const core::GridCell *cell = cellAt(index);
    if (!cell || cell->isEmpty()) {
        return nullptr;
    }
    return cell->placement.get();
}

const core::GridCell *TimeslotTableModel::cellAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_grid.rowCount() || index.column() < 0
        || index.column() >= m_grid.columnCount()) {
        return nullptr;
    }
    return &m_grid.cell(index.row(), index.column());
}

} // namespace ui
} // namespace timeslot
