#pragma once

#include <QDateTime>
#include <QString>
#include <memory>
#include <vector>

#include "timeslot/data/Occasion.hpp"

namespace timeslot {
namespace core {

// One occasion laid out in one column. The same instance is referenced by
// every cell the occasion covers, so a visual class set here shows in all
// of them.
class Placement
{
public:
    Placement(data::Occasion occasion, int column, QDateTime startKey);

    const data::Occasion &occasion() const { return m_occasion; }
    int column() const { return m_column; }
    // Key of the row holding the first, non-continuation cell.
    const QDateTime &startKey() const { return m_startKey; }

    const QString &visualClass() const { return m_visualClass; }
    void setVisualClass(QString visualClass);

private:
    data::Occasion m_occasion;
    int m_column = 0;
    QDateTime m_startKey;
    QString m_visualClass;
};

struct GridCell
{
    std::shared_ptr<Placement> placement;
    bool continuation = false;

    bool isEmpty() const { return !placement; }
};

struct TimeslotRow
{
    QDateTime key;
    std::vector<GridCell> cells;
};

class Grid
{
public:
    Grid() = default;
    Grid(std::vector<TimeslotRow> rows, int columnCount);

    const std::vector<TimeslotRow> &rows() const { return m_rows; }
    int rowCount() const { return static_cast<int>(m_rows.size()); }
    int columnCount() const { return m_columnCount; }
    const GridCell &cell(int row, int column) const;

    // Distinct placements in row-then-column order of first appearance.
    std::vector<std::shared_ptr<Placement>> placements() const;

private:
    std::vector<TimeslotRow> m_rows;
    int m_columnCount = 0;
};

} // namespace core
} // namespace timeslot
