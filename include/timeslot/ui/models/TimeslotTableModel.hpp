#pragma once

#include <QAbstractTableModel>
#include <QString>

#include "timeslot/core/Grid.hpp"

namespace timeslot {
namespace ui {

class PlacementFormatter;

class TimeslotTableModel : public QAbstractTableModel
{
    Q_OBJECT

public:
    enum Roles
    {
        LinkRole = Qt::UserRole + 1,
        CssClassRole,
        ContinuationRole,
    };

    explicit TimeslotTableModel(const PlacementFormatter &formatter, QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role) const override;

    void setGrid(core::Grid grid);
    const core::Grid &grid() const;
    void setTimeFormat(QString format);
    const core::Placement *placementAt(const QModelIndex &index) const;

private:
    const core::GridCell *cellAt(const QModelIndex &index) const;

    const PlacementFormatter &m_formatter;
    core::Grid m_grid;
    QString m_timeFormat = QStringLiteral("%I:%M %p");
};

} // namespace ui
} // namespace timeslot
