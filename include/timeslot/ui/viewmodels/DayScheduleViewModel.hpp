#pragma once

#include <QDate>
#include <QObject>
#include <QStringList>

#include "timeslot/core/Grid.hpp"

namespace timeslot {
namespace core {
class EventScheduler;
}

namespace ui {

class DayScheduleViewModel : public QObject
{
    Q_OBJECT

public:
    DayScheduleViewModel(core::EventScheduler &scheduler, QObject *parent = nullptr);

    void setDate(const QDate &date);
    QDate date() const;
    void setKnownEventTypes(QStringList eventTypes);
    void refresh();
    const core::Grid &grid() const;

signals:
    void gridChanged(const core::Grid &grid);

private:
    core::EventScheduler &m_scheduler;
    QDate m_date;
    QStringList m_knownEventTypes;
    core::Grid m_grid;
};

} // namespace ui
} // namespace timeslot
