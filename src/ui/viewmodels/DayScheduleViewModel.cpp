#include "timeslot/ui/viewmodels/DayScheduleViewModel.hpp"

#include "timeslot/core/EventScheduler.hpp"
#include "timeslot/core/VisualClassCycler.hpp"

namespace timeslot {
namespace ui {

DayScheduleViewModel::DayScheduleViewModel(core::EventScheduler &scheduler, QObject *parent)
    : QObject(parent)
    , m_scheduler(scheduler)
    , m_knownEventTypes(scheduler.settings().knownEventTypes)
{
}

void DayScheduleViewModel::setDate(const QDate &date)
{
    if (!date.isValid()) {
        return;
    }
    m_date = date;
}

QDate DayScheduleViewModel::date() const
{
    return m_date;
}

void DayScheduleViewModel::setKnownEventTypes(QStringList eventTypes)
{
    m_knownEventTypes = std::move(eventTypes);
}

void DayScheduleViewModel::refresh()
{
    if (!m_date.isValid()) {
        return;
    }
    // Fresh cycler per render: classes restart at "even" for every day.
    core::VisualClassCycler cycler(m_knownEventTypes);
    m_grid = m_scheduler.buildDayGrid(m_date, &cycler);
    emit gridChanged(m_grid);
}

const core::Grid &DayScheduleViewModel::grid() const
{
    return m_grid;
}

} // namespace ui
} // namespace timeslot
