#include "timeslot/core/VisualClassCycler.hpp"

namespace timeslot {
namespace core {

VisualClassCycler::VisualClassCycler(QStringList knownEventTypes)
    : m_knownEventTypes(std::move(knownEventTypes))
{
}

QString VisualClassCycler::next(int column, const QString &eventType)
{
    const QStringList classes = palette(eventType);
    auto &counter = m_counters[{ column, eventType }];
    return classes.at(static_cast<int>(counter.next(static_cast<unsigned>(classes.size()))));
}

QStringList VisualClassCycler::palette(const QString &eventType) const
{
    if (!eventType.isEmpty() && m_knownEventTypes.contains(eventType)) {
        return { QStringLiteral("evt-%1-even").arg(eventType), QStringLiteral("evt-%1-odd").arg(eventType) };
    }
    return { QStringLiteral("evt-even"), QStringLiteral("evt-odd") };
}

} // namespace core
} // namespace timeslot
