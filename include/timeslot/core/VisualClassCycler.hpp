#pragma once

#include <QString>
#include <QStringList>
#include <map>
#include <utility>

namespace timeslot {
namespace core {

// Alternates visual classes per grid column and event type. Known event
// types cycle through "evt-<abbr>-even" / "evt-<abbr>-odd", everything else
// through "evt-even" / "evt-odd".
class VisualClassCycler
{
public:
    explicit VisualClassCycler(QStringList knownEventTypes = {});

    QString next(int column, const QString &eventType);
    QStringList palette(const QString &eventType) const;

private:
    struct Counter
    {
        unsigned nextIndex = 0;

        unsigned next(unsigned paletteSize) { return nextIndex++ % paletteSize; }
    };

    QStringList m_knownEventTypes;
    std::map<std::pair<int, QString>, Counter> m_counters;
};

} // namespace core
} // namespace timeslot
