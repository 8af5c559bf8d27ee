#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>
#include <QUuid>
#include <vector>

#include "timeslot/data/Event.hpp"
#include "timeslot/data/Occasion.hpp"

namespace timeslot {
namespace data {

// Events and their occasions kept in one iCalendar-style text file. Events
// are VEVENT components, occasions X-TIMESLOT-OCCASION components pointing at
// their event through RELATED-TO. Every change, or batch of occasions,
// rewrites the file atomically.
class FileScheduleStorage
{
public:
    explicit FileScheduleStorage(QString filePath);
    ~FileScheduleStorage() = default;

    const QHash<QUuid, Event> &events() const;
    const QHash<QUuid, Occasion> &occasions() const;
    // Number of times the file has been committed by this instance.
    int writeCount() const;

    Event addOrUpdateEvent(Event event);
    // Drops the event's occasions as well.
    bool removeEvent(const QUuid &id);

    Occasion addOrUpdateOccasion(Occasion occasion);
    std::vector<Occasion> addOrUpdateOccasions(std::vector<Occasion> occasions);
    int removeOccasions(const QUuid &eventId);

private:
    void load();
    void save() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

    QString m_filePath;
    QHash<QUuid, Event> m_events;
    QHash<QUuid, Occasion> m_occasions;
    mutable int m_writeCount = 0;
};

} // namespace data
} // namespace timeslot
