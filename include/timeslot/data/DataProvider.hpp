#pragma once

#include <memory>
#include <QString>

namespace timeslot {
namespace data {

class EventRepository;
class OccasionRepository;
class FileScheduleStorage;

class DataProvider
{
public:
    // An empty path selects "schedule.ics" in the application data folder.
    explicit DataProvider(QString filePath = QString());
    ~DataProvider();

    EventRepository &eventRepository();
    OccasionRepository &occasionRepository();
    const QString &filePath() const;

private:
    QString m_filePath;
    std::shared_ptr<FileScheduleStorage> m_storage;
    std::unique_ptr<EventRepository> m_eventRepository;
    std::unique_ptr<OccasionRepository> m_occasionRepository;
};

} // namespace data
} // namespace timeslot
