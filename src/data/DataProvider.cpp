#include "timeslot/data/DataProvider.hpp"

#include "timeslot/core/Logging.hpp"
#include "timeslot/data/FileEventRepository.hpp"
#include "timeslot/data/FileOccasionRepository.hpp"
#include "timeslot/data/FileScheduleStorage.hpp"

#include <QDir>
#include <QStandardPaths>

namespace timeslot {
namespace data {

namespace {
QString defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/timeslot-planner");
    }
    QDir dir(storageFolder);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("schedule.ics"));
}
} // namespace

DataProvider::DataProvider(QString filePath)
    : m_filePath(filePath.isEmpty() ? defaultStoragePath() : std::move(filePath))
{
    qCDebug(lcStorage) << "using schedule file" << m_filePath;
    m_storage = std::make_shared<FileScheduleStorage>(m_filePath);
    m_eventRepository = std::make_unique<FileEventRepository>(m_storage);
    m_occasionRepository = std::make_unique<FileOccasionRepository>(m_storage);
}

DataProvider::~DataProvider() = default;

EventRepository &DataProvider::eventRepository()
{
    return *m_eventRepository;
}

OccasionRepository &DataProvider::occasionRepository()
{
    return *m_occasionRepository;
}

const QString &DataProvider::filePath() const
{
    return m_filePath;
}

} // namespace data
} // namespace timeslot
