#include "timeslot/data/FileScheduleStorage.hpp"

#include "timeslot/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

namespace timeslot {
namespace data {

namespace {
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss";
constexpr auto OCCASION_COMPONENT = "X-TIMESLOT-OCCASION";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString withBraces = QStringLiteral("{%1}").arg(value);
    QUuid id(withBraces);
    if (id.isNull()) {
        return QUuid::createUuid();
    }
    return id;
}
} // namespace

FileScheduleStorage::FileScheduleStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QHash<QUuid, Event> &FileScheduleStorage::events() const
{
    return m_events;
}

const QHash<QUuid, Occasion> &FileScheduleStorage::occasions() const
{
    return m_occasions;
}

int FileScheduleStorage::writeCount() const
{
    return m_writeCount;
}

Event FileScheduleStorage::addOrUpdateEvent(Event event)
{
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    m_events.insert(event.id, event);
    // Occasions carry a copy of the title and type.
    for (auto &occasion : m_occasions) {
        if (occasion.eventId == event.id) {
            occasion.title = event.title;
            occasion.eventType = event.eventType.abbr;
        }
    }
    save();
    return event;
}

bool FileScheduleStorage::removeEvent(const QUuid &id)
{
    if (m_events.remove(id) == 0) {
        return false;
    }
    for (auto it = m_occasions.begin(); it != m_occasions.end();) {
        if (it->eventId == id) {
            it = m_occasions.erase(it);
        } else {
            ++it;
        }
    }
    save();
    return true;
}

Occasion FileScheduleStorage::addOrUpdateOccasion(Occasion occasion)
{
    if (occasion.id.isNull()) {
        occasion.id = QUuid::createUuid();
    }
    m_occasions.insert(occasion.id, occasion);
    save();
    return occasion;
}

std::vector<Occasion> FileScheduleStorage::addOrUpdateOccasions(std::vector<Occasion> occasions)
{
    if (occasions.empty()) {
        return occasions;
    }
    for (auto &occasion : occasions) {
        if (occasion.id.isNull()) {
            occasion.id = QUuid::createUuid();
        }
        m_occasions.insert(occasion.id, occasion);
    }
    save();
    return occasions;
}

int FileScheduleStorage::removeOccasions(const QUuid &eventId)
{
    int removed = 0;
    for (auto it = m_occasions.begin(); it != m_occasions.end();) {
        if (it->eventId == eventId) {
            it = m_occasions.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        save();
    }
    return removed;
}

void FileScheduleStorage::load()
{
    m_events.clear();
    m_occasions.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot read" << m_filePath << ':' << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    enum class Section {
        None,
        Event,
        Occasion
    };

    Section currentSection = Section::None;
    Event currentEvent;
    Occasion currentOccasion;

    auto finalizeEvent = [&]() {
        if (currentEvent.id.isNull()) {
            currentEvent.id = QUuid::createUuid();
        }
        m_events.insert(currentEvent.id, currentEvent);
        currentEvent = Event{};
    };

    auto finalizeOccasion = [&]() {
        if (!currentOccasion.start.isValid() || !currentOccasion.end.isValid()
            || currentOccasion.end < currentOccasion.start) {
            qCWarning(lcStorage) << "dropping occasion" << currentOccasion.id << "with invalid times";
            currentOccasion = Occasion{};
            return;
        }
        if (currentOccasion.id.isNull()) {
            currentOccasion.id = QUuid::createUuid();
        }
        m_occasions.insert(currentOccasion.id, currentOccasion);
        currentOccasion = Occasion{};
    };

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VEVENT")) {
            currentSection = Section::Event;
            currentEvent = Event{};
            return;
        }
        if (line == QLatin1String("END:VEVENT")) {
            finalizeEvent();
            currentSection = Section::None;
            return;
        }
        if (line == QStringLiteral("BEGIN:%1").arg(QLatin1String(OCCASION_COMPONENT))) {
            currentSection = Section::Occasion;
            currentOccasion = Occasion{};
            return;
        }
        if (line == QStringLiteral("END:%1").arg(QLatin1String(OCCASION_COMPONENT))) {
            finalizeOccasion();
            currentSection = Section::None;
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString property = line.left(colonIndex);
        const QString rawValue = line.mid(colonIndex + 1);
        const QString name = property.section(';', 0, 0).toUpper();
        const QString value = decodeText(rawValue);

        if (currentSection == Section::Event) {
            if (name == QLatin1String("UID")) {
                currentEvent.id = parseUid(value);
            } else if (name == QLatin1String("SUMMARY")) {
                currentEvent.title = value;
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentEvent.description = value;
            } else if (name == QLatin1String("CATEGORIES")) {
                currentEvent.eventType.abbr = value;
            } else if (name == QLatin1String("X-TIMESLOT-TYPE-LABEL")) {
                currentEvent.eventType.label = value;
            } else if (name == QLatin1String("RRULE")) {
                currentEvent.recurrenceRule = rawValue;
            }
            return;
        }

        if (currentSection == Section::Occasion) {
            if (name == QLatin1String("UID")) {
                currentOccasion.id = parseUid(value);
            } else if (name == QLatin1String("RELATED-TO")) {
                currentOccasion.eventId = parseUid(value);
            } else if (name == QLatin1String("DTSTART")) {
                currentOccasion.start = parseDateTime(rawValue);
            } else if (name == QLatin1String("DTEND")) {
                currentOccasion.end = parseDateTime(rawValue);
            }
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    // Occasions whose event is gone are orphans; the rest take the event's title and type.
    for (auto it = m_occasions.begin(); it != m_occasions.end();) {
        const auto event = m_events.constFind(it->eventId);
        if (event == m_events.constEnd()) {
            qCWarning(lcStorage) << "dropping orphaned occasion" << it->id;
            it = m_occasions.erase(it);
            continue;
        }
        it->title = event->title;
        it->eventType = event->eventType.abbr;
        ++it;
    }
}

void FileScheduleStorage::save() const
{
    if (m_filePath.isEmpty()) {
        return;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcStorage) << "cannot write" << m_filePath << ':' << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Timeslot Planner//EN\n";

    auto events = m_events.values();
    std::sort(events.begin(), events.end(), [](const Event &lhs, const Event &rhs) {
        return lhs.title < rhs.title;
    });
    for (const Event &event : events) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << prepareUid(event.id) << '\n';
        stream << "SUMMARY:" << encodeText(event.title) << '\n';
        if (!event.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(event.description) << '\n';
        }
        if (!event.eventType.abbr.isEmpty()) {
            stream << "CATEGORIES:" << encodeText(event.eventType.abbr) << '\n';
        }
        if (!event.eventType.label.isEmpty()) {
            stream << "X-TIMESLOT-TYPE-LABEL:" << encodeText(event.eventType.label) << '\n';
        }
        if (!event.recurrenceRule.isEmpty()) {
            stream << "RRULE:" << event.recurrenceRule << '\n';
        }
        stream << "END:VEVENT\n";
    }

    auto occasions = m_occasions.values();
    std::sort(occasions.begin(), occasions.end());
    for (const Occasion &occasion : occasions) {
        stream << "BEGIN:" << OCCASION_COMPONENT << '\n';
        stream << "UID:" << prepareUid(occasion.id) << '\n';
        stream << "RELATED-TO:" << prepareUid(occasion.eventId) << '\n';
        stream << "DTSTART:" << formatDateTime(occasion.start) << '\n';
        stream << "DTEND:" << formatDateTime(occasion.end) << '\n';
        stream << "END:" << OCCASION_COMPONENT << '\n';
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (!file.commit()) {
        qCWarning(lcStorage) << "failed to commit" << m_filePath << ':' << file.errorString();
        return;
    }
    ++m_writeCount;
}

QString FileScheduleStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileScheduleStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != '\\' || i + 1 == text.size()) {
            decoded += ch;
            continue;
        }
        const QChar escaped = text.at(++i);
        if (escaped == 'n' || escaped == 'N') {
            decoded += '\n';
        } else if (escaped == '\\' || escaped == ',' || escaped == ';') {
            decoded += escaped;
        } else {
            decoded += ch;
            decoded += escaped;
        }
    }
    return decoded;
}

// Floating local times: the schedule lives in a single reference frame.
QString FileScheduleStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileScheduleStorage::parseDateTime(const QString &value)
{
    QDateTime dt = QDateTime::fromString(value, QLatin1String(DATE_TIME_FORMAT));
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    return dt;
}

} // namespace data
} // namespace timeslot
