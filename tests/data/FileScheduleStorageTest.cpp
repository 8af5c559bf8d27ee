#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

#include "timeslot/core/EventScheduler.hpp"
#include "timeslot/data/DataProvider.hpp"
#include "timeslot/data/EventRepository.hpp"
#include "timeslot/data/FileEventRepository.hpp"
#include "timeslot/data/FileOccasionRepository.hpp"
#include "timeslot/data/FileScheduleStorage.hpp"
#include "timeslot/data/OccasionRepository.hpp"

using namespace timeslot;

class FileScheduleStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void persistsEventsAndOccasions();
    void removingEventDropsOccasions();
    void readsFoldedLinesAndSkipsOrphans();
    void keepsBackslashesInText();
    void storesExpandedOccasionsInOneWrite();
};

void FileScheduleStorageTest::persistsEventsAndOccasions()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("schedule.ics"));
    const QDateTime start(QDate(2023, 6, 5), QTime(9, 0));
    QUuid eventId;

    {
        data::DataProvider provider(path);
        core::EventScheduler scheduler(provider.eventRepository(), provider.occasionRepository());
        core::RecurrenceRule rule;
        rule.count = 3;
        const auto event = scheduler.createEvent(QStringLiteral("Lab; section A, room 2"),
                                                 QStringLiteral("Line one\nLine two"),
                                                 { QStringLiteral("lab"), QStringLiteral("Laboratory") },
                                                 start, start.addSecs(3600), rule);
        eventId = event.id;
    }

    data::DataProvider reloaded(path);
    const auto event = reloaded.eventRepository().findById(eventId);
    QVERIFY(event.has_value());
    QCOMPARE(event->title, QStringLiteral("Lab; section A, room 2"));
    QCOMPARE(event->description, QStringLiteral("Line one\nLine two"));
    QCOMPARE(event->eventType.abbr, QStringLiteral("lab"));
    QCOMPARE(event->eventType.label, QStringLiteral("Laboratory"));
    QCOMPARE(event->recurrenceRule, QStringLiteral("FREQ=DAILY;COUNT=3"));

    const auto occasions = reloaded.occasionRepository().fetchOccasions(eventId);
    QCOMPARE(occasions.size(), static_cast<size_t>(3));
    QCOMPARE(occasions[1].start, start.addDays(1));
    QCOMPARE(occasions[1].end, start.addDays(1).addSecs(3600));
    QCOMPARE(occasions[1].title, QStringLiteral("Lab; section A, room 2"));
    QCOMPARE(occasions[1].eventType, QStringLiteral("lab"));

    const auto daily = reloaded.occasionRepository().loadOccasionsForDay(start.date().addDays(2));
    QCOMPARE(daily.size(), static_cast<size_t>(1));
}

void FileScheduleStorageTest::removingEventDropsOccasions()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("schedule.ics"));
    const QDateTime start(QDate(2023, 6, 5), QTime(9, 0));

    data::DataProvider provider(path);
    core::EventScheduler scheduler(provider.eventRepository(), provider.occasionRepository());
    const auto event = scheduler.createEvent(QStringLiteral("Once"), QString(), {}, start, start.addSecs(600));
    QCOMPARE(provider.occasionRepository().fetchOccasions(event.id).size(), static_cast<size_t>(1));

    QVERIFY(provider.eventRepository().removeEvent(event.id));
    QVERIFY(provider.occasionRepository().fetchOccasions(event.id).empty());

    data::DataProvider reloaded(path);
    QVERIFY(reloaded.eventRepository().fetchEvents().empty());
    QVERIFY(reloaded.occasionRepository().loadOccasionsForDay(start.date()).empty());
}

void FileScheduleStorageTest::readsFoldedLinesAndSkipsOrphans()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("schedule.ics"));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
        QTextStream stream(&file);
        stream << "BEGIN:VCALENDAR\n"
               << "BEGIN:VEVENT\n"
               << "UID:6f1c2a3e-0d4b-4f5a-9c1e-2b3d4e5f6a7b\n"
               << "SUMMARY:Folded\n"
               << "  title\n"
               << "END:VEVENT\n"
               << "BEGIN:X-TIMESLOT-OCCASION\n"
               << "UID:0a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d\n"
               << "RELATED-TO:6f1c2a3e-0d4b-4f5a-9c1e-2b3d4e5f6a7b\n"
               << "DTSTART:20230605T090000\n"
               << "DTEND:20230605T093000\n"
               << "END:X-TIMESLOT-OCCASION\n"
               << "BEGIN:X-TIMESLOT-OCCASION\n"
               << "UID:1a1b2c3d-4e5f-4a6b-8c7d-9e0f1a2b3c4d\n"
               << "RELATED-TO:ffffffff-0d4b-4f5a-9c1e-2b3d4e5f6a7b\n"
               << "DTSTART:20230605T100000\n"
               << "DTEND:20230605T103000\n"
               << "END:X-TIMESLOT-OCCASION\n"
               << "END:VCALENDAR\n";
    }

    data::DataProvider provider(path);
    const auto events = provider.eventRepository().fetchEvents();
    QCOMPARE(events.size(), static_cast<size_t>(1));
    QCOMPARE(events.front().title, QStringLiteral("Folded title"));

    const auto occasions = provider.occasionRepository().loadOccasionsForDay(QDate(2023, 6, 5));
    QCOMPARE(occasions.size(), static_cast<size_t>(1));
    QCOMPARE(occasions.front().title, QStringLiteral("Folded title"));
    QCOMPARE(occasions.front().end, QDateTime(QDate(2023, 6, 5), QTime(9, 30)));
}

void FileScheduleStorageTest::keepsBackslashesInText()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("schedule.ics"));
    const QString title = QStringLiteral("C:\\new\\notes");
    const QString description = QStringLiteral("a\\nb\nends with \\");
    QUuid eventId;

    {
        data::DataProvider provider(path);
        data::Event event;
        event.title = title;
        event.description = description;
        eventId = provider.eventRepository().addEvent(event).id;
    }

    data::DataProvider reloaded(path);
    const auto event = reloaded.eventRepository().findById(eventId);
    QVERIFY(event.has_value());
    QCOMPARE(event->title, title);
    QCOMPARE(event->description, description);
}

void FileScheduleStorageTest::storesExpandedOccasionsInOneWrite()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("schedule.ics"));
    const QDateTime start(QDate(2023, 6, 5), QTime(9, 0));

    auto storage = std::make_shared<data::FileScheduleStorage>(path);
    data::FileEventRepository events(storage);
    data::FileOccasionRepository occasions(storage);
    core::EventScheduler scheduler(events, occasions);

    core::RecurrenceRule rule;
    rule.count = 20;
    const auto event = scheduler.createEvent(QStringLiteral("Standup"), QString(), {}, start, start.addSecs(900), rule);

    // One write for the event, one for all of its occasions.
    QCOMPARE(storage->writeCount(), 2);
    QCOMPARE(occasions.fetchOccasions(event.id).size(), static_cast<size_t>(20));

    data::FileScheduleStorage reloaded(path);
    QCOMPARE(reloaded.occasions().size(), 20);
    QCOMPARE(reloaded.writeCount(), 0);
}

QTEST_GUILESS_MAIN(FileScheduleStorageTest)
#include "FileScheduleStorageTest.moc"
