#include <QtTest/QtTest>

#include "timeslot/core/OverlapQuery.hpp"

using namespace timeslot;

namespace {

data::Occasion makeOccasion(const QString &title, const QDateTime &start, const QDateTime &end,
                            const QUuid &eventId = QUuid::createUuid())
{
    data::Occasion occasion;
    occasion.eventId = eventId;
    occasion.title = title;
    occasion.start = start;
    occasion.end = end;
    return occasion;
}

QDateTime at(int day, int hour, int minute = 0)
{
    return QDateTime(QDate(2023, 3, day), QTime(hour, minute));
}

} // namespace

class OverlapQueryTest : public QObject
{
    Q_OBJECT

private slots:
    void coversAllFourOverlapShapes();
    void boundaryEqualityCounts();
    void isSymmetric();
    void dailyWindowAndOwnerFilter();
};

void OverlapQueryTest::coversAllFourOverlapShapes()
{
    const std::vector<data::Occasion> occasions = {
        makeOccasion(QStringLiteral("contains"), at(9, 8), at(11, 8)),
        makeOccasion(QStringLiteral("starts inside"), at(10, 20), at(11, 2)),
        makeOccasion(QStringLiteral("ends inside"), at(9, 22), at(10, 1)),
        makeOccasion(QStringLiteral("inside"), at(10, 9), at(10, 10)),
        makeOccasion(QStringLiteral("before"), at(9, 8), at(9, 9)),
        makeOccasion(QStringLiteral("after"), at(11, 8), at(11, 9)),
    };

    const auto result = core::overlapping(occasions, at(10, 0), QDateTime(QDate(2023, 3, 10), QTime(23, 59, 59)));
    QCOMPARE(result.size(), static_cast<size_t>(4));
    QCOMPARE(result[0].title, QStringLiteral("contains"));
    QCOMPARE(result[1].title, QStringLiteral("ends inside"));
    QCOMPARE(result[2].title, QStringLiteral("inside"));
    QCOMPARE(result[3].title, QStringLiteral("starts inside"));
}

void OverlapQueryTest::boundaryEqualityCounts()
{
    const std::vector<data::Occasion> occasions = {
        makeOccasion(QStringLiteral("ends at window start"), at(10, 8), at(10, 9)),
        makeOccasion(QStringLiteral("starts at window end"), at(10, 17), at(10, 18)),
    };
    const auto result = core::overlapping(occasions, at(10, 9), at(10, 17));
    QCOMPARE(result.size(), static_cast<size_t>(2));
}

void OverlapQueryTest::isSymmetric()
{
    const QDateTime windowStart = at(10, 9);
    const QDateTime windowEnd = at(10, 12);
    const std::vector<std::pair<QDateTime, QDateTime>> samples = {
        { at(10, 7), at(10, 8) },   { at(10, 8), at(10, 9) },   { at(10, 10), at(10, 11) },
        { at(10, 11), at(10, 14) }, { at(10, 12), at(10, 13) }, { at(10, 13), at(10, 14) },
    };
    for (const auto &sample : samples) {
        QCOMPARE(core::intervalsOverlap(sample.first, sample.second, windowStart, windowEnd),
                 core::intervalsOverlap(windowStart, windowEnd, sample.first, sample.second));
    }
}

void OverlapQueryTest::dailyWindowAndOwnerFilter()
{
    const QUuid owner = QUuid::createUuid();
    const std::vector<data::Occasion> occasions = {
        makeOccasion(QStringLiteral("mine"), at(10, 9), at(10, 10), owner),
        makeOccasion(QStringLiteral("other"), at(10, 11), at(10, 12)),
        makeOccasion(QStringLiteral("overnight"), at(9, 22), QDateTime(QDate(2023, 3, 10), QTime(0, 0)), owner),
        makeOccasion(QStringLiteral("next day"), at(11, 0), at(11, 1), owner),
    };

    const auto all = core::dailyOccasions(occasions, at(10, 15));
    QCOMPARE(all.size(), static_cast<size_t>(3));

    const auto mine = core::dailyOccasions(occasions, at(10, 15), owner);
    QCOMPARE(mine.size(), static_cast<size_t>(2));
    QCOMPARE(mine[0].title, QStringLiteral("overnight"));
    QCOMPARE(mine[1].title, QStringLiteral("mine"));
}

QTEST_GUILESS_MAIN(OverlapQueryTest)
#include "OverlapQueryTest.moc"
