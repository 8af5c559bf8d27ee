#include <QtTest/QtTest>

#include "timeslot/core/Errors.hpp"
#include "timeslot/core/RecurrenceExpander.hpp"

using namespace timeslot::core;

class RecurrenceExpanderTest : public QObject
{
    Q_OBJECT

private slots:
    void degenerateRuleYieldsInput();
    void countProducesExactlyN();
    void untilIsInclusive();
    void intervalSkipsPeriods();
    void weeklyByWeekday();
    void weeklyDefaultsToStartWeekday();
    void weeklyIgnoresAnchorsBeforeStart();
    void monthlySkipsShortMonths();
    void monthlyNegativeMonthDay();
    void yearlyKeepsLeapDay();
    void hourlySteps();
    void subDailySkipsFilteredDays();
    void subDailyStopsWhenNoDayMatches();
    void rejectsInvalidInterval();
    void rejectsZeroCount();
    void rejectsEndBeforeStart();
};

void RecurrenceExpanderTest::degenerateRuleYieldsInput()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    const QDateTime end(QDate(2023, 1, 2), QTime(10, 30));

    RecurrenceRule rule;
    rule.frequency = Frequency::Weekly;
    rule.byWeekday = { Qt::Friday };
    const auto intervals = RecurrenceExpander().expand(start, end, rule);

    QCOMPARE(intervals.size(), static_cast<size_t>(1));
    QCOMPARE(intervals.front().start(), start);
    QCOMPARE(intervals.front().end(), end);
}

void RecurrenceExpanderTest::countProducesExactlyN()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    const QDateTime end = start.addSecs(45 * 60);

    RecurrenceRule rule;
    rule.count = 5;
    const auto intervals = RecurrenceExpander().expand(start, end, rule);

    QCOMPARE(intervals.size(), static_cast<size_t>(5));
    for (size_t i = 0; i < intervals.size(); ++i) {
        QCOMPARE(intervals[i].durationSecs(), static_cast<qint64>(45 * 60));
        QCOMPARE(intervals[i].start(), start.addDays(static_cast<qint64>(i)));
        if (i > 0) {
            QVERIFY(intervals[i - 1].start() <= intervals[i].start());
        }
    }
}

void RecurrenceExpanderTest::untilIsInclusive()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    RecurrenceRule rule;
    rule.until = start.addDays(3);

    const auto intervals = RecurrenceExpander().expand(start, start.addSecs(3600), rule);
    QCOMPARE(intervals.size(), static_cast<size_t>(4));
    QCOMPARE(intervals.back().start(), start.addDays(3));
}

void RecurrenceExpanderTest::intervalSkipsPeriods()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    RecurrenceRule rule;
    rule.interval = 2;
    rule.count = 3;

    const auto intervals = RecurrenceExpander().expand(start, start, rule);
    QCOMPARE(intervals.size(), static_cast<size_t>(3));
    QCOMPARE(intervals[0].start().date(), QDate(2023, 1, 2));
    QCOMPARE(intervals[1].start().date(), QDate(2023, 1, 4));
    QCOMPARE(intervals[2].start().date(), QDate(2023, 1, 6));
}

void RecurrenceExpanderTest::weeklyByWeekday()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0)); // Monday
    RecurrenceRule rule;
    rule.frequency = Frequency::Weekly;
    rule.byWeekday = { Qt::Monday, Qt::Wednesday, Qt::Friday };
    rule.count = 5;

    const auto anchors = RecurrenceExpander().anchors(start, rule);
    const std::vector<QDate> expected = { QDate(2023, 1, 2), QDate(2023, 1, 4), QDate(2023, 1, 6),
                                          QDate(2023, 1, 9), QDate(2023, 1, 11) };
    QCOMPARE(anchors.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        QCOMPARE(anchors[i].date(), expected[i]);
        QCOMPARE(anchors[i].time(), QTime(9, 0));
    }
}

void RecurrenceExpanderTest::weeklyDefaultsToStartWeekday()
{
    const QDateTime start(QDate(2023, 1, 5), QTime(14, 30)); // Thursday
    RecurrenceRule rule;
    rule.frequency = Frequency::Weekly;
    rule.count = 3;

    const auto anchors = RecurrenceExpander().anchors(start, rule);
    QCOMPARE(anchors.size(), static_cast<size_t>(3));
    QCOMPARE(anchors[0].date(), QDate(2023, 1, 5));
    QCOMPARE(anchors[1].date(), QDate(2023, 1, 12));
    QCOMPARE(anchors[2].date(), QDate(2023, 1, 19));
}

void RecurrenceExpanderTest::weeklyIgnoresAnchorsBeforeStart()
{
    const QDateTime start(QDate(2023, 1, 4), QTime(9, 0)); // Wednesday
    RecurrenceRule rule;
    rule.frequency = Frequency::Weekly;
    rule.byWeekday = { Qt::Monday };
    rule.count = 2;

    const auto anchors = RecurrenceExpander().anchors(start, rule);
    QCOMPARE(anchors.size(), static_cast<size_t>(2));
    QCOMPARE(anchors[0].date(), QDate(2023, 1, 9));
    QCOMPARE(anchors[1].date(), QDate(2023, 1, 16));
}

void RecurrenceExpanderTest::monthlySkipsShortMonths()
{
    const QDateTime start(QDate(2023, 1, 31), QTime(8, 0));
    RecurrenceRule rule;
    rule.frequency = Frequency::Monthly;
    rule.count = 3;

    const auto anchors = RecurrenceExpander().anchors(start, rule);
    QCOMPARE(anchors.size(), static_cast<size_t>(3));
    QCOMPARE(anchors[0].date(), QDate(2023, 1, 31));
    QCOMPARE(anchors[1].date(), QDate(2023, 3, 31));
    QCOMPARE(anchors[2].date(), QDate(2023, 5, 31));
}

void RecurrenceExpanderTest::monthlyNegativeMonthDay()
{
    const QDateTime start(QDate(2023, 1, 15), QTime(17, 0));
    RecurrenceRule rule;
    rule.frequency = Frequency::Monthly;
    rule.byMonthDay = { -1 };
    rule.count = 3;

    const auto anchors = RecurrenceExpander().anchors(start, rule);
    QCOMPARE(anchors.size(), static_cast<size_t>(3));
    QCOMPARE(anchors[0].date(), QDate(2023, 1, 31));
    QCOMPARE(anchors[1].date(), QDate(2023, 2, 28));
    QCOMPARE(anchors[2].date(), QDate(2023, 3, 31));
}

void RecurrenceExpanderTest::yearlyKeepsLeapDay()
{
    const QDateTime start(QDate(2020, 2, 29), QTime(12, 0));
    RecurrenceRule rule;
    rule.frequency = Frequency::Yearly;
    rule.count = 2;

    const auto anchors = RecurrenceExpander().anchors(start, rule);
    QCOMPARE(anchors.size(), static_cast<size_t>(2));
    QCOMPARE(anchors[0].date(), QDate(2020, 2, 29));
    QCOMPARE(anchors[1].date(), QDate(2024, 2, 29));
}

void RecurrenceExpanderTest::hourlySteps()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    RecurrenceRule rule;
    rule.frequency = Frequency::Hourly;
    rule.interval = 2;
    rule.count = 3;

    const auto intervals = RecurrenceExpander().expand(start, start.addSecs(900), rule);
    QCOMPARE(intervals.size(), static_cast<size_t>(3));
    QCOMPARE(intervals[1].start().time(), QTime(11, 0));
    QCOMPARE(intervals[2].start().time(), QTime(13, 0));
    QCOMPARE(intervals[2].end().time(), QTime(13, 15));
}

void RecurrenceExpanderTest::subDailySkipsFilteredDays()
{
    const QDateTime start(QDate(2023, 1, 1), QTime(9, 0));
    RecurrenceRule rule;
    rule.frequency = Frequency::Secondly;
    rule.count = 3;
    rule.byMonth = { 12 };

    const auto intervals = RecurrenceExpander().expand(start, start.addSecs(30), rule);
    QCOMPARE(intervals.size(), static_cast<size_t>(3));
    QCOMPARE(intervals[0].start(), QDateTime(QDate(2023, 12, 1), QTime(0, 0, 0)));
    QCOMPARE(intervals[1].start(), QDateTime(QDate(2023, 12, 1), QTime(0, 0, 1)));
    QCOMPARE(intervals[2].start(), QDateTime(QDate(2023, 12, 1), QTime(0, 0, 2)));
    QCOMPARE(intervals[2].durationSecs(), static_cast<qint64>(30));
}

void RecurrenceExpanderTest::subDailyStopsWhenNoDayMatches()
{
    const QDateTime start(QDate(2023, 1, 1), QTime(9, 0));
    RecurrenceRule rule;
    rule.frequency = Frequency::Secondly;
    rule.count = 1;
    rule.byMonth = { 2 };
    rule.byMonthDay = { 30 };

    QVERIFY(RecurrenceExpander().anchors(start, rule).empty());
}

void RecurrenceExpanderTest::rejectsInvalidInterval()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    RecurrenceRule rule;
    rule.interval = 0;
    rule.count = 3;
    QVERIFY_EXCEPTION_THROWN(RecurrenceExpander().expand(start, start, rule), InvalidRuleError);
}

void RecurrenceExpanderTest::rejectsZeroCount()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    RecurrenceRule rule;
    rule.count = 0;
    rule.until = start.addDays(10);
    QVERIFY_EXCEPTION_THROWN(RecurrenceExpander().expand(start, start, rule), InvalidRuleError);
}

void RecurrenceExpanderTest::rejectsEndBeforeStart()
{
    const QDateTime start(QDate(2023, 1, 2), QTime(9, 0));
    RecurrenceRule rule;
    rule.count = 2;
    QVERIFY_EXCEPTION_THROWN(RecurrenceExpander().expand(start, start.addSecs(-60), rule),
                             InvalidIntervalError);
}

QTEST_GUILESS_MAIN(RecurrenceExpanderTest)
#include "RecurrenceExpanderTest.moc"
