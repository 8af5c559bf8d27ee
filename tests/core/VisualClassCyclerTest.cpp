#include <QtTest/QtTest>

#include "timeslot/core/VisualClassCycler.hpp"

using timeslot::core::VisualClassCycler;

class VisualClassCyclerTest : public QObject
{
    Q_OBJECT

private slots:
    void alternatesPerColumnAndType();
    void unknownTypesUseGenericPalette();
};

void VisualClassCyclerTest::alternatesPerColumnAndType()
{
    VisualClassCycler cycler({ QStringLiteral("lab"), QStringLiteral("lec") });

    QCOMPARE(cycler.next(0, QStringLiteral("lab")), QStringLiteral("evt-lab-even"));
    QCOMPARE(cycler.next(0, QStringLiteral("lab")), QStringLiteral("evt-lab-odd"));
    QCOMPARE(cycler.next(0, QStringLiteral("lab")), QStringLiteral("evt-lab-even"));

    // Separate counters for another column and another type.
    QCOMPARE(cycler.next(1, QStringLiteral("lab")), QStringLiteral("evt-lab-even"));
    QCOMPARE(cycler.next(0, QStringLiteral("lec")), QStringLiteral("evt-lec-even"));
}

void VisualClassCyclerTest::unknownTypesUseGenericPalette()
{
    VisualClassCycler cycler;
    QCOMPARE(cycler.palette(QStringLiteral("lab")),
             QStringList({ QStringLiteral("evt-even"), QStringLiteral("evt-odd") }));
    QCOMPARE(cycler.next(2, QString()), QStringLiteral("evt-even"));
    QCOMPARE(cycler.next(2, QString()), QStringLiteral("evt-odd"));
}

QTEST_GUILESS_MAIN(VisualClassCyclerTest)
#include "VisualClassCyclerTest.moc"
