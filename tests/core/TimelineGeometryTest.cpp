#include <QtTest/QtTest>

#include "gantt/core/TimelineGeometry.hpp"
#include "gantt/data/DemoData.hpp"

using namespace gantt;

class TimelineGeometryTest : public QObject
{
    Q_OBJECT

private slots:
    void durationIsInclusive();
    void barPositionRelativeToOrigin();
    void barBeforeOriginIsPinned();
    void pixelDeltaRoundsToDays();
    void dateAtPositionFloors();
    void rangePerViewMode_data();
    void rangePerViewMode();
    void earliestStartSearchesForest();
};

void TimelineGeometryTest::durationIsInclusive()
{
    QCOMPARE(core::taskDuration(QDate(2025, 7, 10), QDate(2025, 7, 10)), 1);
    QCOMPARE(core::taskDuration(QDate(2025, 7, 10), QDate(2025, 7, 12)), 3);
    QCOMPARE(core::taskDuration(QDate(2025, 7, 12), QDate(2025, 7, 10)), 1);
    QCOMPARE(core::daysBetween(QDate(2025, 7, 12), QDate(2025, 7, 10)), -2);
}

void TimelineGeometryTest::barPositionRelativeToOrigin()
{
    data::Task task;
    task.startDate = QDate(2025, 7, 15);
    task.endDate = QDate(2025, 7, 17);
    const double dayWidth = core::effectiveDayWidth(48.0, 1.0);

    const auto geometry = core::taskPosition(task, QDate(2025, 7, 13), dayWidth);
    QCOMPARE(geometry.left, 96.0);
    QCOMPARE(geometry.width, 3 * 48.0 - core::BarGutter);

    const auto zoomed = core::taskPosition(task, QDate(2025, 7, 13), core::effectiveDayWidth(48.0, 1.5));
    QCOMPARE(zoomed.left, 144.0);
}

void TimelineGeometryTest::barBeforeOriginIsPinned()
{
    data::Task task;
    task.startDate = QDate(2025, 7, 1);
    task.endDate = QDate(2025, 7, 1);
    const auto geometry = core::taskPosition(task, QDate(2025, 7, 13), 8.0);
    QCOMPARE(geometry.left, 0.0);
    QCOMPARE(geometry.width, 4.0);
}

void TimelineGeometryTest::pixelDeltaRoundsToDays()
{
    QCOMPARE(core::daysForPixelDelta(70.0, 48.0), 1);
    QCOMPARE(core::daysForPixelDelta(73.0, 48.0), 2);
    QCOMPARE(core::daysForPixelDelta(-30.0, 48.0), -1);
    QCOMPARE(core::daysForPixelDelta(20.0, 48.0), 0);
    QCOMPARE(core::daysForPixelDelta(100.0, 0.0), 0);
}

void TimelineGeometryTest::dateAtPositionFloors()
{
    const QDate origin(2025, 7, 13);
    QCOMPARE(core::dateAtPosition(0.0, origin, 24.0), origin);
    QCOMPARE(core::dateAtPosition(47.9, origin, 24.0), QDate(2025, 7, 14));
    QCOMPARE(core::dateAtPosition(-1.0, origin, 24.0), QDate(2025, 7, 12));
    QVERIFY(!core::dateAtPosition(10.0, origin, 0.0).isValid());
}

void TimelineGeometryTest::rangePerViewMode_data()
{
    QTest::addColumn<int>("mode");
    QTest::addColumn<QDate>("start");
    QTest::addColumn<QDate>("end");
    QTest::addColumn<double>("dayWidth");

    // Anchor 2025-07-13, today Wednesday 2025-07-16.
    QTest::newRow("day") << static_cast<int>(core::ViewMode::Day) << QDate(2025, 7, 13) << QDate(2025, 8, 31) << 48.0;
    QTest::newRow("week") << static_cast<int>(core::ViewMode::Week) << QDate(2025, 7, 13) << QDate(2025, 10, 5) << 24.0;
    QTest::newRow("month") << static_cast<int>(core::ViewMode::Month) << QDate(2025, 7, 1) << QDate(2026, 7, 31) << 8.0;
}

void TimelineGeometryTest::rangePerViewMode()
{
    QFETCH(int, mode);
    QFETCH(QDate, start);
    QFETCH(QDate, end);
    QFETCH(double, dayWidth);

    const auto range = core::timelineRangeFor(static_cast<core::ViewMode>(mode), QDate(2025, 7, 13), QDate(2025, 7, 16));
    QCOMPARE(range.start, start);
    QCOMPARE(range.end, end);
    QCOMPARE(range.baseDayWidth, dayWidth);
    QCOMPARE(range.dayCount(), core::daysBetween(start, end) + 1);
}

void TimelineGeometryTest::earliestStartSearchesForest()
{
    QCOMPARE(core::earliestStartDate(data::createDemoTasks()), QDate(2025, 7, 13));
    QVERIFY(!core::earliestStartDate({}).isValid());

    data::Task child;
    child.id = QStringLiteral("c");
    child.startDate = QDate(2025, 6, 1);
    data::Task parent;
    parent.id = QStringLiteral("p");
    parent.startDate = QDate(2025, 7, 1);
    parent.children.append(data::makeTask(child));
    QCOMPARE(core::earliestStartDate({ data::makeTask(parent) }), QDate(2025, 6, 1));
}

QTEST_GUILESS_MAIN(TimelineGeometryTest)
#include "TimelineGeometryTest.moc"
