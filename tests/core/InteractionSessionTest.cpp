#include <QtTest/QtTest>

#include "gantt/core/GanttStore.hpp"
#include "gantt/core/MoveSession.hpp"
#include "gantt/core/ReorderSession.hpp"
#include "gantt/core/ResizeSession.hpp"
#include "gantt/core/TaskTree.hpp"

using namespace gantt;

namespace {

constexpr double DayWidth = 48.0;

core::GanttState stateWithRoots(const QStringList &ids)
{
    core::GanttState state;
    for (const auto &id : ids) {
        data::Task t;
        t.id = id;
        t.name = id;
        t.startDate = QDate(2025, 7, 10);
        t.endDate = QDate(2025, 7, 12);
        state.tasks.append(data::makeTask(std::move(t)));
    }
    return state;
}

data::TaskPtr taskIn(const core::GanttStore &store, const QString &id)
{
    return core::findTask(store.state().tasks, id);
}

QStringList rootIds(const core::GanttStore &store)
{
    QStringList ids;
    for (const auto &task : store.state().tasks) {
        ids << task->id;
    }
    return ids;
}

} // namespace

class InteractionSessionTest : public QObject
{
    Q_OBJECT

private slots:
    void moveShiftsBothDates();
    void moveDispatchesOnDeltaChangeOnly();
    void moveBackToPressRestoresDates();
    void moveCancelRestoresAnchor();
    void resizeEndKeepsOneDay();
    void resizeStartKeepsOneDay();
    void resizeTracksStoreFlags();
    void resizeCancelRestoresAnchor();
    void resizedIntervalStaysOrdered();
    void reorderResolvesDisplayedIds();
    void reorderOntoItselfCancels();
    void reorderRejectsHiddenTarget();
};

void InteractionSessionTest::moveShiftsBothDates()
{
    core::GanttStore store(stateWithRoots({ "A" }));
    core::MoveSession session(store);

    QVERIFY(session.begin(QStringLiteral("A"), 100.0, DayWidth));
    session.update(100.0 + 3 * DayWidth);
    session.end();

    const auto task = taskIn(store, QStringLiteral("A"));
    QCOMPARE(task->startDate, QDate(2025, 7, 13));
    QCOMPARE(task->endDate, QDate(2025, 7, 15));
    QVERIFY(!session.isActive());
}

void InteractionSessionTest::moveDispatchesOnDeltaChangeOnly()
{
    core::GanttStore store(stateWithRoots({ "A" }));
    core::MoveSession session(store);

    QVERIFY(session.begin(QStringLiteral("A"), 0.0, DayWidth));
    session.update(10.0);
    session.update(20.0);
    QCOMPARE(store.dispatchCount(), static_cast<std::size_t>(0));

    session.update(30.0);
    session.update(50.0);
    QCOMPARE(store.dispatchCount(), static_cast<std::size_t>(1));
    QCOMPARE(taskIn(store, QStringLiteral("A"))->startDate, QDate(2025, 7, 11));
}

void InteractionSessionTest::moveBackToPressRestoresDates()
{
    core::GanttStore store(stateWithRoots({ "A" }));
    core::MoveSession session(store);

    QVERIFY(session.begin(QStringLiteral("A"), 200.0, DayWidth));
    session.update(200.0 - 2 * DayWidth);
    QCOMPARE(taskIn(store, QStringLiteral("A"))->startDate, QDate(2025, 7, 8));
    session.update(205.0);
    session.end();

    const auto task = taskIn(store, QStringLiteral("A"));
    QCOMPARE(task->startDate, QDate(2025, 7, 10));
    QCOMPARE(task->endDate, QDate(2025, 7, 12));
}

void InteractionSessionTest::moveCancelRestoresAnchor()
{
    core::GanttStore store(stateWithRoots({ "A" }));
    core::MoveSession session(store);

    QVERIFY(session.begin(QStringLiteral("A"), 0.0, DayWidth));
    session.update(5 * DayWidth);
    QCOMPARE(taskIn(store, QStringLiteral("A"))->endDate, QDate(2025, 7, 17));
    session.cancel();

    QVERIFY(!session.isActive());
    QCOMPARE(taskIn(store, QStringLiteral("A"))->startDate, QDate(2025, 7, 10));
    QCOMPARE(taskIn(store, QStringLiteral("A"))->endDate, QDate(2025, 7, 12));
    QVERIFY(!session.begin(QStringLiteral("missing"), 0.0, DayWidth));
}

void InteractionSessionTest::resizeEndKeepsOneDay()
{
    core::GanttStore store(stateWithRoots({ "A" }));
    core::ResizeSession session(store);

    QVERIFY(session.begin(QStringLiteral("A"), core::ResizeHandle::End, 300.0, DayWidth));
    session.update(300.0 - 5 * DayWidth);
    session.end();

    const auto task = taskIn(store, QStringLiteral("A"));
    QCOMPARE(task->startDate, QDate(2025, 7, 10));
    QCOMPARE(task->endDate, QDate(2025, 7, 11));
}

void InteractionSessionTest::resizeStartKeepsOneDay()
{
    core::GanttStore store(stateWithRoots({ "A" }));
    core::ResizeSession session(store);

    QVERIFY(session.begin(QStringLiteral("A"), core::ResizeHandle::Start, 0.0, DayWidth));
    session.update(5 * DayWidth);
    QCOMPARE(taskIn(store, QStringLiteral("A"))->startDate, QDate(2025, 7, 11));
    session.update(-DayWidth);
    session.end();

    const auto task = taskIn(store, QStringLiteral("A"));
    QCOMPARE(task->startDate, QDate(2025, 7, 9));
    QCOMPARE(task->endDate, QDate(2025, 7, 12));
}

void InteractionSessionTest::resizeTracksStoreFlags()
{
    core::GanttStore store(stateWithRoots({ "A", "B" }));
    core::ResizeSession session(store);

    QVERIFY(!session.begin(QStringLiteral("B"), core::ResizeHandle::None, 0.0, DayWidth));
    QVERIFY(session.begin(QStringLiteral("B"), core::ResizeHandle::Start, 0.0, DayWidth));
    QVERIFY(store.state().isResizing);
    QCOMPARE(store.state().resizingTaskId, QStringLiteral("B"));
    QCOMPARE(store.state().selectedTaskId, QStringLiteral("B"));

    session.end();
    QVERIFY(!store.state().isResizing);
    QCOMPARE(store.state().resizeHandle, core::ResizeHandle::None);
}

void InteractionSessionTest::resizeCancelRestoresAnchor()
{
    core::GanttStore store(stateWithRoots({ "A" }));
    core::ResizeSession session(store);

    QVERIFY(session.begin(QStringLiteral("A"), core::ResizeHandle::End, 0.0, DayWidth));
    session.update(4 * DayWidth);
    QCOMPARE(taskIn(store, QStringLiteral("A"))->endDate, QDate(2025, 7, 16));
    session.cancel();

    QCOMPARE(taskIn(store, QStringLiteral("A"))->endDate, QDate(2025, 7, 12));
    QVERIFY(!store.state().isResizing);
}

void InteractionSessionTest::resizedIntervalStaysOrdered()
{
    const QDate start(2025, 7, 10);
    for (const QDate &end : { QDate(2025, 7, 10), QDate(2025, 7, 11), QDate(2025, 7, 20) }) {
        for (auto handle : { core::ResizeHandle::Start, core::ResizeHandle::End }) {
            for (int delta = -15; delta <= 15; ++delta) {
                const auto interval = core::ResizeSession::resizedInterval(start, end, handle, delta);
                QVERIFY2(interval.first < interval.second,
                         qPrintable(QStringLiteral("delta %1 end %2").arg(delta).arg(end.toString(Qt::ISODate))));
                if (handle == core::ResizeHandle::Start) {
                    QCOMPARE(interval.second, end);
                } else {
                    QCOMPARE(interval.first, start);
                }
            }
        }
    }
}

void InteractionSessionTest::reorderResolvesDisplayedIds()
{
    core::GanttStore store(stateWithRoots({ "A", "B", "C", "D" }));
    core::ReorderSession session(store);

    // Filtered and sorted rows: only D and B are visible, in that order.
    const QStringList displayed{ QStringLiteral("D"), QStringLiteral("B") };
    QVERIFY(session.begin(displayed, QStringLiteral("D")));
    QVERIFY(store.state().draggedTask);
    QCOMPARE(store.state().draggedTask->id, QStringLiteral("D"));

    QVERIFY(session.drop(QStringLiteral("B")));
    QCOMPARE(rootIds(store), QStringList({ "A", "D", "B", "C" }));
    QVERIFY(!store.state().draggedTask);
    QVERIFY(!session.isActive());

    const auto indices = core::ReorderSession::resolveIndices(store.state().tasks, QStringLiteral("A"),
                                                              QStringLiteral("C"));
    QVERIFY(indices.has_value());
    QCOMPARE(indices->first, 0);
    QCOMPARE(indices->second, 3);
}

void InteractionSessionTest::reorderOntoItselfCancels()
{
    core::GanttStore store(stateWithRoots({ "A", "B" }));
    core::ReorderSession session(store);
    const QStringList displayed{ QStringLiteral("A"), QStringLiteral("B") };

    QVERIFY(session.begin(displayed, QStringLiteral("A")));
    QVERIFY(!session.drop(QStringLiteral("A")));
    QCOMPARE(rootIds(store), QStringList({ "A", "B" }));
    QVERIFY(!store.state().draggedTask);

    QVERIFY(session.begin(displayed, QStringLiteral("B")));
    session.cancel();
    QVERIFY(!session.isActive());
    QVERIFY(!store.state().draggedTask);
}

void InteractionSessionTest::reorderRejectsHiddenTarget()
{
    core::GanttStore store(stateWithRoots({ "A", "B", "C" }));
    core::ReorderSession session(store);
    const QStringList displayed{ QStringLiteral("B"), QStringLiteral("C") };

    QVERIFY(!session.begin(displayed, QStringLiteral("A")));
    QVERIFY(session.begin(displayed, QStringLiteral("C")));
    QVERIFY(!session.drop(QStringLiteral("A")));
    QCOMPARE(rootIds(store), QStringList({ "A", "B", "C" }));
}

QTEST_GUILESS_MAIN(InteractionSessionTest)
#include "InteractionSessionTest.moc"
