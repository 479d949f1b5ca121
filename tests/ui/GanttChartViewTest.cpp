#include <QtTest/QtTest>

#include <QKeyEvent>
#include <QMouseEvent>
#include <memory>

#include "gantt/core/GanttStore.hpp"
#include "gantt/core/TaskTree.hpp"
#include "gantt/core/TimelineGeometry.hpp"
#include "gantt/ui/widgets/GanttChartView.hpp"

using namespace gantt;

namespace {

// Day view at 48 px/day: the bar of the only row spans x 0..140, y 48..72.
constexpr int BarY = 60;
constexpr int BodyX = 70;

core::GanttState singleTaskState()
{
    data::Task task;
    task.id = QStringLiteral("A");
    task.name = QStringLiteral("Alpha");
    task.startDate = QDate(2025, 7, 10);
    task.endDate = QDate(2025, 7, 12);
    core::GanttState state;
    state.tasks.append(data::makeTask(std::move(task)));
    return state;
}

void sendMouse(ui::GanttChartView &view, QEvent::Type type, int x, Qt::MouseButtons buttons)
{
    QMouseEvent event(type, QPointF(x, BarY), Qt::LeftButton, buttons, Qt::NoModifier);
    QCoreApplication::sendEvent(view.viewport(), &event);
}

} // namespace

class GanttChartViewTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();
    void releaseAfterMoveFinishesGesture();
    void releaseAfterResizeFinishesGesture();
    void escapeCancelsAndFinishesGesture();
    void plainReleaseIsNotAGesture();

private:
    std::unique_ptr<core::GanttStore> m_store;
    std::unique_ptr<ui::GanttChartView> m_view;
};

void GanttChartViewTest::init()
{
    m_store = std::make_unique<core::GanttStore>(singleTaskState());
    m_view = std::make_unique<ui::GanttChartView>(*m_store);
    m_view->resize(800, 400);
    m_view->setHeaderHeight(40);
    m_view->setTimeline(core::timelineRangeFor(core::ViewMode::Day, QDate(2025, 7, 10), QDate(2025, 7, 16)),
                        core::ViewMode::Day);
    m_view->setRows(core::visibleRows(m_store->state().tasks));
}

void GanttChartViewTest::cleanup()
{
    m_view.reset();
    m_store.reset();
}

void GanttChartViewTest::releaseAfterMoveFinishesGesture()
{
    QSignalSpy spy(m_view.get(), &ui::GanttChartView::gestureFinished);

    sendMouse(*m_view, QEvent::MouseButtonPress, BodyX, Qt::LeftButton);
    QVERIFY(m_view->isInteracting());
    sendMouse(*m_view, QEvent::MouseMove, BodyX - 144, Qt::LeftButton);
    QCOMPARE(spy.count(), 0);

    sendMouse(*m_view, QEvent::MouseButtonRelease, BodyX - 144, Qt::NoButton);
    QVERIFY(!m_view->isInteracting());
    QCOMPARE(spy.count(), 1);

    // The task now starts before the chart origin; the listener recomputes it.
    const auto task = core::findTask(m_store->state().tasks, QStringLiteral("A"));
    QCOMPARE(task->startDate, QDate(2025, 7, 7));
    QVERIFY(task->startDate < m_view->timeline().start);
    QCOMPARE(core::earliestStartDate(m_store->state().tasks), QDate(2025, 7, 7));
}

void GanttChartViewTest::releaseAfterResizeFinishesGesture()
{
    QSignalSpy spy(m_view.get(), &ui::GanttChartView::gestureFinished);

    sendMouse(*m_view, QEvent::MouseButtonPress, 2, Qt::LeftButton);
    QVERIFY(m_store->state().isResizing);
    sendMouse(*m_view, QEvent::MouseMove, 2 - 48, Qt::LeftButton);
    sendMouse(*m_view, QEvent::MouseButtonRelease, 2 - 48, Qt::NoButton);

    QCOMPARE(spy.count(), 1);
    QVERIFY(!m_store->state().isResizing);
    QCOMPARE(core::findTask(m_store->state().tasks, QStringLiteral("A"))->startDate, QDate(2025, 7, 9));
}

void GanttChartViewTest::escapeCancelsAndFinishesGesture()
{
    QSignalSpy spy(m_view.get(), &ui::GanttChartView::gestureFinished);

    sendMouse(*m_view, QEvent::MouseButtonPress, BodyX, Qt::LeftButton);
    sendMouse(*m_view, QEvent::MouseMove, BodyX + 96, Qt::LeftButton);
    QCOMPARE(core::findTask(m_store->state().tasks, QStringLiteral("A"))->startDate, QDate(2025, 7, 12));

    QKeyEvent escape(QEvent::KeyPress, Qt::Key_Escape, Qt::NoModifier);
    QCoreApplication::sendEvent(m_view.get(), &escape);
    QVERIFY(!m_view->isInteracting());
    QCOMPARE(spy.count(), 1);
    QCOMPARE(core::findTask(m_store->state().tasks, QStringLiteral("A"))->startDate, QDate(2025, 7, 10));
}

void GanttChartViewTest::plainReleaseIsNotAGesture()
{
    QSignalSpy spy(m_view.get(), &ui::GanttChartView::gestureFinished);

    m_view->cancelInteraction();
    sendMouse(*m_view, QEvent::MouseButtonRelease, BodyX, Qt::NoButton);
    QCOMPARE(spy.count(), 0);
}

QTEST_MAIN(GanttChartViewTest)
#include "GanttChartViewTest.moc"
