#include <QtTest/QtTest>

#include "gantt/core/GanttStore.hpp"
#include "gantt/data/DemoData.hpp"

using namespace gantt;

class GanttStoreTest : public QObject
{
    Q_OBJECT

private slots:
    void dispatchEmitsOnChange();
    void unchangedStateDoesNotEmit();
    void constructorClampsZoom();
};

void GanttStoreTest::dispatchEmitsOnChange()
{
    core::GanttState initial;
    initial.tasks = data::createDemoTasks();
    core::GanttStore store(initial);
    QSignalSpy spy(&store, &core::GanttStore::stateChanged);

    store.dispatch(core::Action::selectTask(QStringLiteral("3")));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(store.state().selectedTaskId, QStringLiteral("3"));

    const auto emitted = spy.takeFirst().at(0).value<core::GanttState>();
    QCOMPARE(emitted.selectedTaskId, QStringLiteral("3"));
}

void GanttStoreTest::unchangedStateDoesNotEmit()
{
    core::GanttStore store;
    QSignalSpy spy(&store, &core::GanttStore::stateChanged);

    store.dispatch(core::Action::selectTask(QStringLiteral("1")));
    store.dispatch(core::Action::selectTask(QStringLiteral("1")));
    store.dispatch(core::Action::toggleTaskExpansion(QStringLiteral("missing")));
    store.dispatch(core::Action::setZoomLevel(core::DefaultZoomLevel));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(store.dispatchCount(), static_cast<std::size_t>(4));
}

void GanttStoreTest::constructorClampsZoom()
{
    core::GanttState initial;
    initial.zoomLevel = 9.0;
    core::GanttStore store(initial);
    QCOMPARE(store.state().zoomLevel, core::MaxZoomLevel);
}

QTEST_GUILESS_MAIN(GanttStoreTest)
#include "GanttStoreTest.moc"
