#include <QtTest/QtTest>

#include "gantt/core/TaskTree.hpp"
#include "gantt/data/DemoData.hpp"

using namespace gantt;

class DemoDataTest : public QObject
{
    Q_OBJECT

private slots:
    void hasTwoPhasesAndMilestone();
    void parentIdsMatchContainment();
    void expansionDefaults();
    void milestoneIsSingleDay();
};

void DemoDataTest::hasTwoPhasesAndMilestone()
{
    const auto tasks = data::createDemoTasks();
    QCOMPARE(tasks.size(), 3);
    QCOMPARE(core::countTasks(tasks), 8);
    QCOMPARE(core::subtreeSize(tasks.at(0)), 4);
    QCOMPARE(tasks.at(0)->children.size(), 3);
    QCOMPARE(tasks.at(2)->children.size(), 2);
    for (int i = 0; i < tasks.size(); ++i) {
        QCOMPARE(tasks.at(i)->order, i);
    }
}

void DemoDataTest::parentIdsMatchContainment()
{
    const auto tasks = data::createDemoTasks();
    for (const QString &id : QStringList({ "1", "2", "3", "4", "5", "6", "7", "8" })) {
        const auto task = core::findTask(tasks, id);
        QVERIFY2(task, qPrintable(id));
        const auto parent = core::parentOf(tasks, id);
        QCOMPARE(task->parentId, parent ? parent->id : QString());
        QVERIFY(task->startDate <= task->endDate);
    }
}

void DemoDataTest::expansionDefaults()
{
    const auto tasks = data::createDemoTasks();
    QVERIFY(core::findTask(tasks, QStringLiteral("1"))->isExpanded);
    QVERIFY(!core::findTask(tasks, QStringLiteral("6"))->isExpanded);
}

void DemoDataTest::milestoneIsSingleDay()
{
    const auto milestone = core::findTask(data::createDemoTasks(), QStringLiteral("5"));
    QVERIFY(milestone);
    QCOMPARE(milestone->startDate, milestone->endDate);
    QCOMPARE(milestone->status, data::TaskStatus::NotStarted);
    QVERIFY(!milestone->hasChildren());
}

QTEST_GUILESS_MAIN(DemoDataTest)
#include "DemoDataTest.moc"
