#include <QtTest/QtTest>

#include "gantt/core/TaskTree.hpp"
#include "gantt/data/DemoData.hpp"

using namespace gantt;

namespace {

data::Task task(const QString &id, const QString &name)
{
    data::Task t;
    t.id = id;
    t.name = name;
    t.startDate = QDate(2025, 7, 10);
    t.endDate = QDate(2025, 7, 12);
    return t;
}

} // namespace

class TaskTreeTest : public QObject
{
    Q_OBJECT

private slots:
    void findTaskSearchesNestedNodes();
    void updateSharesUntouchedSubtrees();
    void missesReturnInput();
    void insertAboveAndBelowKeepParent();
    void insertSubtaskExpandsTarget();
    void deleteRemovesWholeSubtree();
    void moveReparentsTask();
    void moveRejectsCycles();
    void visibleRowsFollowExpansion();
};

void TaskTreeTest::findTaskSearchesNestedNodes()
{
    const auto tasks = data::createDemoTasks();
    const auto found = core::findTask(tasks, QStringLiteral("8"));
    QVERIFY(found);
    QCOMPARE(found->name, QStringLiteral("Frontend Development"));
    QVERIFY(!core::findTask(tasks, QStringLiteral("missing")));

    const auto parent = core::parentOf(tasks, QStringLiteral("8"));
    QVERIFY(parent);
    QCOMPARE(parent->id, QStringLiteral("6"));
    QVERIFY(!core::parentOf(tasks, QStringLiteral("6")));
}

void TaskTreeTest::updateSharesUntouchedSubtrees()
{
    const auto tasks = data::createDemoTasks();
    data::TaskUpdate update;
    update.progress = 90;
    const auto updated = core::updateTask(tasks, QStringLiteral("3"), update);

    QCOMPARE(core::findTask(updated, QStringLiteral("3"))->progress, 90);
    QCOMPARE(core::findTask(tasks, QStringLiteral("3"))->progress, 75);

    // Only the path from the root to the edited node is rebuilt.
    QVERIFY(updated.at(0) != tasks.at(0));
    QCOMPARE(updated.at(1).get(), tasks.at(1).get());
    QCOMPARE(updated.at(2).get(), tasks.at(2).get());
    QCOMPARE(updated.at(0)->children.at(0).get(), tasks.at(0)->children.at(0).get());
    QCOMPARE(updated.at(0)->children.at(2).get(), tasks.at(0)->children.at(2).get());
}

void TaskTreeTest::missesReturnInput()
{
    const auto tasks = data::createDemoTasks();
    data::TaskUpdate update;
    update.name = QStringLiteral("Nope");

    const auto updated = core::updateTask(tasks, QStringLiteral("42"), update);
    QVERIFY(updated == tasks);

    const auto inserted = core::insertTask(tasks, task(QStringLiteral("x"), QStringLiteral("X")),
                                           core::InsertPosition::Below, QStringLiteral("42"));
    QVERIFY(inserted == tasks);

    QVERIFY(core::deleteTask(tasks, QStringLiteral("42")) == tasks);
}

void TaskTreeTest::insertAboveAndBelowKeepParent()
{
    const auto tasks = data::createDemoTasks();
    auto result = core::insertTask(tasks, task(QStringLiteral("a"), QStringLiteral("Above")),
                                   core::InsertPosition::Above, QStringLiteral("3"));
    result = core::insertTask(result, task(QStringLiteral("b"), QStringLiteral("Below")),
                              core::InsertPosition::Below, QStringLiteral("3"));

    const auto &children = result.at(0)->children;
    QCOMPARE(children.size(), 5);
    QCOMPARE(children.at(1)->id, QStringLiteral("a"));
    QCOMPARE(children.at(2)->id, QStringLiteral("3"));
    QCOMPARE(children.at(3)->id, QStringLiteral("b"));
    QCOMPARE(children.at(1)->parentId, QStringLiteral("1"));
    QCOMPARE(children.at(3)->parentId, QStringLiteral("1"));

    const auto rootInsert = core::insertTask(tasks, task(QStringLiteral("r"), QStringLiteral("Root")),
                                             core::InsertPosition::Above, QStringLiteral("5"));
    QCOMPARE(rootInsert.size(), 4);
    QCOMPARE(rootInsert.at(1)->id, QStringLiteral("r"));
    QVERIFY(rootInsert.at(1)->parentId.isEmpty());
}

void TaskTreeTest::insertSubtaskExpandsTarget()
{
    const auto tasks = data::createDemoTasks();
    QVERIFY(!tasks.at(2)->isExpanded);
    const auto result = core::insertTask(tasks, task(QStringLiteral("s"), QStringLiteral("Sub")),
                                         core::InsertPosition::Subtask, QStringLiteral("6"));

    const auto parent = result.at(2);
    QVERIFY(parent->isExpanded);
    QCOMPARE(parent->children.size(), 3);
    QCOMPARE(parent->children.last()->id, QStringLiteral("s"));
    QCOMPARE(parent->children.last()->parentId, QStringLiteral("6"));
}

void TaskTreeTest::deleteRemovesWholeSubtree()
{
    const auto tasks = data::createDemoTasks();
    QCOMPARE(core::countTasks(tasks), 8);

    const auto result = core::deleteTask(tasks, QStringLiteral("1"));
    QCOMPARE(core::countTasks(result), 4);
    QVERIFY(!core::findTask(result, QStringLiteral("2")));
    QCOMPARE(result.at(0).get(), tasks.at(1).get());

    const auto nested = core::deleteTask(tasks, QStringLiteral("7"));
    QCOMPARE(core::countTasks(nested), 7);
    QCOMPARE(nested.at(2)->children.size(), 1);
}

void TaskTreeTest::moveReparentsTask()
{
    const auto tasks = data::createDemoTasks();
    const auto result = core::moveTask(tasks, QStringLiteral("5"), QStringLiteral("6"), 0);

    QCOMPARE(result.size(), 2);
    const auto moved = core::findTask(result, QStringLiteral("5"));
    QVERIFY(moved);
    QCOMPARE(moved->parentId, QStringLiteral("6"));
    QCOMPARE(core::parentOf(result, QStringLiteral("5"))->id, QStringLiteral("6"));
    QCOMPARE(result.at(1)->children.at(0)->id, QStringLiteral("5"));

    const auto toRoot = core::moveTask(result, QStringLiteral("5"), QString(), 99);
    QCOMPARE(toRoot.size(), 3);
    QCOMPARE(toRoot.last()->id, QStringLiteral("5"));
    QVERIFY(toRoot.last()->parentId.isEmpty());
}

void TaskTreeTest::moveRejectsCycles()
{
    const auto tasks = data::createDemoTasks();
    QVERIFY(core::moveTask(tasks, QStringLiteral("1"), QStringLiteral("1"), 0) == tasks);
    QVERIFY(core::moveTask(tasks, QStringLiteral("1"), QStringLiteral("3"), 0) == tasks);
    QVERIFY(core::moveTask(tasks, QStringLiteral("1"), QStringLiteral("missing"), 0) == tasks);
    QVERIFY(core::moveTask(tasks, QStringLiteral("missing"), QString(), 0) == tasks);
    QVERIFY(core::isDescendantOf(tasks, QStringLiteral("3"), QStringLiteral("1")));
    QVERIFY(!core::isDescendantOf(tasks, QStringLiteral("1"), QStringLiteral("3")));
}

void TaskTreeTest::visibleRowsFollowExpansion()
{
    const auto tasks = data::createDemoTasks();
    const auto rows = core::visibleRows(tasks);

    QStringList ids;
    for (const auto &row : rows) {
        ids << row.task->id;
    }
    QCOMPARE(ids, QStringList({ "1", "2", "3", "4", "5", "6" }));
    QCOMPARE(rows.at(0).level, 0);
    QCOMPARE(rows.at(1).level, 1);
    QCOMPARE(rows.at(5).level, 0);
}

QTEST_GUILESS_MAIN(TaskTreeTest)
#include "TaskTreeTest.moc"
