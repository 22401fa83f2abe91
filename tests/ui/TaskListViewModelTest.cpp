#include <QtTest/QtTest>

#include "tasklist/core/TaskStore.hpp"
#include "tasklist/data/InMemoryTaskRepository.hpp"
#include "tasklist/ui/models/TaskFilterProxyModel.hpp"
#include "tasklist/ui/models/TaskListModel.hpp"
#include "tasklist/ui/viewmodels/TaskListViewModel.hpp"

using namespace tasklist;

namespace {

class BrokenTaskRepository : public data::InMemoryTaskRepository
{
public:
    bool setDeleted(qint64 id, bool deleted) override
    {
        if (broken) {
            return false;
        }
        return InMemoryTaskRepository::setDeleted(id, deleted);
    }

    bool updateTask(qint64 id, const QString &title, const std::optional<QString> &description) override
    {
        if (broken) {
            return false;
        }
        return InMemoryTaskRepository::updateTask(id, title, description);
    }

    QString lastError() const override
    {
        return QStringLiteral("database is locked");
    }

    bool broken = false;
};

qint64 addTask(ui::TaskListViewModel &viewModel, const QString &title, const QString &description = QString())
{
    viewModel.setNewTitle(title);
    viewModel.setNewDescription(description);
    if (!viewModel.addTask()) {
        return 0;
    }
    return viewModel.visibleTasks().back().id;
}

} // namespace

class TaskListViewModelTest : public QObject
{
    Q_OBJECT

private slots:
    void addClearsFormOnSuccess();
    void addKeepsFormOnBlankTitle();
    void filterSelectsVisibleTasks();
    void proxyFollowsFilter();
    void startEditSeedsBuffers();
    void saveEditUpdatesAndLeavesEditMode();
    void saveWithBlankTitleDiscardsEdit();
    void cancelEditDiscardsBuffers();
    void switchingEditTargetDiscardsBuffers();
    void deletedTasksCannotBeEdited();
    void editEndsWhenTaskDisappears();
    void actionsFollowTaskState();
    void applyIgnoresUnavailableActions();
    void checkBoxTogglesTask();
    void storageFailureIsReported();
};

void TaskListViewModelTest::addClearsFormOnSuccess()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    QSignalSpy cleared(&viewModel, &ui::TaskListViewModel::newTaskFormCleared);

    viewModel.setNewTitle(QStringLiteral(" Buy milk "));
    viewModel.setNewDescription(QStringLiteral(""));
    QVERIFY(viewModel.apply({ ui::UserAction::Kind::Add }));

    QCOMPARE(cleared.count(), 1);
    QVERIFY(viewModel.newTitle().isEmpty());
    QVERIFY(viewModel.newDescription().isEmpty());
    QCOMPARE(viewModel.visibleTasks().size(), static_cast<size_t>(1));
    QCOMPARE(viewModel.visibleTasks().front().title, QStringLiteral("Buy milk"));
    QCOMPARE(viewModel.model()->rowCount(), 1);
}

void TaskListViewModelTest::addKeepsFormOnBlankTitle()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    QSignalSpy cleared(&viewModel, &ui::TaskListViewModel::newTaskFormCleared);
    QSignalSpy errors(&viewModel, &ui::TaskListViewModel::errorOccurred);

    viewModel.setNewTitle(QStringLiteral("   "));
    viewModel.setNewDescription(QStringLiteral("details"));
    QVERIFY(!viewModel.addTask());

    QCOMPARE(cleared.count(), 0);
    QCOMPARE(errors.count(), 0);
    QCOMPARE(viewModel.newDescription(), QStringLiteral("details"));
    QVERIFY(store.tasks().empty());
}

void TaskListViewModelTest::filterSelectsVisibleTasks()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 open = addTask(viewModel, QStringLiteral("Open"));
    const qint64 done = addTask(viewModel, QStringLiteral("Done"));
    const qint64 gone = addTask(viewModel, QStringLiteral("Gone"));
    QVERIFY(viewModel.toggleDone(done));
    QVERIFY(viewModel.deleteTask(gone));

    QCOMPARE(viewModel.filter(), core::TaskFilter::All);
    QCOMPARE(viewModel.visibleTasks().size(), static_cast<size_t>(2));

    QVERIFY(viewModel.apply({ ui::UserAction::Kind::ChangeFilter, 0, core::TaskFilter::Active }));
    QCOMPARE(viewModel.visibleTasks().size(), static_cast<size_t>(1));
    QCOMPARE(viewModel.visibleTasks().front().id, open);

    viewModel.setFilter(core::TaskFilter::Completed);
    QCOMPARE(viewModel.visibleTasks().size(), static_cast<size_t>(1));
    QCOMPARE(viewModel.visibleTasks().front().id, done);

    viewModel.setFilter(core::TaskFilter::Deleted);
    QCOMPARE(viewModel.visibleTasks().size(), static_cast<size_t>(1));
    QCOMPARE(viewModel.visibleTasks().front().id, gone);

    // Selecting the active filter again is not a change.
    QVERIFY(!viewModel.apply({ ui::UserAction::Kind::ChangeFilter, 0, core::TaskFilter::Deleted }));
}

void TaskListViewModelTest::proxyFollowsFilter()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    addTask(viewModel, QStringLiteral("A"));
    const qint64 b = addTask(viewModel, QStringLiteral("B"), QStringLiteral("notes"));
    auto *proxy = viewModel.proxyModel();

    QCOMPARE(proxy->rowCount(), 2);
    QVERIFY(viewModel.deleteTask(b));
    QCOMPARE(proxy->rowCount(), 1);

    viewModel.setFilter(core::TaskFilter::Deleted);
    QCOMPARE(proxy->rowCount(), 1);
    QCOMPARE(proxy->data(proxy->index(0, 0), Qt::DisplayRole).toString(), QStringLiteral("B"));

    viewModel.setFilter(core::TaskFilter::Completed);
    QCOMPARE(proxy->rowCount(), 0);
}

void TaskListViewModelTest::startEditSeedsBuffers()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Title"), QStringLiteral("Body"));
    QSignalSpy changed(&viewModel, &ui::TaskListViewModel::editStateChanged);

    QVERIFY(std::holds_alternative<ui::Viewing>(viewModel.editState()));
    QVERIFY(viewModel.apply({ ui::UserAction::Kind::StartEdit, id }));

    QCOMPARE(changed.count(), 1);
    QVERIFY(viewModel.editingTaskId() == id);
    QCOMPARE(viewModel.editTitle(), QStringLiteral("Title"));
    QCOMPARE(viewModel.editDescription(), QStringLiteral("Body"));

    // Editing the task that is already being edited is not available.
    QVERIFY(!viewModel.startEdit(id));
}

void TaskListViewModelTest::saveEditUpdatesAndLeavesEditMode()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Old"), QStringLiteral("old notes"));
    QVERIFY(viewModel.toggleDone(id));
    QVERIFY(viewModel.startEdit(id));

    viewModel.setEditTitle(QStringLiteral("  New  "));
    viewModel.setEditDescription(QStringLiteral("   "));
    QVERIFY(viewModel.apply({ ui::UserAction::Kind::SaveEdit, id }));

    QVERIFY(!viewModel.editingTaskId().has_value());
    const auto task = store.taskById(id);
    QVERIFY(task.has_value());
    QCOMPARE(task->title, QStringLiteral("New"));
    QVERIFY(!task->description.has_value());
    QVERIFY(task->done);
    QVERIFY(!task->deleted);
}

void TaskListViewModelTest::saveWithBlankTitleDiscardsEdit()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Keep me"));
    const auto before = store.tasks();
    QVERIFY(viewModel.startEdit(id));

    viewModel.setEditTitle(QStringLiteral("  "));
    QVERIFY(!viewModel.saveEdit());

    QVERIFY(std::holds_alternative<ui::Viewing>(viewModel.editState()));
    QVERIFY(store.tasks() == before);
}

void TaskListViewModelTest::cancelEditDiscardsBuffers()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Original"));
    QVERIFY(viewModel.startEdit(id));
    viewModel.setEditTitle(QStringLiteral("Changed"));

    QVERIFY(viewModel.apply({ ui::UserAction::Kind::CancelEdit, id }));
    QVERIFY(!viewModel.editingTaskId().has_value());
    QCOMPARE(store.taskById(id)->title, QStringLiteral("Original"));
    QVERIFY(viewModel.editTitle().isEmpty());
    QVERIFY(!viewModel.cancelEdit());
}

void TaskListViewModelTest::switchingEditTargetDiscardsBuffers()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 first = addTask(viewModel, QStringLiteral("First"));
    const qint64 second = addTask(viewModel, QStringLiteral("Second"), QStringLiteral("two"));

    QVERIFY(viewModel.startEdit(first));
    viewModel.setEditTitle(QStringLiteral("First edited"));
    QVERIFY(viewModel.startEdit(second));

    QVERIFY(viewModel.editingTaskId() == second);
    QCOMPARE(viewModel.editTitle(), QStringLiteral("Second"));
    QCOMPARE(viewModel.editDescription(), QStringLiteral("two"));
    QCOMPARE(store.taskById(first)->title, QStringLiteral("First"));

    // Save and cancel only apply to the current target.
    QVERIFY(!viewModel.apply({ ui::UserAction::Kind::SaveEdit, first }));
    QVERIFY(!viewModel.apply({ ui::UserAction::Kind::CancelEdit, first }));
    QVERIFY(viewModel.editingTaskId() == second);
}

void TaskListViewModelTest::deletedTasksCannotBeEdited()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Trash"));
    QVERIFY(viewModel.deleteTask(id));

    QVERIFY(!viewModel.startEdit(id));
    QVERIFY(!viewModel.startEdit(id + 50));
    QVERIFY(std::holds_alternative<ui::Viewing>(viewModel.editState()));
}

void TaskListViewModelTest::editEndsWhenTaskDisappears()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Editing"));
    QVERIFY(viewModel.startEdit(id));

    QVERIFY(repo.setDeleted(id, true));
    viewModel.refresh();

    QVERIFY(!viewModel.editingTaskId().has_value());
}

void TaskListViewModelTest::actionsFollowTaskState()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 plain = addTask(viewModel, QStringLiteral("Plain"));
    const qint64 edited = addTask(viewModel, QStringLiteral("Edited"));
    const qint64 deleted = addTask(viewModel, QStringLiteral("Deleted"));
    QVERIFY(viewModel.deleteTask(deleted));
    QVERIFY(viewModel.startEdit(edited));

    QVERIFY(viewModel.actionsFor(plain) ==
             ui::TaskActions(ui::TaskAction::ToggleDone | ui::TaskAction::StartEdit | ui::TaskAction::Delete));
    QVERIFY(viewModel.actionsFor(edited) ==
             ui::TaskActions(ui::TaskAction::ToggleDone | ui::TaskAction::SaveEdit | ui::TaskAction::CancelEdit));
    QVERIFY(viewModel.actionsFor(deleted) == ui::TaskActions(ui::TaskAction::Restore));
    QVERIFY(viewModel.actionsFor(qint64(1000)) == ui::TaskActions());

    const auto rows = viewModel.visibleRows();
    QCOMPARE(rows.size(), static_cast<size_t>(2));
    for (const auto &row : rows) {
        QVERIFY(!row.actions.testFlag(ui::TaskAction::Restore));
    }
}

void TaskListViewModelTest::applyIgnoresUnavailableActions()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 live = addTask(viewModel, QStringLiteral("Live"));
    const qint64 gone = addTask(viewModel, QStringLiteral("Gone"));
    QVERIFY(viewModel.deleteTask(gone));
    const auto before = store.tasks();

    QVERIFY(!viewModel.apply({ ui::UserAction::Kind::Restore, live }));
    QVERIFY(!viewModel.apply({ ui::UserAction::Kind::ToggleDone, gone }));
    QVERIFY(!viewModel.apply({ ui::UserAction::Kind::Delete, gone }));
    QVERIFY(!viewModel.apply({ ui::UserAction::Kind::SaveEdit, live }));
    QVERIFY(store.tasks() == before);

    QVERIFY(viewModel.apply({ ui::UserAction::Kind::Restore, gone }));
    QVERIFY(!store.taskById(gone)->deleted);
}

void TaskListViewModelTest::checkBoxTogglesTask()
{
    data::InMemoryTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Check me"));
    auto *model = viewModel.model();

    QVERIFY(model->setData(model->indexForId(id), Qt::Checked, Qt::CheckStateRole));
    // The toggle is delivered on the next event loop turn.
    QVERIFY(!store.taskById(id)->done);
    QTRY_VERIFY(store.taskById(id)->done);
    QCOMPARE(model->data(model->indexForId(id), Qt::CheckStateRole).toInt(), static_cast<int>(Qt::Checked));
}

void TaskListViewModelTest::storageFailureIsReported()
{
    BrokenTaskRepository repo;
    core::TaskStore store(repo);
    ui::TaskListViewModel viewModel(store);
    const qint64 id = addTask(viewModel, QStringLiteral("Fragile"));
    QVERIFY(viewModel.startEdit(id));
    viewModel.setEditTitle(QStringLiteral("Changed"));
    const auto before = store.tasks();
    QSignalSpy errors(&viewModel, &ui::TaskListViewModel::errorOccurred);

    repo.broken = true;
    QVERIFY(!viewModel.saveEdit());
    QCOMPARE(errors.count(), 1);
    QVERIFY(errors.takeFirst().at(0).toString().contains(QStringLiteral("database is locked")));
    // The edit survives a failed save.
    QVERIFY(viewModel.editingTaskId() == id);
    QCOMPARE(viewModel.editTitle(), QStringLiteral("Changed"));

    QVERIFY(viewModel.cancelEdit());
    QVERIFY(!viewModel.deleteTask(id));
    QCOMPARE(errors.count(), 1);
    QVERIFY(store.tasks() == before);
    QCOMPARE(viewModel.model()->rowCount(), 1);
}

QTEST_GUILESS_MAIN(TaskListViewModelTest)
#include "TaskListViewModelTest.moc"
