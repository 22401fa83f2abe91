#pragma once

#include <QMainWindow>
#include <memory>
#include <optional>

#include "tasklist/core/TaskFilter.hpp"
#include "tasklist/data/Task.hpp"

class QButtonGroup;
class QLabel;
class QLineEdit;
class QListView;
class QPlainTextEdit;
class QPushButton;

namespace tasklist {
namespace core {
class AppContext;
}

namespace ui {

class TaskListViewModel;
class TaskInlineEditor;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(core::AppContext &context, QWidget *parent = nullptr);
    ~MainWindow() override;

private:
    void setupUi();
    QWidget *createEntryPanel();
    QWidget *createFilterBar();
    QWidget *createTaskPanel();
    void setupShortcuts();
    void addTask();
    void handleFilterSelected(int id);
    void syncFilterButtons(core::TaskFilter filter);
    void editSelectedTask();
    void deleteSelectedTask();
    void restoreSelectedTask();
    void toggleSelectedTask();
    void handleTaskDoubleClicked(const QModelIndex &index);
    void handleEditStateChanged();
    void handleTasksChanged();
    void updateActionButtons();
    void restoreSelection();
    void showError(const QString &message);
    std::optional<data::TaskItem> selectedTask() const;

    core::AppContext &m_context;
    std::unique_ptr<TaskListViewModel> m_viewModel;
    QLineEdit *m_titleField = nullptr;
    QPlainTextEdit *m_descriptionField = nullptr;
    QPushButton *m_addButton = nullptr;
    QButtonGroup *m_filterGroup = nullptr;
    QListView *m_taskView = nullptr;
    QLabel *m_countLabel = nullptr;
    QPushButton *m_editButton = nullptr;
    QPushButton *m_deleteButton = nullptr;
    QPushButton *m_restoreButton = nullptr;
    TaskInlineEditor *m_editor = nullptr;
    std::optional<qint64> m_pendingSelection;
};

} // namespace ui
} // namespace tasklist
