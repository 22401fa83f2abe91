#pragma once

#include <QAbstractListModel>
#include <QVector>

#include "tasklist/data/Task.hpp"

namespace tasklist {
namespace ui {

class TaskListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        TaskIdRole = Qt::UserRole + 1,
        DescriptionRole,
        DoneRole,
        DeletedRole,
    };

    explicit TaskListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    bool setData(const QModelIndex &index, const QVariant &value, int role = Qt::EditRole) override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;
    QHash<int, QByteArray> roleNames() const override;

    void setTasks(QVector<data::TaskItem> tasks);
    const data::TaskItem *taskAt(const QModelIndex &index) const;
    QModelIndex indexForId(qint64 id) const;

signals:
    // Emitted when the check box of a task is clicked. The model itself does
    // not change; the owner applies the toggle and resets the tasks.
    void toggleDoneRequested(qint64 id);

private:
    QVector<data::TaskItem> m_tasks;
};

} // namespace ui
} // namespace tasklist
