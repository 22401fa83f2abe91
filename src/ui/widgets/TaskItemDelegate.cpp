#include "tasklist/ui/widgets/TaskItemDelegate.hpp"

#include "tasklist/ui/models/TaskListModel.hpp"

namespace tasklist {
namespace ui {

TaskItemDelegate::TaskItemDelegate(QObject *parent)
    : QStyledItemDelegate(parent)
{
}

void TaskItemDelegate::initStyleOption(QStyleOptionViewItem *option, const QModelIndex &index) const
{
    QStyledItemDelegate::initStyleOption(option, index);
    const QString description = index.data(TaskListModel::DescriptionRole).toString();
    if (!description.isEmpty()) {
        option->text += QLatin1Char('\n') + description;
    }
}

} // namespace ui
} // namespace tasklist
