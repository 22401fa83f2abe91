#pragma once

#include <QStyledItemDelegate>

namespace tasklist {
namespace ui {

// Draws a task row as its title with the description on a second line.
class TaskItemDelegate : public QStyledItemDelegate
{
    Q_OBJECT

public:
    explicit TaskItemDelegate(QObject *parent = nullptr);

protected:
    void initStyleOption(QStyleOptionViewItem *option, const QModelIndex &index) const override;
};

} // namespace ui
} // namespace tasklist
