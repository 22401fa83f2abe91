#pragma once

#include <QSortFilterProxyModel>

#include "tasklist/core/TaskFilter.hpp"

namespace tasklist {
namespace ui {

class TaskFilterProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit TaskFilterProxyModel(QObject *parent = nullptr);

    void setTaskFilter(core::TaskFilter filter);
    core::TaskFilter taskFilter() const;

protected:
    bool filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const override;

private:
    core::TaskFilter m_filter = core::TaskFilter::All;
};

} // namespace ui
} // namespace tasklist
