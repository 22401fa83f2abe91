#pragma once

#include <QString>
#include <QtGlobal>
#include <optional>

namespace tasklist {
namespace data {

struct TaskItem
{
    qint64 id = 0;
    QString title;
    std::optional<QString> description;
    bool done = false;
    bool deleted = false;
};

inline bool operator==(const TaskItem &lhs, const TaskItem &rhs)
{
    return lhs.id == rhs.id && lhs.title == rhs.title && lhs.description == rhs.description
        && lhs.done == rhs.done && lhs.deleted == rhs.deleted;
}

inline bool operator!=(const TaskItem &lhs, const TaskItem &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace tasklist
