#pragma once

#include <QChar>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

namespace todotxt {
namespace core {

struct TaskAttribute
{
    QString key;
    QString value;
};

bool operator==(const TaskAttribute &lhs, const TaskAttribute &rhs);
bool operator!=(const TaskAttribute &lhs, const TaskAttribute &rhs);

// One todo.txt line in structured form. Tags and attributes keep their order of
// appearance, duplicates included.
struct Task
{
    bool isComplete = false;
    std::optional<QChar> priority; // 'A'..'Z'
    QString description;
    QStringList projects;
    QStringList contexts;
    QVector<TaskAttribute> attributes;
};

bool operator==(const Task &lhs, const Task &rhs);
bool operator!=(const Task &lhs, const Task &rhs);

} // namespace core
} // namespace todotxt
