#include "todotxt/core/TaskSerializer.hpp"

namespace todotxt {
namespace core {

namespace {
void chopTrailingWhitespace(QString &text)
{
    int end = text.size();
    while (end > 0 && text.at(end - 1).isSpace()) {
        --end;
    }
    text.truncate(end);
}
} // namespace

QString serializeTask(const Task &task)
{
    QString line;

    if (task.isComplete) {
        line += QLatin1String("x ");
    }

    if (task.priority) {
        line += QLatin1Char('(');
        line += *task.priority;
        line += QLatin1String(") ");
    }

    // Written even when empty, which can leave a double space before the tags.
    line += task.description;
    line += QLatin1Char(' ');

    for (const QString &project : task.projects) {
        line += QLatin1Char('+') + project + QLatin1Char(' ');
    }
    for (const QString &context : task.contexts) {
        line += QLatin1Char('@') + context + QLatin1Char(' ');
    }
    for (const TaskAttribute &attribute : task.attributes) {
        line += attribute.key + QLatin1Char(':') + attribute.value + QLatin1Char(' ');
    }

    chopTrailingWhitespace(line);
    return line;
}

} // namespace core
} // namespace todotxt
