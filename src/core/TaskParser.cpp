#include "todotxt/core/TaskParser.hpp"

#include "TaskPatterns.hpp"

namespace todotxt {
namespace core {

namespace {
QStringList takeTags(QString &text, const QRegularExpression &pattern)
{
    QStringList tags;
    QRegularExpressionMatchIterator it = pattern.globalMatch(text);
    while (it.hasNext()) {
        tags << it.next().captured(1);
    }
    text.remove(pattern);
    return tags;
}

QVector<TaskAttribute> takeAttributes(QString &text)
{
    QVector<TaskAttribute> attributes;
    QRegularExpressionMatchIterator it = attributePattern().globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        attributes.append(TaskAttribute{ match.captured(1), match.captured(2) });
    }
    text.remove(attributePattern());
    return attributes;
}
} // namespace

Task parseTask(const QString &line)
{
    Task task;

    const QRegularExpressionMatch markers = markerPattern().match(line);
    task.isComplete = markers.capturedLength(1) > 0;
    if (markers.capturedLength(2) > 0) {
        task.priority = markers.captured(2).at(0);
    }

    // Projects first, then contexts, then attributes, each on what the previous pass left.
    QString working = line.mid(markers.capturedEnd(0));
    task.projects = takeTags(working, projectPattern());
    task.contexts = takeTags(working, contextPattern());
    task.attributes = takeAttributes(working);
    task.description = working.trimmed();

    return task;
}

} // namespace core
} // namespace todotxt
