#include "todotxt/core/TaskValidator.hpp"

#include "TaskPatterns.hpp"

namespace todotxt {
namespace core {

namespace {
bool isWord(const QString &text)
{
    return wordPattern().match(text).hasMatch();
}

void checkNames(const QStringList &names, const QString &kind, QStringList &problems)
{
    for (int i = 0; i < names.size(); ++i) {
        if (!isWord(names.at(i))) {
            problems << QStringLiteral("%1 %2 \"%3\" is not a word").arg(kind).arg(i).arg(names.at(i));
        }
    }
}
} // namespace

QStringList validateTask(const Task &task)
{
    QStringList problems;

    if (task.priority) {
        const ushort letter = task.priority->unicode();
        if (letter < 'A' || letter > 'Z') {
            problems << QStringLiteral("priority \"%1\" is not an uppercase letter").arg(*task.priority);
        }
    }

    checkNames(task.projects, QStringLiteral("project"), problems);
    checkNames(task.contexts, QStringLiteral("context"), problems);

    for (int i = 0; i < task.attributes.size(); ++i) {
        const TaskAttribute &attribute = task.attributes.at(i);
        if (!isWord(attribute.key) || !isWord(attribute.value)) {
            problems << QStringLiteral("attribute %1 \"%2:%3\" is not a word pair")
                            .arg(i)
                            .arg(attribute.key, attribute.value);
        }
    }

    const QString &description = task.description;
    if (description != description.trimmed()) {
        problems << QStringLiteral("description has leading or trailing whitespace");
    }

    QString remaining = description;
    if (projectPattern().match(remaining).hasMatch()) {
        problems << QStringLiteral("description contains a project tag");
    }
    remaining.remove(projectPattern());
    if (contextPattern().match(remaining).hasMatch()) {
        problems << QStringLiteral("description contains a context tag");
    }
    remaining.remove(contextPattern());
    if (attributePattern().match(remaining).hasMatch()) {
        problems << QStringLiteral("description contains a key:value attribute");
    }

    const bool hasTrailingTokens = !task.projects.isEmpty() || !task.contexts.isEmpty()
        || !task.attributes.isEmpty();

    // Markers are only recognised at the start of the line. The text written there is the
    // description plus the separator before any tags.
    if (!task.priority) {
        const QString leading = hasTrailingTokens ? description + QLatin1Char(' ') : description;
        if (!task.isComplete && leading.startsWith(QLatin1String("x "))) {
            problems << QStringLiteral("description starts with a completion marker");
        } else if (priorityPattern().match(leading).hasMatch()) {
            problems << QStringLiteral("description starts with a priority marker");
        }
    }

    // "x" or "(A)" alone lose their trailing space when the line is written.
    if (description.isEmpty() && !hasTrailingTokens && (task.isComplete || task.priority)) {
        problems << QStringLiteral("completion or priority marker without any following text");
    }

    return problems;
}

bool isValidTask(const Task &task)
{
    return validateTask(task).isEmpty();
}

} // namespace core
} // namespace todotxt
