#include "todotxt/data/TodoTxtFile.hpp"

#include "todotxt/core/TaskParser.hpp"
#include "todotxt/core/TaskSerializer.hpp"
#include "todotxt/data/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>
#include <QTextStream>

namespace todotxt {
namespace data {

namespace {
bool isBlankLine(const QString &line)
{
    return line.trimmed().isEmpty();
}

bool hasLineBreak(const QString &line)
{
    return line.contains(QLatin1Char('\n')) || line.contains(QLatin1Char('\r'));
}
} // namespace

QString defaultTodoFilePath()
{
    QSettings settings;
    const QString stored = settings.value(QLatin1String(TodoFileSettingsKey)).toString();
    if (!stored.isEmpty()) {
        return stored;
    }

    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/todotxt");
    }
    return QDir(storageFolder).filePath(QStringLiteral("todo.txt"));
}

std::optional<QVector<core::Task>> readTodoFile(const QString &filePath)
{
    QVector<core::Task> tasks;

    QFile file(filePath);
    if (!file.exists()) {
        return tasks;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcTodoTxtData) << "Cannot open" << filePath << ":" << file.errorString();
        return std::nullopt;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        if (isBlankLine(line)) {
            continue;
        }
        tasks.append(core::parseTask(line));
    }

    qCDebug(lcTodoTxtData) << "Read" << tasks.size() << "tasks from" << filePath;
    return tasks;
}

bool writeTodoFile(const QString &filePath, const QVector<core::Task> &tasks)
{
    if (filePath.isEmpty()) {
        return false;
    }

    QStringList lines;
    lines.reserve(tasks.size());
    for (int i = 0; i < tasks.size(); ++i) {
        const QString line = core::serializeTask(tasks.at(i));
        // A blank line is skipped on read and a line break would split the task.
        if (isBlankLine(line) || hasLineBreak(line)) {
            qCWarning(lcTodoTxtData) << "Task" << i << "cannot be stored as one line:" << line;
            return false;
        }
        lines << line;
    }

    QFileInfo info(filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcTodoTxtData) << "Cannot create directory" << dir.path();
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcTodoTxtData) << "Cannot write" << filePath << ":" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");
    for (const QString &line : lines) {
        stream << line << '\n';
    }
    stream.flush();

    if (!file.commit()) {
        qCWarning(lcTodoTxtData) << "Cannot commit" << filePath << ":" << file.errorString();
        return false;
    }
    return true;
}

} // namespace data
} // namespace todotxt
