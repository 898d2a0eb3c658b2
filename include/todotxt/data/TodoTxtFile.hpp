#pragma once

#include <QString>
#include <QVector>
#include <optional>

#include "todotxt/core/Task.hpp"

namespace todotxt {
namespace data {

constexpr auto TodoFileSettingsKey = "storage/todoFile";

// The "storage/todoFile" setting, or todo.txt in the application data directory.
QString defaultTodoFilePath();

// Reads a todo.txt file, one task per non-blank line, each line parsed on its own.
// A missing file reads as an empty list; std::nullopt means the file could not be opened.
std::optional<QVector<core::Task>> readTodoFile(const QString &filePath);

// Writes one serialized task per line, replacing the file atomically. Nothing is written
// and false is returned when a task would not come back as exactly one line.
bool writeTodoFile(const QString &filePath, const QVector<core::Task> &tasks);

} // namespace data
} // namespace todotxt
