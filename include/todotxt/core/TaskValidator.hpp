#pragma once

#include <QStringList>

#include "todotxt/core/Task.hpp"

namespace todotxt {
namespace core {

// Lists every reason the task would not read back unchanged after serializeTask().
// An empty list means the task is well-formed. Attribute values are only checked for
// shape, not for meaning.
QStringList validateTask(const Task &task);

bool isValidTask(const Task &task);

} // namespace core
} // namespace todotxt
