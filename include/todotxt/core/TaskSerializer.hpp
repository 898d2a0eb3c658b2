#pragma once

#include <QString>

#include "todotxt/core/Task.hpp"

namespace todotxt {
namespace core {

// Writes the task in canonical order: completion, priority, description, projects,
// contexts, attributes. Single spaces between tokens, no trailing whitespace.
QString serializeTask(const Task &task);

} // namespace core
} // namespace todotxt
