#pragma once

#include <QString>

#include "todotxt/core/Task.hpp"

namespace todotxt {
namespace core {

// Parses one todo.txt line. Any text is accepted; whatever does not match a marker,
// tag or attribute ends up in the description.
Task parseTask(const QString &line);

} // namespace core
} // namespace todotxt
