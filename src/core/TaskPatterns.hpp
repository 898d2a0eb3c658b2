#pragma once

#include <QRegularExpression>

namespace todotxt {
namespace core {

// Shared matchers, built on first use and never modified afterwards.

// Optional "x " then optional "(A) " at the very start of a line.
const QRegularExpression &markerPattern();
// "(A) " at the very start of a text.
const QRegularExpression &priorityPattern();
const QRegularExpression &projectPattern();
const QRegularExpression &contextPattern();
const QRegularExpression &attributePattern();
const QRegularExpression &wordPattern();

} // namespace core
} // namespace todotxt
