#include "TaskPatterns.hpp"

namespace todotxt {
namespace core {

const QRegularExpression &markerPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\A(x )?(?:\\(([A-Z])\\) )?"));
    return pattern;
}

const QRegularExpression &priorityPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\A\\(([A-Z])\\) "));
    return pattern;
}

const QRegularExpression &projectPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\+([A-Za-z0-9_]+)"));
    return pattern;
}

const QRegularExpression &contextPattern()
{
    static const QRegularExpression pattern(QStringLiteral("@([A-Za-z0-9_]+)"));
    return pattern;
}

const QRegularExpression &attributePattern()
{
    static const QRegularExpression pattern(QStringLiteral("([A-Za-z0-9_]+):([A-Za-z0-9_]+)"));
    return pattern;
}

const QRegularExpression &wordPattern()
{
    static const QRegularExpression pattern(QStringLiteral("\\A[A-Za-z0-9_]+\\z"));
    return pattern;
}

} // namespace core
} // namespace todotxt
