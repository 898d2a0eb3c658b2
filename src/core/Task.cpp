#include "todotxt/core/Task.hpp"

namespace todotxt {
namespace core {

bool operator==(const TaskAttribute &lhs, const TaskAttribute &rhs)
{
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

bool operator!=(const TaskAttribute &lhs, const TaskAttribute &rhs)
{
    return !(lhs == rhs);
}

bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.isComplete == rhs.isComplete
        && lhs.priority == rhs.priority
        && lhs.description == rhs.description
        && lhs.projects == rhs.projects
        && lhs.contexts == rhs.contexts
        && lhs.attributes == rhs.attributes;
}

bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

} // namespace core
} // namespace todotxt
