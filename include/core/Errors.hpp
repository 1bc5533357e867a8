#pragma once
#include "core/Grid.hpp"

namespace gridmaze
{

// Raised by Maze::Link when b is not a registered neighbor of a.
class InvalidLink : public std::logic_error
{
public:
    InvalidLink(const Cell& a, const Cell& b)
        : std::logic_error("invalid link: " + ToString(a) + " and " + ToString(b) + " are not neighbors"),
          a_(a), b_(b)
    {
    }

    const Cell& a() const noexcept { return a_; }
    const Cell& b() const noexcept { return b_; }

private:
    Cell a_;
    Cell b_;
};

// Raised by the path reconstructor when `to` cannot be reached from `from`.
class Unreachable : public std::logic_error
{
public:
    Unreachable(const Cell& from, const Cell& to)
        : std::logic_error("unreachable: no path from " + ToString(from) + " to " + ToString(to)),
          from_(from), to_(to)
    {
    }

    const Cell& from() const noexcept { return from_; }
    const Cell& to() const noexcept { return to_; }

private:
    Cell from_;
    Cell to_;
};

} // namespace gridmaze
