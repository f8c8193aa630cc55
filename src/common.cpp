//==============================================================================
// common.cpp
// Utility functions: approximate equality, finiteness checks, enum names and
// formatted printing.
//==============================================================================

#include "common.hpp"

//------------------------------------------------------------------------------
// Return true if |a - b| < tol (absolute tolerance).
//------------------------------------------------------------------------------
bool almost_equal(double a, double b, double tol)
{
    return std::abs(a - b) < tol;
}

//------------------------------------------------------------------------------
// Return true if |a - b| < tol * max(1, |a|, |b|).
//------------------------------------------------------------------------------
bool relative_equal(double a, double b, double tol)
{
    real_t scale = std::max({1.0, std::abs(a), std::abs(b)});
    return std::abs(a - b) < tol * scale;
}

bool all_finite(const vec_real& vec)
{
    return std::all_of(vec.cbegin(), vec.cend(), [](real_t x){ return std::isfinite(x); });
}

std::string to_string(Direction direction)
{
    switch (direction)
    {
        case Direction::Forward:  return "forward";
        case Direction::Backward: return "backward";
        case Direction::Both:     return "both";
    }
    return "<invalid direction " + std::to_string(static_cast<int>(direction)) + ">";
}

std::string to_string(Method method)
{
    switch (method)
    {
        case Method::Augmented:     return "augmented";
        case Method::Postprocessed: return "postprocessed";
    }
    return "<invalid method " + std::to_string(static_cast<int>(method)) + ">";
}

std::string to_string(Branch branch)
{
    return branch == Branch::Forward ? "forward" : "backward";
}
