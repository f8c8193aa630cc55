#pragma once
/**
 * @file ODEProblem.hpp
 * @brief Template dynamical system: vector field, initial state, parameters
 *        and time span, with a clone-with-overrides operation.
 *
 * @details
 * An ODEProblem is the unit handed to the ODEStepper. Ensembles never mutate
 * a template; every subproblem is produced with remake(), which copies the
 * template and replaces only the initial state and/or the time span.
 */

#include "common.hpp"

/// In-place vector field du = f(u, p, t).
using VectorField = std::function<void(vec_real& du, const vec_real& u,
                                       const vec_real& p, real_t t)>;

/// Pointwise descriptor M(du, u, p, t) integrated along trajectories.
using DescriptorFunction = std::function<real_t(const vec_real& du, const vec_real& u,
                                                const vec_real& p, real_t t)>;

/**
 * @struct TimeSpan
 * @brief Integration interval; start may lie after end (backward integration).
 */
struct TimeSpan
{
    real_t start = 0.0;
    real_t end   = 1.0;

    /// Ordered span (min, max).
    TimeSpan forward() const { return {std::min(start, end), std::max(start, end)}; }

    /// Ordered span traversed from max to min.
    TimeSpan reversed() const { return {std::max(start, end), std::min(start, end)}; }

    /// Absolute length of the interval.
    real_t length() const { return std::abs(end - start); }

    bool isForward() const { return end >= start; }
};

/**
 * @class ODEProblem
 * @brief Initial value problem du/dt = f(u, p, t), u(tspan.start) = u0.
 */
class ODEProblem
{
  public:
    VectorField f;   ///< Vector field.
    vec_real u0;     ///< Initial state.
    TimeSpan tspan;  ///< Integration interval.
    vec_real p;      ///< Parameters passed through to f and M.

    /**
     * @brief Construct and validate an initial value problem.
     * @throws ConfigurationError if f is empty, u0 is empty or the span is
     *         degenerate/non-finite.
     */
    ODEProblem(VectorField fIn, vec_real u0In, TimeSpan tspanIn, vec_real pIn = {});

    /**
     * @brief Copy of this problem with the supplied fields replaced.
     * @param u0In    New initial state (dimension must match), or nullopt.
     * @param tspanIn New time span, or nullopt.
     */
    ODEProblem remake(std::optional<vec_real> u0In,
                      std::optional<TimeSpan> tspanIn = std::nullopt) const;

    /// State dimension.
    size_t dimension() const { return u0.size(); }
};
