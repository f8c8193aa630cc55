#pragma once
/**
 * @file PostQuadrature.hpp
 * @brief Post-hoc time integral of a pointwise descriptor along a stored
 *        trajectory.
 *
 * @details
 * The descriptor M is evaluated at every sample (t_j, u_j) of the trajectory,
 * with the derivative recomputed from the trajectory's own vector field:
 *     m_j = M(f(u_j, p, t_j), u_j, p, t_j).
 * The samples are then integrated over elapsed time |t_j - t_0|, so a
 * trajectory traversed backward in time yields the same (non-negative for
 * M >= 0) magnitude as one traversed forward.
 *
 * The cubic spline rule integrates the natural cubic spline through the
 * samples exactly; its second derivatives come from a tridiagonal LAPACK solve.
 */

#include "common.hpp"
#include "ODEStepper.hpp"

/**
 * @enum QuadratureRule
 * @brief Rule used to integrate the sampled descriptor values.
 */
enum class QuadratureRule { Trapezoidal, CubicSpline };

/// Lower-case name of a quadrature rule ("trapezoidal", "spline").
std::string to_string(QuadratureRule rule);

/**
 * @brief Integrate M along a completed trajectory.
 * @param sol  Trajectory with at least two samples.
 * @param M    Pointwise descriptor.
 * @param rule Quadrature rule.
 * @return ∫ M |dt| over the sampled interval.
 *
 * @throws std::invalid_argument if the trajectory has fewer than two samples.
 * @throws std::runtime_error if the LAPACK spline solve fails.
 */
real_t lagrangianDescriptor(const Trajectory& sol, const DescriptorFunction& M,
                            QuadratureRule rule = QuadratureRule::CubicSpline);

/**
 * @brief Integrate samples y_j given at abscissae x_j (strictly increasing).
 * @details Exposed for reuse and testing; lagrangianDescriptor() calls it
 *          with x_j = |t_j - t_0|.
 */
real_t integrateSamples(const vec_real& x, const vec_real& y, QuadratureRule rule);
