#pragma once
/**
 * @file ODEStepper.hpp
 * @brief Implicit Runge–Kutta (IRK) integrator producing sampled trajectories
 *        of an ODEProblem.
 *
 * @details
 * The ODEStepper advances the state of an ODEProblem over its time span with
 * a fixed step, using an implicit Gauss–Legendre Runge–Kutta scheme. The stage
 * equations are solved by fixed-point iteration. Supported methods are IRK1,
 * IRK2, IRK3.
 *
 * Responsibilities:
 *  - Hold Butcher tableau coefficients (a,b,c) for selected IRK scheme.
 *  - Step in either time orientation (a reversed span gives negative steps).
 *  - Record the sampled trajectory (every step or endpoints only).
 *  - Report failure (no stage convergence, non-finite state) on the
 *    returned Trajectory instead of aborting.
 */

#include "common.hpp"
#include "ODEProblem.hpp"

/**
 * @struct IntegratorOptions
 * @brief Options forwarded untouched from the descriptor problem to the stepper.
 */
struct IntegratorOptions
{
    Scheme scheme = Scheme::IRK3;  ///< Gauss–Legendre scheme.
    real_t dt = 1e-2;              ///< Maximal step size (the span is split evenly).
    real_t precision = 1e-12;      ///< Tolerance of the stage fixed-point iteration.
    int    maxIts = 100;           ///< Maximum stage iterations per step.
    bool   saveEverystep = true;   ///< Keep every step, else only the endpoints.
};

/**
 * @struct Trajectory
 * @brief Sampled solution of one ODEProblem.
 *
 * @details
 * t and u have equal length; t is monotone in the orientation of the span.
 * The problem that produced the trajectory is kept so post-processing can
 * re-evaluate the vector field and its parameters.
 */
struct Trajectory
{
    vec_real t;              ///< Sample times.
    mat_real u;              ///< Sampled states, u[j] at t[j].
    bool success = false;    ///< False if integration stopped early.
    std::string message;     ///< Failure description, empty on success.
    size_t steps = 0;        ///< Number of accepted steps.
    ODEProblem problem;      ///< Problem that was integrated.

    explicit Trajectory(ODEProblem problemIn) : problem(std::move(problemIn)) {}

    /// Terminal state.
    const vec_real& back() const { return u.back(); }
};

/**
 * @class ODEStepper
 * @brief Fixed-step Gauss–Legendre solver for ODEProblem.
 *
 * @section usage Usage
 * - Construct with IntegratorOptions.
 * - Call solve() with a problem; inspect Trajectory::success.
 *
 * @section notes Notes
 * - Precision parameter controls the stage iteration inside each IRK step.
 * - Supported schemes: IRK1 (midpoint), IRK2 (order 4), IRK3 (order 6).
 * - The stepper holds no per-solve state; solve() is const and may be called
 *   concurrently from several threads.
 */
class ODEStepper
{
  private:
    IntegratorOptions options; ///< Step size, tolerance and scheme.

    mat_real a; ///< IRK Butcher tableau coefficients (matrix).
    vec_real b; ///< IRK weights.
    vec_real c; ///< IRK nodes.

    /**
     * @brief Perform one IRK step between tIn and tOut.
     * @param[in]  prob       Problem providing f and p.
     * @param[in]  yIn        State at tIn.
     * @param[out] yOut       State at tOut.
     * @param[in]  tIn        Start time.
     * @param[in]  tOut       End time.
     * @param[out] itsReached Number of stage iterations performed.
     * @param[out] converged  True if stage iteration converged.
     */
    void stepIRK(const ODEProblem& prob, const vec_real& yIn, vec_real& yOut,
                 real_t tIn, real_t tOut, int& itsReached, bool& converged) const;

  public:
    /**
     * @brief Construct ODEStepper with given options.
     * @throws ConfigurationError if dt, precision or maxIts are not positive.
     */
    explicit ODEStepper(const IntegratorOptions& optionsIn = IntegratorOptions{});

    /**
     * @brief Check integrator options without building a stepper.
     * @throws ConfigurationError for a non-positive dt, precision or maxIts,
     *         or an unknown scheme.
     */
    static void validateOptions(const IntegratorOptions& opts);

    /**
     * @brief Integrate prob from tspan.start to tspan.end.
     * @return Sampled trajectory; success=false on divergence or
     *         non-convergence, holding the samples reached so far.
     */
    Trajectory solve(const ODEProblem& prob) const;

    const IntegratorOptions& getOptions() const { return options; }
};
