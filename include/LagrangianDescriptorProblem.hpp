#pragma once
/**
 * @file LagrangianDescriptorProblem.hpp
 * @brief Lagrangian descriptor problem over a grid of initial conditions and
 *        its solve entry point.
 *
 * @details
 * A LagrangianDescriptorProblem is built from an ODEProblem, a pointwise
 * descriptor M(du, u, p, t) and a grid of initial conditions. Construction
 * validates the configuration, picks the strategy for the requested method
 * and stores the ensemble ready to be solved; it performs no integration.
 *
 * Example (periodically forced Duffing oscillator):
 * ```
 * VectorField f = [](vec_real& du, const vec_real& u, const vec_real& p, real_t t) {
 *     du[0] = u[1];
 *     du[1] = u[0] - u[0]*u[0]*u[0] + p[0]*std::cos(p[1]*t);
 * };
 * ODEProblem prob(f, {0.5, 2.2}, {0.0, 13.0}, {0.3, M_PI});
 * DescriptorFunction M = [](const vec_real& du, const vec_real&, const vec_real&, real_t) {
 *     return std::hypot(du[0], du[1]);
 * };
 * auto grid = InitialConditionGrid::rectangular(-1.8, 1.8, 301, -1.0, 1.0, 301);
 * LagrangianDescriptorProblem lagprob(prob, M, grid);
 * LagrangianDescriptorSolution lagsol = solve(lagprob);
 * mat_real forward = lagsol.field.toMatrix(Branch::Forward, lagsol.grid);
 * ```
 */

#include "common.hpp"
#include "ODEProblem.hpp"
#include "ODEStepper.hpp"
#include "DescriptorField.hpp"
#include "PostQuadrature.hpp"
#include "SubproblemStrategy.hpp"
#include "EnsembleSolver.hpp"

/**
 * @struct DescriptorOptions
 * @brief Descriptor-level choices, validated once at construction.
 */
struct DescriptorOptions
{
    Direction direction = Direction::Both;                ///< Branches to compute.
    Method method = Method::Augmented;                    ///< Computation strategy.
    QuadratureRule quadrature = QuadratureRule::CubicSpline; ///< Post-processed rule.
};

/**
 * @class LagrangianDescriptorProblem
 * @brief Validated ensemble specification of a Lagrangian descriptor field.
 *
 * @section fields Fields
 * - ensemble  : template (augmented or original), strategy and integrator
 *               options forwarded to the stepper.
 * - grid      : initial conditions, shared read-only with the strategy.
 * - direction : branches computed.
 * - method    : augmented or post-processed.
 */
class LagrangianDescriptorProblem
{
  private:
    std::shared_ptr<const InitialConditionGrid> uu0; ///< Initial conditions.
    DescriptorOptions descriptorOptions;             ///< Direction, method, rule.
    EnsembleProblem ensprob;                         ///< Ready-to-solve ensemble.

    /// Validate everything and build the ensemble; throws before any member is used.
    static EnsembleProblem makeEnsemble(const ODEProblem& prob, const DescriptorFunction& M,
                                        const std::shared_ptr<const InitialConditionGrid>& grid,
                                        const DescriptorOptions& options,
                                        const IntegratorOptions& integratorOptions);

  public:
    /**
     * @brief Construct and validate a descriptor problem.
     * @param prob              Template problem; its u0 is replaced per grid entry.
     * @param M                 Pointwise descriptor M(du, u, p, t).
     * @param grid              Initial conditions, each of prob's dimension.
     * @param options           Direction (default both) and method (default augmented).
     * @param integratorOptions Forwarded verbatim to the ODEStepper.
     *
     * @throws ConfigurationError for an invalid method (checked first), an
     *         invalid direction, an empty M, a grid entry of the wrong
     *         dimension, a post-processed run without saved steps, or
     *         invalid integrator options.
     */
    LagrangianDescriptorProblem(const ODEProblem& prob, const DescriptorFunction& M,
                                InitialConditionGrid grid,
                                const DescriptorOptions& options = DescriptorOptions{},
                                const IntegratorOptions& integratorOptions = IntegratorOptions{});

    const EnsembleProblem& ensemble() const { return ensprob; }
    const InitialConditionGrid& grid() const { return *uu0; }
    Direction direction() const { return descriptorOptions.direction; }
    Method method() const { return descriptorOptions.method; }
    const DescriptorOptions& options() const { return descriptorOptions; }
};

/**
 * @struct LagrangianDescriptorSolution
 * @brief Descriptor field of one solve, with the grid it was computed on.
 */
struct LagrangianDescriptorSolution
{
    DescriptorField field;              ///< One record per grid entry.
    InitialConditionGrid grid;          ///< Grid of the problem.
    Direction direction;                ///< Branches present in each record.
    Method method;                      ///< Strategy used.
    std::vector<size_t> failed;         ///< Failed subproblem indices (non fail-fast runs).
    std::vector<std::string> messages;  ///< Failure message per entry of `failed`.
};

/**
 * @brief Solve a descriptor problem. Every call builds fresh subproblems.
 * @throws IntegrationError if options.failFast and any subproblem failed.
 */
LagrangianDescriptorSolution solve(const LagrangianDescriptorProblem& problem,
                                   const EnsembleOptions& options = EnsembleOptions{});
