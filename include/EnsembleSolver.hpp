#pragma once
/**
 * @file EnsembleSolver.hpp
 * @brief Batch execution of the independent subproblems of a Lagrangian
 *        descriptor ensemble and assembly of the ordered descriptor field.
 *
 * @details
 * An EnsembleProblem bundles the template problem, the strategy that builds
 * and extracts each subproblem, and the integrator options forwarded
 * untouched to the ODEStepper. The EnsembleSolver runs all subproblems and
 * assembles a DescriptorField of one record per grid entry:
 *  - without reduction, the record of subproblem i goes to position
 *    key(i).pairIndex (= i);
 *  - with reduction, the field is pre-sized to the grid and every record is
 *    folded in by the strategy under its pair index.
 *
 * Parallel variants (compile-time):
 *  - USE_OPENMP : threads share the subproblem loop; reduce() runs in a
 *                 critical section.
 *  - USE_MPI    : round-robin distribution over ranks, results summed into
 *                 every rank with MPI_Allreduce, then assembled in index order.
 *  - USE_HYBRID : MPI across ranks, OpenMP inside each rank.
 */

#include "common.hpp"
#include "ODEProblem.hpp"
#include "ODEStepper.hpp"
#include "DescriptorField.hpp"
#include "SubproblemStrategy.hpp"

/**
 * @struct EnsembleProblem
 * @brief Template, strategy and pass-through integrator options of one ensemble.
 */
struct EnsembleProblem
{
    ODEProblem prob;                                   ///< Template (augmented for Method::Augmented).
    std::shared_ptr<const SubproblemStrategy> strategy; ///< Build/extract/reduce.
    IntegratorOptions integratorOptions;               ///< Forwarded verbatim to ODEStepper.

    size_t numSubproblems() const { return strategy->numSubproblems(); }
    size_t numRecords() const { return strategy->getGrid().size(); }
};

/**
 * @struct EnsembleOptions
 * @brief Execution behaviour of the ensemble solver.
 */
struct EnsembleOptions
{
    bool failFast = true;  ///< Throw IntegrationError if any subproblem failed.
    bool verbose  = false; ///< Print per-subproblem progress and timing.
};

/**
 * @struct EnsembleSolution
 * @brief Assembled field plus the subproblems that failed.
 */
struct EnsembleSolution
{
    DescriptorField field;             ///< One record per grid entry.
    std::vector<size_t> failed;        ///< Failed subproblem indices, ascending.
    std::vector<std::string> messages; ///< Failure message per entry of `failed`.
};

/**
 * @class EnsembleSolver
 * @brief Runs every subproblem of an EnsembleProblem through the ODEStepper.
 */
class EnsembleSolver
{
  private:
    EnsembleOptions options;

    /**
     * @brief Build, integrate and extract subproblem i.
     * @param[out] record  Extracted record (failed record on error).
     * @param[out] message Failure message, empty on success.
     * @return true on success.
     *
     * @details Exceptions thrown by the user vector field or descriptor are
     * turned into a failed subproblem carrying the exception text.
     */
    bool runSubproblem(const EnsembleProblem& ens, const ODEStepper& stepper, size_t i,
                       OutputRecord& record, std::string& message) const;

    /// Place or reduce the record of subproblem i into the field.
    void assemble(const EnsembleProblem& ens, DescriptorField& field, const OutputRecord& record, size_t i) const;

    /// Throw IntegrationError listing failures if failFast is set.
    void checkFailures(const EnsembleSolution& solution, size_t numSubproblems) const;

  public:
    explicit EnsembleSolver(const EnsembleOptions& optionsIn = EnsembleOptions{});

    /**
     * @brief Solve all subproblems and assemble the descriptor field.
     * @throws IntegrationError if failFast is set and any subproblem failed.
     */
    EnsembleSolution solve(const EnsembleProblem& ens) const;
};
