#pragma once
/**
 * @file SubproblemStrategy.hpp
 * @brief Per-index construction and extraction of the subproblems of a
 *        Lagrangian descriptor ensemble.
 *
 * @details
 * A strategy turns "template + grid" into numSubproblems() independent
 * initial value problems and maps each solved trajectory back to an
 * OutputRecord. build() and extract() are pure functions of their arguments
 * and the strategy's immutable state, so the ensemble solver may call them
 * concurrently and in any order.
 *
 * Two implementations:
 *  - AugmentedStrategy: one augmented subproblem per grid entry; descriptors
 *    are read from the terminal accumulators.
 *  - PostprocessedStrategy: the original system is solved (twice per entry for
 *    Direction::Both) and descriptors come from post-hoc quadrature; the two
 *    halves are joined by reduce(), keyed by pair index.
 */

#include "common.hpp"
#include "ODEProblem.hpp"
#include "ODEStepper.hpp"
#include "DescriptorField.hpp"
#include "DescriptorAugmenter.hpp"
#include "PostQuadrature.hpp"

/**
 * @class SubproblemStrategy
 * @brief Interface shared by the augmented and post-processed strategies.
 */
class SubproblemStrategy
{
  protected:
    std::shared_ptr<const InitialConditionGrid> grid; ///< Initial conditions, read-only.
    DescriptorFunction M;                             ///< Pointwise descriptor.
    Direction direction;                              ///< Branches computed.

    /// Record with the direction's fields set to NaN and valid=false.
    OutputRecord failedRecord() const;

  public:
    SubproblemStrategy(std::shared_ptr<const InitialConditionGrid> gridIn,
                       DescriptorFunction MIn, Direction directionIn);
    virtual ~SubproblemStrategy() = default;

    /// Method implemented by this strategy.
    virtual Method method() const = 0;

    /// Number of subproblems for the whole grid.
    virtual size_t numSubproblems() const = 0;

    /// Structured key of subproblem i.
    virtual SubproblemKey key(size_t i) const = 0;

    /**
     * @brief Subproblem i, cloned from the template handed to the ensemble.
     * @param templ Template problem (augmented for AugmentedStrategy).
     * @param i     Subproblem index.
     */
    virtual ODEProblem build(const ODEProblem& templ, size_t i) const = 0;

    /**
     * @brief Descriptor record of subproblem i from its trajectory.
     * @details A failed trajectory yields failedRecord().
     */
    virtual OutputRecord extract(const Trajectory& sol, size_t i) const = 0;

    /// True if records must be folded with reduce() instead of placed at key.index.
    virtual bool hasReduction() const { return false; }

    /**
     * @brief Fold one subproblem record into the field (pre-sized to the grid).
     * @details The default places the record at key.pairIndex.
     */
    virtual void reduce(DescriptorField& field, const OutputRecord& incoming, const SubproblemKey& key) const;

    Direction getDirection() const { return direction; }
    const InitialConditionGrid& getGrid() const { return *grid; }
};

/**
 * @class AugmentedStrategy
 * @brief One augmented subproblem per grid entry.
 *
 * build(i) overrides every state partition with uu0[i] and zeros the
 * accumulators; the span stays the template's forward span. extract reads
 * the terminal lfwd/lbwd.
 */
class AugmentedStrategy : public SubproblemStrategy
{
  private:
    AugmentedLayout layout; ///< Partitions of the augmented state.

  public:
    AugmentedStrategy(std::shared_ptr<const InitialConditionGrid> gridIn,
                      DescriptorFunction MIn, Direction directionIn, size_t stateDim);

    Method method() const override { return Method::Augmented; }
    size_t numSubproblems() const override { return grid->size(); }
    SubproblemKey key(size_t i) const override;
    ODEProblem build(const ODEProblem& templ, size_t i) const override;
    OutputRecord extract(const Trajectory& sol, size_t i) const override;

    const AugmentedLayout& getLayout() const { return layout; }
};

/**
 * @class PostprocessedStrategy
 * @brief Solve the original system and integrate M over the stored trajectory.
 *
 * @details
 * - Forward : N subproblems on the forward span.
 * - Backward: N subproblems on the reversed span.
 * - Both    : 2N subproblems; subproblem 2k is the forward run of entry k,
 *             2k+1 its backward run. Both halves start from uu0[k]. reduce()
 *             writes each half into field[k], independent of arrival order.
 */
class PostprocessedStrategy : public SubproblemStrategy
{
  private:
    QuadratureRule rule; ///< Post-hoc quadrature rule.

  public:
    PostprocessedStrategy(std::shared_ptr<const InitialConditionGrid> gridIn,
                          DescriptorFunction MIn, Direction directionIn,
                          QuadratureRule ruleIn = QuadratureRule::CubicSpline);

    Method method() const override { return Method::Postprocessed; }
    size_t numSubproblems() const override;
    SubproblemKey key(size_t i) const override;
    ODEProblem build(const ODEProblem& templ, size_t i) const override;
    OutputRecord extract(const Trajectory& sol, size_t i) const override;
    bool hasReduction() const override { return direction == Direction::Both; }
    void reduce(DescriptorField& field, const OutputRecord& incoming, const SubproblemKey& key) const override;
};
