//==============================================================================
// SubproblemStrategy.cpp
// Augmented and post-processed construction of ensemble subproblems.
// Both strategies are stateless apart from the shared, read-only grid and M:
//   • build(template, i)  → fresh remake of the template for index i.
//   • extract(sol, i)     → OutputRecord with exactly the direction's fields.
//   • reduce(field, r, k) → post-processed Both: join halves at k.pairIndex.
//==============================================================================

#include "SubproblemStrategy.hpp"
#include "Errors.hpp"

//------------------------------------------------------------------------------
// Base
//------------------------------------------------------------------------------
SubproblemStrategy::SubproblemStrategy(std::shared_ptr<const InitialConditionGrid> gridIn,
                                       DescriptorFunction MIn, Direction directionIn)
    : grid(std::move(gridIn)), M(std::move(MIn)), direction(directionIn)
{
    if (!grid)
    {
        throw ConfigurationError("Strategy requires a grid of initial conditions.");
    }
    if (!M)
    {
        throw ConfigurationError("Strategy requires a callable descriptor function M.");
    }
}

OutputRecord SubproblemStrategy::failedRecord() const
{
    const real_t nan = std::numeric_limits<real_t>::quiet_NaN();

    OutputRecord record;
    record.valid = false;
    if (direction != Direction::Backward) record.lfwd = nan;
    if (direction != Direction::Forward)  record.lbwd = nan;
    return record;
}

void SubproblemStrategy::reduce(DescriptorField& field, const OutputRecord& incoming, const SubproblemKey& key) const
{
    field[key.pairIndex] = incoming;
}

//------------------------------------------------------------------------------
// AugmentedStrategy
//------------------------------------------------------------------------------
AugmentedStrategy::AugmentedStrategy(std::shared_ptr<const InitialConditionGrid> gridIn,
                                     DescriptorFunction MIn, Direction directionIn, size_t stateDim)
    : SubproblemStrategy(std::move(gridIn), std::move(MIn), directionIn), layout(directionIn, stateDim)
{
}

SubproblemKey AugmentedStrategy::key(size_t i) const
{
    if (i >= numSubproblems())
    {
        throw std::out_of_range("Subproblem index " + std::to_string(i) + " out of range.");
    }
    return {i, i, direction == Direction::Backward ? Branch::Backward : Branch::Forward};
}

ODEProblem AugmentedStrategy::build(const ODEProblem& templ, size_t i) const
{
    return templ.remake(layout.initialState(grid->at(i)));
}

OutputRecord AugmentedStrategy::extract(const Trajectory& sol, size_t) const
{
    if (!sol.success)
    {
        return failedRecord();
    }

    const vec_real& uEnd = sol.back();

    OutputRecord record;
    if (layout.has(Partition::LFwd)) record.lfwd = layout.accumulator(uEnd, Partition::LFwd);
    if (layout.has(Partition::LBwd)) record.lbwd = layout.accumulator(uEnd, Partition::LBwd);
    return record;
}

//------------------------------------------------------------------------------
// PostprocessedStrategy
//------------------------------------------------------------------------------
PostprocessedStrategy::PostprocessedStrategy(std::shared_ptr<const InitialConditionGrid> gridIn,
                                             DescriptorFunction MIn, Direction directionIn,
                                             QuadratureRule ruleIn)
    : SubproblemStrategy(std::move(gridIn), std::move(MIn), directionIn), rule(ruleIn)
{
}

size_t PostprocessedStrategy::numSubproblems() const
{
    return direction == Direction::Both ? 2 * grid->size() : grid->size();
}

SubproblemKey PostprocessedStrategy::key(size_t i) const
{
    if (i >= numSubproblems())
    {
        throw std::out_of_range("Subproblem index " + std::to_string(i) + " out of range.");
    }

    switch (direction)
    {
        case Direction::Forward:  return {i, i, Branch::Forward};
        case Direction::Backward: return {i, i, Branch::Backward};
        case Direction::Both:     return {i, i / 2, i % 2 == 0 ? Branch::Forward : Branch::Backward};
    }
    throw ConfigurationError("Direction `" + to_string(direction) + "` not implemented.");
}

ODEProblem PostprocessedStrategy::build(const ODEProblem& templ, size_t i) const
{
    const SubproblemKey k = key(i);
    const TimeSpan span = k.branch == Branch::Forward ? templ.tspan.forward() : templ.tspan.reversed();
    return templ.remake(grid->at(k.pairIndex), span);
}

OutputRecord PostprocessedStrategy::extract(const Trajectory& sol, size_t i) const
{
    const SubproblemKey k = key(i);
    const real_t nan = std::numeric_limits<real_t>::quiet_NaN();

    OutputRecord record;
    record.valid = sol.success;
    const real_t value = sol.success ? lagrangianDescriptor(sol, M, rule) : nan;

    if (k.branch == Branch::Forward)
    {
        record.lfwd = value;
    }
    else
    {
        record.lbwd = value;
    }
    return record;
}

//------------------------------------------------------------------------------
// reduce (Both): each half lands in field[pairIndex]; validity of the pair is
// the conjunction of its halves, whatever order they arrive in. Once a pair
// is invalid both of its values read NaN.
//------------------------------------------------------------------------------
void PostprocessedStrategy::reduce(DescriptorField& field, const OutputRecord& incoming, const SubproblemKey& key) const
{
    if (direction != Direction::Both)
    {
        SubproblemStrategy::reduce(field, incoming, key);
        return;
    }

    OutputRecord& target = field[key.pairIndex];
    target.valid = target.valid && incoming.valid;

    if (key.branch == Branch::Forward)
    {
        target.lfwd = incoming.lfwd;
    }
    else
    {
        target.lbwd = incoming.lbwd;
    }

    if (!target.valid)
    {
        const real_t nan = std::numeric_limits<real_t>::quiet_NaN();
        if (target.lfwd) target.lfwd = nan;
        if (target.lbwd) target.lbwd = nan;
    }
}
