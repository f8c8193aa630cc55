#pragma once
/**
 * @file DescriptorAugmenter.hpp
 * @brief Augmented dynamical system carrying descriptor accumulators next to
 *        the original state.
 *
 * @details
 * The augmented state is a flat vector with named partitions, present
 * according to the Direction:
 *   Forward  : {fwd, lfwd}
 *   Backward : {bwd, lbwd}
 *   Both     : {fwd, bwd, lfwd, lbwd}
 * fwd/bwd hold a copy of the original state, lfwd/lbwd are scalars.
 *
 * For a template span (t0, t1) the augmented problem is integrated over
 * (t0, t1). The forward branch follows f at time t; the backward branch at
 * augmented time t stands for original time s = t0 + t1 - t, so it runs the
 * original flow from t1 back to t0:
 *   d(fwd)/dt  =  f(fwd, p, t),   d(lfwd)/dt = M(f(fwd,p,t), fwd, p, t)
 *   d(bwd)/dt  = -f(bwd, p, s),   d(lbwd)/dt = M(f(bwd,p,s), bwd, p, s)
 * Both accumulators grow with elapsed time, so M ≡ 1 gives t1 - t0 for each.
 */

#include "common.hpp"
#include "ODEProblem.hpp"

/**
 * @enum Partition
 * @brief Named parts of an augmented state.
 */
enum class Partition { Fwd, Bwd, LFwd, LBwd };

/**
 * @class AugmentedLayout
 * @brief Offsets of the partitions of an augmented state of a given direction.
 *
 * Order is fwd, bwd, lfwd, lbwd with absent partitions skipped.
 */
class AugmentedLayout
{
  private:
    Direction direction; ///< Determines which partitions exist.
    size_t dim;          ///< Dimension of the original state.
    size_t offsets[4];   ///< Offset per Partition, npos if absent.
    size_t total;        ///< Length of the augmented state.

  public:
    static constexpr size_t npos = std::numeric_limits<size_t>::max();

    /**
     * @throws ConfigurationError for an invalid direction or dim == 0.
     */
    AugmentedLayout(Direction directionIn, size_t dimIn);

    bool has(Partition part) const { return offsets[static_cast<int>(part)] != npos; }

    /// Offset of a partition; throws std::out_of_range if absent.
    size_t offset(Partition part) const;

    size_t size() const { return total; }
    size_t stateDimension() const { return dim; }
    Direction getDirection() const { return direction; }

    /// Augmented start state: x0 in every state partition, accumulators 0.
    vec_real initialState(const vec_real& x0) const;

    /// Copy the fwd or bwd partition of aug into x (resized to dim).
    void extract(const vec_real& aug, Partition part, vec_real& x) const;

    /// Write x into the fwd or bwd partition of aug, scaled by sign.
    void insert(const vec_real& x, Partition part, vec_real& aug, real_t sign = 1.0) const;

    /// Value of an accumulator partition.
    real_t accumulator(const vec_real& aug, Partition part) const { return aug[offset(part)]; }
};

/**
 * @brief Build the augmented problem for prob, M and direction.
 *
 * @details
 * The returned problem has the layout's size, starts from
 * layout.initialState(prob.u0), keeps prob.p and integrates over
 * prob.tspan.forward(). Later remakes of the augmented problem must keep that
 * span, as the backward time reflection is fixed at construction.
 *
 * @throws ConfigurationError if M is empty or the direction is invalid.
 */
ODEProblem augment(const ODEProblem& prob, const DescriptorFunction& M, Direction direction);
