//==============================================================================
// DescriptorAugmenter.cpp
// Partition layout of augmented states and the augmented vector field.
//==============================================================================

#include "DescriptorAugmenter.hpp"
#include "Errors.hpp"

AugmentedLayout::AugmentedLayout(Direction directionIn, size_t dimIn)
    : direction(directionIn), dim(dimIn), offsets{npos, npos, npos, npos}, total(0)
{
    if (dim == 0)
    {
        throw ConfigurationError("Augmented layout needs a state of positive dimension.");
    }

    bool fwd = false, bwd = false;
    switch (direction)
    {
        case Direction::Forward:  fwd = true;              break;
        case Direction::Backward: bwd = true;              break;
        case Direction::Both:     fwd = true; bwd = true;  break;
        default:
            throw ConfigurationError("Direction `" + to_string(direction)
                                     + "` not implemented; use either forward, backward or both.");
    }

    if (fwd) { offsets[static_cast<int>(Partition::Fwd)]  = total; total += dim; }
    if (bwd) { offsets[static_cast<int>(Partition::Bwd)]  = total; total += dim; }
    if (fwd) { offsets[static_cast<int>(Partition::LFwd)] = total; total += 1; }
    if (bwd) { offsets[static_cast<int>(Partition::LBwd)] = total; total += 1; }
}

size_t AugmentedLayout::offset(Partition part) const
{
    if (!has(part))
    {
        throw std::out_of_range("Partition not present for direction " + to_string(direction) + ".");
    }
    return offsets[static_cast<int>(part)];
}

vec_real AugmentedLayout::initialState(const vec_real& x0) const
{
    if (x0.size() != dim)
    {
        throw ConfigurationError("Initial state of dimension " + std::to_string(x0.size())
                                 + " does not match layout dimension " + std::to_string(dim) + ".");
    }

    vec_real aug(total, 0.0);
    if (has(Partition::Fwd)) insert(x0, Partition::Fwd, aug);
    if (has(Partition::Bwd)) insert(x0, Partition::Bwd, aug);
    return aug;
}

void AugmentedLayout::extract(const vec_real& aug, Partition part, vec_real& x) const
{
    const size_t off = offset(part);
    x.resize(dim);
    std::copy(aug.begin() + off, aug.begin() + off + dim, x.begin());
}

void AugmentedLayout::insert(const vec_real& x, Partition part, vec_real& aug, real_t sign) const
{
    const size_t off = offset(part);
    for (size_t j=0; j<dim; ++j)
    {
        aug[off + j] = sign * x[j];
    }
}

//------------------------------------------------------------------------------
// augment
// The closure owns copies of f, M and the layout; it allocates its scratch
// vectors per call so a single augmented problem can be integrated from many
// threads at once.
//------------------------------------------------------------------------------
ODEProblem augment(const ODEProblem& prob, const DescriptorFunction& M, Direction direction)
{
    if (!M)
    {
        throw ConfigurationError("Augmentation requires a callable descriptor function M.");
    }

    const AugmentedLayout layout(direction, prob.dimension());
    const TimeSpan span = prob.tspan.forward();
    const real_t tFlip = span.start + span.end;
    const VectorField f = prob.f;

    VectorField augmentedField = [f, M, layout, tFlip](vec_real& du, const vec_real& u,
                                                       const vec_real& p, real_t t)
    {
        vec_real x, dx(layout.stateDimension());

        if (layout.has(Partition::Fwd))
        {
            layout.extract(u, Partition::Fwd, x);
            f(dx, x, p, t);
            layout.insert(dx, Partition::Fwd, du);
            du[layout.offset(Partition::LFwd)] = M(dx, x, p, t);
        }

        if (layout.has(Partition::Bwd))
        {
            const real_t s = tFlip - t;
            layout.extract(u, Partition::Bwd, x);
            f(dx, x, p, s);
            layout.insert(dx, Partition::Bwd, du, -1.0);
            du[layout.offset(Partition::LBwd)] = M(dx, x, p, s);
        }
    };

    return ODEProblem(std::move(augmentedField), layout.initialState(prob.u0), span, prob.p);
}
