//==============================================================================
// ODEProblem.cpp
// Validation and clone-with-overrides for the template initial value problem.
//==============================================================================

#include "ODEProblem.hpp"
#include "Errors.hpp"

ODEProblem::ODEProblem(VectorField fIn, vec_real u0In, TimeSpan tspanIn, vec_real pIn)
    : f(std::move(fIn)), u0(std::move(u0In)), tspan(tspanIn), p(std::move(pIn))
{
    if (!f)
    {
        throw ConfigurationError("ODEProblem requires a callable vector field.");
    }
    if (u0.empty())
    {
        throw ConfigurationError("ODEProblem requires a non-empty initial state.");
    }
    if (!std::isfinite(tspan.start) || !std::isfinite(tspan.end) || tspan.length() == 0.0)
    {
        std::ostringstream msg;
        msg << "ODEProblem requires a finite time span of non-zero length, got ("
            << tspan.start << ", " << tspan.end << ").";
        throw ConfigurationError(msg.str());
    }
}

//------------------------------------------------------------------------------
// remake: start from a copy of *this and only swap in the supplied fields;
// re-run the constructor checks through the full constructor.
//------------------------------------------------------------------------------
ODEProblem ODEProblem::remake(std::optional<vec_real> u0In, std::optional<TimeSpan> tspanIn) const
{
    if (u0In && u0In->size() != u0.size())
    {
        throw ConfigurationError("remake: initial state of dimension " + std::to_string(u0In->size())
                                 + " does not match problem dimension " + std::to_string(u0.size()) + ".");
    }

    return ODEProblem(f, u0In ? std::move(*u0In) : u0, tspanIn ? *tspanIn : tspan, p);
}
