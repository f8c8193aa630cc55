//==============================================================================
// LagrangianDescriptorProblem.cpp
// Validation, strategy selection and ensemble assembly for descriptor fields.
//   • method is checked before direction; both name the accepted set.
//   • Augmented: augment the template once, strategy remakes its u0 per entry.
//   • Postprocessed: original template, strategy remakes u0 and span.
//==============================================================================

#include "LagrangianDescriptorProblem.hpp"
#include "DescriptorAugmenter.hpp"
#include "Errors.hpp"

//------------------------------------------------------------------------------
// makeEnsemble: all checks run before anything is stored, so a failing
// construction leaves no problem object behind.
//------------------------------------------------------------------------------
EnsembleProblem LagrangianDescriptorProblem::makeEnsemble(const ODEProblem& prob, const DescriptorFunction& M,
                                                          const std::shared_ptr<const InitialConditionGrid>& grid,
                                                          const DescriptorOptions& options,
                                                          const IntegratorOptions& integratorOptions)
{
    if (options.method != Method::Augmented && options.method != Method::Postprocessed)
    {
        throw ConfigurationError("Method `" + to_string(options.method)
                                 + "` not implemented; use either augmented or postprocessed.");
    }

    if (options.direction != Direction::Forward && options.direction != Direction::Backward
        && options.direction != Direction::Both)
    {
        throw ConfigurationError("Direction `" + to_string(options.direction)
                                 + "` not implemented; use either forward, backward or both.");
    }

    if (!M)
    {
        throw ConfigurationError("Lagrangian descriptor problem requires a callable descriptor M.");
    }

    for (size_t i=0; i<grid->size(); ++i)
    {
        if ((*grid)[i].size() != prob.dimension())
        {
            throw ConfigurationError("Initial condition " + std::to_string(i) + " has dimension "
                                     + std::to_string((*grid)[i].size()) + ", problem has "
                                     + std::to_string(prob.dimension()) + ".");
        }
    }

    if (options.method == Method::Postprocessed && !integratorOptions.saveEverystep)
    {
        throw ConfigurationError("Method postprocessed needs the full trajectory; enable saveEverystep.");
    }

    ODEStepper::validateOptions(integratorOptions);

    if (options.method == Method::Augmented)
    {
        auto strategy = std::make_shared<AugmentedStrategy>(grid, M, options.direction, prob.dimension());
        return EnsembleProblem{augment(prob, M, options.direction), strategy, integratorOptions};
    }

    auto strategy = std::make_shared<PostprocessedStrategy>(grid, M, options.direction, options.quadrature);
    return EnsembleProblem{prob, strategy, integratorOptions};
}

LagrangianDescriptorProblem::LagrangianDescriptorProblem(const ODEProblem& prob, const DescriptorFunction& M,
                                                         InitialConditionGrid grid,
                                                         const DescriptorOptions& options,
                                                         const IntegratorOptions& integratorOptions)
    : uu0(std::make_shared<const InitialConditionGrid>(std::move(grid))),
      descriptorOptions(options),
      ensprob(makeEnsemble(prob, M, uu0, options, integratorOptions))
{
}

LagrangianDescriptorSolution solve(const LagrangianDescriptorProblem& problem, const EnsembleOptions& options)
{
    EnsembleSolver solver(options);
    EnsembleSolution ensol = solver.solve(problem.ensemble());

    return LagrangianDescriptorSolution{std::move(ensol.field), problem.grid(),
                                        problem.direction(), problem.method(),
                                        std::move(ensol.failed), std::move(ensol.messages)};
}
