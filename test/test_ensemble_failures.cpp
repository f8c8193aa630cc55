//==============================================================================
// test_ensemble_failures.cpp
// Failure handling of the ensemble solver on u' = u^2 over (0, 1):
//   u0 =  0.1 : regular in both directions.
//   u0 =  2   : forward solution blows up at t = 0.5.
//   u0 = -2   : backward solution blows up at t = 0.5.
// Checks:
//   1) failFast raises IntegrationError carrying the failed subproblem indices.
//   2) Without failFast, failed entries come back invalid with NaN values and
//      the regular entry is untouched.
//   3) Exceptions thrown by f or M become failed subproblems, and their
//      messages reach the descriptor solution.
//==============================================================================

#include <cassert>

#include "common.hpp"
#include "Errors.hpp"
#include "LagrangianDescriptorProblem.hpp"

static void riccati(vec_real& du, const vec_real& u, const vec_real&, real_t)
{
    du[0] = u[0] * u[0];
}

static real_t magnitude(const vec_real&, const vec_real& u, const vec_real&, real_t)
{
    return std::abs(u[0]);
}

int main()
{
    ODEProblem prob(riccati, {0.0}, {0.0, 1.0});
    InitialConditionGrid grid(std::vector<vec_real>{{0.1}, {2.0}, {-2.0}});

    DescriptorOptions augmented;
    DescriptorOptions postprocessed;
    postprocessed.method = Method::Postprocessed;

    EnsembleOptions keepGoing;
    keepGoing.failFast = false;

    // -------------------------------------------------------------------------
    // failFast
    // -------------------------------------------------------------------------
    {
        bool thrown = false;
        try { solve(LagrangianDescriptorProblem(prob, magnitude, grid, augmented)); }
        catch (const IntegrationError& e)
        {
            thrown = true;
            assert((e.failedIndices() == std::vector<size_t>{1, 2}));
            assert(std::string(e.what()).find("2 of 3") != std::string::npos);
        }
        assert(thrown);

        // Post-processed Both: forward run of entry 1 is subproblem 2,
        // backward run of entry 2 is subproblem 5.
        thrown = false;
        try { solve(LagrangianDescriptorProblem(prob, magnitude, grid, postprocessed)); }
        catch (const IntegrationError& e)
        {
            thrown = true;
            assert((e.failedIndices() == std::vector<size_t>{2, 5}));
        }
        assert(thrown);
    }

    // -------------------------------------------------------------------------
    // Non fail-fast
    // -------------------------------------------------------------------------
    for (const DescriptorOptions& opts : {augmented, postprocessed})
    {
        LagrangianDescriptorSolution sol = solve(LagrangianDescriptorProblem(prob, magnitude, grid, opts), keepGoing);
        assert(sol.field.size() == 3);
        assert(sol.failed.size() == 2);
        assert(sol.messages.size() == 2);
        for (const std::string& message : sol.messages) assert(!message.empty());

        const OutputRecord& regular = sol.field[0];
        assert(regular.valid);
        assert(std::isfinite(*regular.lfwd) && std::isfinite(*regular.lbwd));
        // Forward from 0.1: ∫ 1/(10-t) dt = ln(10/9); backward: ln(11/10).
        assert(relative_equal(*regular.lfwd, std::log(10.0/9.0), 1e-6));
        assert(relative_equal(*regular.lbwd, std::log(11.0/10.0), 1e-6));

        for (size_t k : {1, 2})
        {
            assert(!sol.field[k].valid);
            assert(std::isnan(*sol.field[k].lfwd) && std::isnan(*sol.field[k].lbwd));
        }
    }

    // Single direction: only the forward blow-up fails.
    {
        DescriptorOptions forward;
        forward.direction = Direction::Forward;
        LagrangianDescriptorSolution sol = solve(LagrangianDescriptorProblem(prob, magnitude, grid, forward), keepGoing);
        assert((sol.failed == std::vector<size_t>{1}));
        assert(sol.field[2].valid && !sol.field[2].lbwd);
    }

    // -------------------------------------------------------------------------
    // Throwing callbacks
    // -------------------------------------------------------------------------
    {
        VectorField guarded = [](vec_real& du, const vec_real& u, const vec_real&, real_t) {
            if (u[0] > 1.0)
            {
                throw std::domain_error("vector field undefined above 1");
            }
            du[0] = -u[0];
        };
        ODEProblem guardedProb(guarded, {0.0}, {0.0, 1.0});

        EnsembleOptions verbose = keepGoing;
        verbose.verbose = true;

        LagrangianDescriptorSolution sol = solve(LagrangianDescriptorProblem(guardedProb, magnitude, grid, augmented), verbose);
        // Entry 1 starts above 1; entry 2 stays negative and entry 0 decays.
        assert((sol.failed == std::vector<size_t>{1}));
        assert(sol.field[0].valid && sol.field[2].valid);
        assert(sol.messages.size() == 1);
        assert(sol.messages[0] == "vector field undefined above 1");

        bool thrown = false;
        try { solve(LagrangianDescriptorProblem(guardedProb, magnitude, grid, augmented)); }
        catch (const IntegrationError& e)
        {
            thrown = true;
            assert(std::string(e.what()).find("vector field undefined above 1") != std::string::npos);
        }
        assert(thrown);

        DescriptorFunction throwingM = [](const vec_real&, const vec_real& u, const vec_real&, real_t) -> real_t {
            if (u[0] < -1.0)
            {
                throw std::domain_error("descriptor undefined below -1");
            }
            return std::abs(u[0]);
        };
        LagrangianDescriptorSolution post = solve(LagrangianDescriptorProblem(prob, throwingM, grid, postprocessed), keepGoing);
        // Entry 2 starts at -2: both of its runs fail in M; entry 1 fails forward.
        assert((post.failed == std::vector<size_t>{2, 4, 5}));
        assert(post.field[0].valid && !post.field[1].valid && !post.field[2].valid);
    }

    return 0;
}
