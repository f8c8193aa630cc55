//==============================================================================
// test_ode_stepper.cpp
// Sanity test for ODEStepper:
//   1) Exponential decay u' = -u against exp(-t) for IRK1/IRK2/IRK3.
//   2) Reversed span integrates backward in time (negative steps).
//   3) saveEverystep=false keeps only the endpoints.
//   4) Blow-up u' = u^2 is reported as a failed trajectory, not thrown.
//   5) Invalid options are rejected at construction.
// Uses `almost_equal` helpers and plain `assert` for checks.
//==============================================================================

#include <cassert>

#include "common.hpp"
#include "Errors.hpp"
#include "ODEStepper.hpp"

int main()
{
    VectorField decay = [](vec_real& du, const vec_real& u, const vec_real&, real_t) {
        du[0] = -u[0];
    };

    ODEProblem prob(decay, {1.0}, {0.0, 1.0});

    // -------------------------------------------------------------------------
    // Accuracy per scheme (global error ~ h^{2s})
    // -------------------------------------------------------------------------
    {
        IntegratorOptions opts;
        opts.dt = 0.1;

        opts.scheme = Scheme::IRK3;
        Trajectory sol3 = ODEStepper(opts).solve(prob);
        assert(sol3.success);
        assert(sol3.message.empty());
        assert(sol3.steps == 10);
        assert(sol3.t.size() == 11 && sol3.u.size() == 11);
        assert(almost_equal(sol3.t.back(), 1.0));
        assert(almost_equal(sol3.back()[0], std::exp(-1.0), 1e-10));

        opts.scheme = Scheme::IRK2;
        Trajectory sol2 = ODEStepper(opts).solve(prob);
        assert(sol2.success);
        assert(almost_equal(sol2.back()[0], std::exp(-1.0), 1e-6));

        opts.scheme = Scheme::IRK1;
        opts.dt = 0.01;
        Trajectory sol1 = ODEStepper(opts).solve(prob);
        assert(sol1.success);
        assert(almost_equal(sol1.back()[0], std::exp(-1.0), 1e-5));
    }

    // -------------------------------------------------------------------------
    // Uneven span length: steps are equal and never exceed dt
    // -------------------------------------------------------------------------
    {
        IntegratorOptions opts;
        opts.dt = 0.3;
        Trajectory sol = ODEStepper(opts).solve(prob);
        assert(sol.success);
        assert(sol.steps == 4);
        assert(almost_equal(sol.t[1], 0.25, 1e-15));
        assert(almost_equal(sol.back()[0], std::exp(-1.0), 1e-8));
    }

    // -------------------------------------------------------------------------
    // Reversed span: start at e^{-1} at t=1 and return to 1 at t=0
    // -------------------------------------------------------------------------
    {
        ODEProblem back = prob.remake(vec_real{std::exp(-1.0)}, prob.tspan.reversed());
        assert(back.tspan.start == 1.0 && back.tspan.end == 0.0);
        assert(prob.u0[0] == 1.0); // remake leaves the template untouched

        Trajectory sol = ODEStepper().solve(back);
        assert(sol.success);
        for (size_t j=0; j+1<sol.t.size(); ++j)
        {
            assert(sol.t[j+1] < sol.t[j]);
        }
        assert(almost_equal(sol.t.back(), 0.0));
        assert(almost_equal(sol.back()[0], 1.0, 1e-10));
    }

    // -------------------------------------------------------------------------
    // Endpoints only
    // -------------------------------------------------------------------------
    {
        IntegratorOptions opts;
        opts.saveEverystep = false;
        Trajectory sol = ODEStepper(opts).solve(prob);
        assert(sol.success);
        assert(sol.t.size() == 2);
        assert(sol.steps == 100);
        assert(almost_equal(sol.back()[0], std::exp(-1.0), 1e-10));
    }

    // -------------------------------------------------------------------------
    // Blow-up at t = 0.5 for u' = u^2, u(0) = 2
    // -------------------------------------------------------------------------
    {
        VectorField riccati = [](vec_real& du, const vec_real& u, const vec_real&, real_t) {
            du[0] = u[0] * u[0];
        };
        ODEProblem blowup(riccati, {2.0}, {0.0, 1.0});

        Trajectory sol = ODEStepper().solve(blowup);
        assert(!sol.success);
        assert(!sol.message.empty());
        assert(sol.t.back() < 0.5);
        assert(all_finite(sol.back()));
    }

    // -------------------------------------------------------------------------
    // Invalid options and problems
    // -------------------------------------------------------------------------
    {
        IntegratorOptions opts;
        opts.dt = 0.0;
        bool thrown = false;
        try { ODEStepper stepper(opts); }
        catch (const ConfigurationError&) { thrown = true; }
        assert(thrown);

        thrown = false;
        try { ODEProblem degenerate(decay, {1.0}, {2.0, 2.0}); }
        catch (const ConfigurationError&) { thrown = true; }
        assert(thrown);

        thrown = false;
        try { prob.remake(vec_real{1.0, 2.0}); }
        catch (const ConfigurationError&) { thrown = true; }
        assert(thrown);
    }

    return 0;
}
