//==============================================================================
// test_quadrature.cpp
// Post-hoc quadrature of sampled descriptor values:
//   1) sin on [0, pi]: spline within 1e-4, trapezoid within 1e-2, spline closer.
//   2) Linear integrand is integrated exactly by both rules.
//   3) Two samples fall back to the trapezoid.
//   4) Decay trajectory with M = |du|: 1 - e^{-1} forward and reversed.
//   5) Fewer than two samples are rejected.
// Uses LAPACKE through the cubic spline solve.
//==============================================================================

#include <cassert>

#include "common.hpp"
#include "ODEStepper.hpp"
#include "PostQuadrature.hpp"

int main()
{
    // -------------------------------------------------------------------------
    // sin on [0, pi], 21 samples
    // -------------------------------------------------------------------------
    {
        const size_t n = 21;
        vec_real x(n), y(n);
        for (size_t j=0; j<n; ++j)
        {
            x[j] = M_PI * static_cast<real_t>(j) / static_cast<real_t>(n-1);
            y[j] = std::sin(x[j]);
        }

        const real_t spline = integrateSamples(x, y, QuadratureRule::CubicSpline);
        const real_t trap   = integrateSamples(x, y, QuadratureRule::Trapezoidal);

        assert(almost_equal(spline, 2.0, 1e-4));
        assert(almost_equal(trap, 2.0, 1e-2));
        assert(std::abs(spline - 2.0) < std::abs(trap - 2.0));
    }

    // -------------------------------------------------------------------------
    // Linear on uneven abscissae
    // -------------------------------------------------------------------------
    {
        vec_real x = {0.0, 0.1, 0.35, 0.4, 1.0, 1.7};
        vec_real y(x.size());
        for (size_t j=0; j<x.size(); ++j) y[j] = 3.0 * x[j] - 1.0;

        const real_t exact = 1.5 * 1.7 * 1.7 - 1.7;
        assert(almost_equal(integrateSamples(x, y, QuadratureRule::CubicSpline), exact, 1e-12));
        assert(almost_equal(integrateSamples(x, y, QuadratureRule::Trapezoidal), exact, 1e-12));

        vec_real x2 = {0.0, 2.0}, y2 = {1.0, 3.0};
        assert(almost_equal(integrateSamples(x2, y2, QuadratureRule::CubicSpline), 4.0, 1e-15));
    }

    // -------------------------------------------------------------------------
    // Trajectory of u' = -u, M = |du|
    // -------------------------------------------------------------------------
    {
        VectorField decay = [](vec_real& du, const vec_real& u, const vec_real&, real_t) {
            du[0] = -u[0];
        };
        DescriptorFunction M = [](const vec_real& du, const vec_real&, const vec_real&, real_t) {
            return std::abs(du[0]);
        };

        ODEProblem prob(decay, {1.0}, {0.0, 1.0});
        const real_t exact = 1.0 - std::exp(-1.0);

        Trajectory fwd = ODEStepper().solve(prob);
        assert(fwd.success);
        assert(almost_equal(lagrangianDescriptor(fwd, M), exact, 1e-6));
        assert(almost_equal(lagrangianDescriptor(fwd, M, QuadratureRule::Trapezoidal), exact, 1e-4));

        Trajectory bwd = ODEStepper().solve(prob.remake(vec_real{std::exp(-1.0)}, prob.tspan.reversed()));
        assert(bwd.success);
        assert(almost_equal(lagrangianDescriptor(bwd, M), exact, 1e-6));
    }

    // -------------------------------------------------------------------------
    // Too few samples
    // -------------------------------------------------------------------------
    {
        VectorField zero = [](vec_real& du, const vec_real&, const vec_real&, real_t) { du[0] = 0.0; };
        DescriptorFunction M = [](const vec_real&, const vec_real&, const vec_real&, real_t) { return 1.0; };

        Trajectory single(ODEProblem(zero, {0.0}, {0.0, 1.0}));
        single.t.push_back(0.0);
        single.u.push_back({0.0});

        bool thrown = false;
        try { lagrangianDescriptor(single, M); }
        catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
    }

    return 0;
}
