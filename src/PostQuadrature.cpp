//==============================================================================
// PostQuadrature.cpp
// Post-processing quadrature of a descriptor along a stored trajectory.
//   • Evaluate M at every sample with the derivative recomputed from f.
//   • Trapezoid or natural cubic spline (second derivatives via LAPACK dgtsv).
//==============================================================================

#include "PostQuadrature.hpp"

std::string to_string(QuadratureRule rule)
{
    return rule == QuadratureRule::Trapezoidal ? "trapezoidal" : "spline";
}

//------------------------------------------------------------------------------
// Trapezoid: Σ h_j (y_j + y_{j+1}) / 2.
//------------------------------------------------------------------------------
static real_t integrateTrapezoidal(const vec_real& x, const vec_real& y)
{
    real_t sum = 0.0;
    for (size_t j=0; j+1<x.size(); ++j)
    {
        sum += 0.5 * (x[j+1] - x[j]) * (y[j] + y[j+1]);
    }
    return sum;
}

//------------------------------------------------------------------------------
// Natural cubic spline: second derivatives σ_0 = σ_n = 0 and for 0<j<n
//   h_{j-1} σ_{j-1} + 2(h_{j-1}+h_j) σ_j + h_j σ_{j+1}
//       = 6 [ (y_{j+1}-y_j)/h_j - (y_j-y_{j-1})/h_{j-1} ].
// Exact integral per interval: h_j (y_j+y_{j+1})/2 - h_j^3 (σ_j+σ_{j+1})/24.
//------------------------------------------------------------------------------
static real_t integrateCubicSpline(const vec_real& x, const vec_real& y)
{
    const size_t n = x.size() - 1;           // number of intervals
    const lapack_int m = static_cast<lapack_int>(n - 1); // interior knots

    vec_real h(n);
    for (size_t j=0; j<n; ++j)
    {
        h[j] = x[j+1] - x[j];
    }

    vec_real sigma(n+1, 0.0);

    vec_real dl(std::max<lapack_int>(m-1, 1)), d(m), du(std::max<lapack_int>(m-1, 1)), rhs(m);
    for (lapack_int i=0; i<m; ++i)
    {
        const size_t j = static_cast<size_t>(i) + 1;
        d[i]   = 2.0 * (h[j-1] + h[j]);
        rhs[i] = 6.0 * ((y[j+1] - y[j]) / h[j] - (y[j] - y[j-1]) / h[j-1]);
        if (i+1 < m)
        {
            du[i] = h[j];
            dl[i] = h[j];
        }
    }

    // Solve the symmetric tridiagonal system in place; rhs ← σ_1..σ_{n-1}.
    lapack_int info = LAPACKE_dgtsv(LAPACK_COL_MAJOR, m, 1, dl.data(), d.data(), du.data(), rhs.data(), m);
    if (info != 0)
    {
        throw std::runtime_error("LAPACKE_dgtsv failed with info = " + std::to_string(info));
    }

    std::copy(rhs.begin(), rhs.end(), sigma.begin()+1);

    real_t sum = 0.0;
    for (size_t j=0; j<n; ++j)
    {
        sum += 0.5 * h[j] * (y[j] + y[j+1]) - std::pow(h[j], 3) * (sigma[j] + sigma[j+1]) / 24.0;
    }
    return sum;
}

real_t integrateSamples(const vec_real& x, const vec_real& y, QuadratureRule rule)
{
    if (x.size() != y.size() || x.size() < 2)
    {
        throw std::invalid_argument("Quadrature requires at least two samples of matching length.");
    }

    // The spline needs at least one interior knot.
    if (rule == QuadratureRule::Trapezoidal || x.size() == 2)
    {
        return integrateTrapezoidal(x, y);
    }
    return integrateCubicSpline(x, y);
}

//------------------------------------------------------------------------------
// lagrangianDescriptor: sample M along the trajectory and integrate over the
// elapsed time |t_j - t_0| so that the orientation of the span drops out.
//------------------------------------------------------------------------------
real_t lagrangianDescriptor(const Trajectory& sol, const DescriptorFunction& M, QuadratureRule rule)
{
    if (sol.t.size() < 2)
    {
        throw std::invalid_argument("Trajectory has " + std::to_string(sol.t.size())
                                    + " samples; post-processing needs at least two.");
    }

    const ODEProblem& prob = sol.problem;
    const size_t nSamples = sol.t.size();

    vec_real elapsed(nSamples), values(nSamples), du(prob.dimension());

    for (size_t j=0; j<nSamples; ++j)
    {
        prob.f(du, sol.u[j], prob.p, sol.t[j]);
        values[j]  = M(du, sol.u[j], prob.p, sol.t[j]);
        elapsed[j] = std::abs(sol.t[j] - sol.t[0]);
    }

    return integrateSamples(elapsed, values, rule);
}
