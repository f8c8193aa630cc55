//==============================================================================
// ODEStepper.cpp
// Implicit Runge–Kutta (Gauss–Legendre) stepper for ODEProblem.
// Supports IRK1/IRK2/IRK3 collocation.
// Responsibilities:
//   • Hold Butcher tableau (a,b,c) for chosen IRK scheme.
//   • Split the time span into equal steps of size <= dt (signed).
//   • Do one IRK step with fixed-point iteration on stage values.
//   • Record samples and stop with a failure message on divergence.
//==============================================================================

#include "ODEStepper.hpp"
#include "Errors.hpp"

//------------------------------------------------------------------------------
// Ctor: check options, choose IRK scheme and build its Butcher tableau.
//  - IRK1: 1-stage Gauss (midpoint)
//  - IRK2: 2-stage Gauss (order 4)
//  - IRK3: 3-stage Gauss (order 6)
//------------------------------------------------------------------------------
void ODEStepper::validateOptions(const IntegratorOptions& opts)
{
    if (!(opts.dt > 0.0) || !(opts.precision > 0.0) || opts.maxIts <= 0)
    {
        throw ConfigurationError("ODEStepper requires dt > 0, precision > 0 and maxIts > 0.");
    }
    if (opts.scheme != Scheme::IRK1 && opts.scheme != Scheme::IRK2 && opts.scheme != Scheme::IRK3)
    {
        throw ConfigurationError("Wrong IRK Scheme stage supplied!");
    }
}

ODEStepper::ODEStepper(const IntegratorOptions& optionsIn)
    : options(optionsIn)
{
    validateOptions(options);

    size_t stage {};

    switch (options.scheme)
    {
        case Scheme::IRK1:
            stage = 1;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=1
            a[0][0] = 0.5;
            b[0]    = 1.0;
            c[0]    = 0.5;
            break;

        case Scheme::IRK2:
            stage = 2;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=2
            a[0][0] = 0.25;
            a[0][1] = 0.25 - 0.5 / std::sqrt(3.0);
            a[1][0] = 0.25 + 0.5 / std::sqrt(3.0);
            a[1][1] = 0.25;
            b[0] = b[1] = 0.5;
            c[0] = 0.5 - 0.5 / std::sqrt(3.0);
            c[1] = 0.5 + 0.5 / std::sqrt(3.0);
            break;

        case Scheme::IRK3:
            stage = 3;
            a.assign(stage, vec_real(stage));
            b.resize(stage);
            c.resize(stage);

            // Gauss–Legendre s=3
            a[0][0] = 5.0 / 36.0;
            a[0][1] = 2.0 / 9.0 - 1.0 / std::sqrt(15.0);
            a[0][2] = 5.0 / 36.0 - 0.5 / std::sqrt(15.0);
            a[1][0] = 5.0 / 36.0 + std::sqrt(15.0) / 24.0;
            a[1][1] = 2.0 / 9.0;
            a[1][2] = 5.0 / 36.0 - std::sqrt(15.0) / 24.0;
            a[2][0] = 5.0 / 36.0 + 0.5 / std::sqrt(15.0);
            a[2][1] = 2.0 / 9.0 + 1.0 / std::sqrt(15.0);
            a[2][2] = 5.0 / 36.0;
            b[0] = b[2] = 5.0 / 18.0;
            b[1]        = 4.0 / 9.0;
            c[0] = 0.5 - std::sqrt(15.0) / 10.0;
            c[1] = 0.5;
            c[2] = 0.5 + std::sqrt(15.0) / 10.0;
            break;

        default:
            throw ConfigurationError("Wrong IRK Scheme stage supplied!");
    }
}

//------------------------------------------------------------------------------
// solve
// Equal steps t_k = t0 + k*h, h = (t1-t0)/n, n = ceil(|t1-t0|/dt). The last
// sample is pinned to t1 exactly. Stops at the first failed step.
//------------------------------------------------------------------------------
Trajectory ODEStepper::solve(const ODEProblem& prob) const
{
    Trajectory sol(prob);

    const real_t t0 = prob.tspan.start;
    const real_t t1 = prob.tspan.end;
    const size_t n  = static_cast<size_t>(std::max(1.0, std::ceil(prob.tspan.length() / options.dt)));
    const real_t h  = (t1 - t0) / static_cast<real_t>(n);

    vec_real y1 = prob.u0, y2(prob.u0.size());

    sol.t.push_back(t0);
    sol.u.push_back(y1);

    if (!all_finite(y1))
    {
        sol.message = "Non-finite initial state.";
        return sol;
    }

    for (size_t k=0; k<n; ++k)
    {
        const real_t tIn  = t0 + static_cast<real_t>(k) * h;
        const real_t tOut = (k+1 == n) ? t1 : t0 + static_cast<real_t>(k+1) * h;

        int  itsReached = 0;
        bool converged  = false;
        stepIRK(prob, y1, y2, tIn, tOut, itsReached, converged);

        if (!converged || !all_finite(y2))
        {
            std::ostringstream msg;
            msg << (converged ? "Non-finite state" : "No convergence after " + std::to_string(itsReached) + " stage iterations")
                << " between t = " << tIn << " and t = " << tOut << ".";
            sol.message = msg.str();
            if (!options.saveEverystep)
            {
                sol.t.push_back(tIn);
                sol.u.push_back(y1);
            }
            return sol;
        }

        y1 = y2;
        ++sol.steps;

        if (options.saveEverystep || k+1 == n)
        {
            sol.t.push_back(tOut);
            sol.u.push_back(y1);
        }
    }

    sol.success = true;
    return sol;
}

//------------------------------------------------------------------------------
// stepIRK
// Perform one implicit Gauss–Legendre step with `stage = b.size()` collocation
// points. We iterate a fixed-point map on the stage values yK2 until the
// stage-difference norm falls below an adaptive threshold.
// Implementation details:
//   • f[i] keeps RHS at stage time x[i].
//   • yK2[i] are stage states; yK1 is the previous iterate for convergence test.
//   • After convergence, do the final combination: y += h * sum_i b[i] * f[i].
//------------------------------------------------------------------------------
void ODEStepper::stepIRK(const ODEProblem& prob, const vec_real& yIn, vec_real& yOut,
                         real_t tIn, real_t tOut, int& itsReached, bool& converged) const
{
    const real_t h = tOut - tIn;
    const int stage = static_cast<int>(b.size());
    const size_t N  = yIn.size();
    const int maxIts = options.maxIts;

    vec_real x(stage);              // collocation times
    vec_real y = yIn;               // state at the start of the step
    mat_real f(stage, vec_real(N)), // RHS evaluated at each stage
             yK1(stage, vec_real(N)),
             yK2(stage, vec_real(N));

    itsReached = 0;
    converged = false;

    // Stage times x_i = tIn + c_i * h
    for (int i=0; i<stage; ++i)
    {
        x[i] = tIn + h*c[i];
    }

    // Zeroth-order guess: all stages start at y
    for (int i=0; i<stage; ++i)
    {
        yK2[i] = y;
    }

    // Fixed-point iterations on stage states
    for (int its=0; its<maxIts; ++its)
    {
        ++itsReached;
        yK1 = yK2;
        real_t norm2 = 0.0;

        // Evaluate RHS at current stage guesses
        for (int i=0; i<stage; ++i)
        {
            prob.f(f[i], yK2[i], prob.p, x[i]);
        }

        // Update stage states: y_i = y + h * Σ_k a_{ik} f_k
        for (int i=0; i<stage; ++i)
        {
            for (size_t j=0; j<N; ++j)
            {
                real_t tmp = y[j];
                for (int k=0; k<stage; ++k)
                {
                    tmp += h * a[i][k] * f[k][j];
                }
                yK2[i][j] = tmp;
            }
        }

        // Convergence metric: RMS of stage-wise differences
        for (int i=0; i<stage; ++i)
        {
            for (size_t j=0; j<N; ++j)
            {
               norm2 += std::pow(yK1[i][j] - yK2[i][j], 2);
            }
        }

        norm2 = std::sqrt(norm2 / static_cast<real_t>(N*stage));

        if (!std::isfinite(norm2))
        {
            break;
        }

        // Slightly relax tolerance late in the iteration window to avoid stalls
        real_t precision10 = options.precision;
        if (its > maxIts/2)
        {
            precision10 = options.precision * 10.0 * (2.0*static_cast<real_t>(its)/static_cast<real_t>(maxIts) - 0.5);
        }

        if (norm2 < precision10)
        {
            converged = true;
            break;
        }
    }

    // Final combination: y^{n+1} = y + h * Σ_i b_i f_i
    for (int i=0; i<stage; ++i)
    {
        for (size_t j=0; j<N; ++j)
        {
           y[j] += h * b[i] * f[i][j];
        }
    }

    yOut = y;
}
