//==============================================================================
// test_descriptor_field.cpp
// End-to-end descriptor fields for the forced Duffing oscillator
//     x' = y,  y' = x - x^3 + A cos(w t),  A = 0.3, w = pi,
// on a 3x3 grid over (0, 2):
//   1) One finite record per grid entry with exactly the direction's fields.
//   2) M = 1 yields the elapsed time on every branch, for both methods.
//   3) Augmented and post-processed (spline) fields agree (relative 1e-4).
//   4) Solving the same problem twice gives identical fields.
//   5) toMatrix() reshapes to the grid's rows x cols.
//==============================================================================

#include <cassert>

#include "common.hpp"
#include "DescriptorField.hpp"
#include "LagrangianDescriptorProblem.hpp"

static void duffing(vec_real& du, const vec_real& u, const vec_real& p, real_t t)
{
    du[0] = u[1];
    du[1] = u[0] - u[0]*u[0]*u[0] + p[0] * std::cos(p[1] * t);
}

static real_t speed(const vec_real& du, const vec_real&, const vec_real&, real_t)
{
    return std::hypot(du[0], du[1]);
}

static real_t one(const vec_real&, const vec_real&, const vec_real&, real_t)
{
    return 1.0;
}

int main()
{
    const real_t T = 2.0;
    ODEProblem prob(duffing, {0.5, 2.2}, {0.0, T}, {0.3, M_PI});
    InitialConditionGrid grid = InitialConditionGrid::rectangular(-1.0, 1.0, 3, -0.5, 0.5, 3);
    const size_t N = grid.size();

    IntegratorOptions integrator;
    integrator.dt = 0.01;

    // -------------------------------------------------------------------------
    // Record shape per direction
    // -------------------------------------------------------------------------
    for (Method method : {Method::Augmented, Method::Postprocessed})
    {
        for (Direction direction : {Direction::Forward, Direction::Backward, Direction::Both})
        {
            DescriptorOptions opts;
            opts.method = method;
            opts.direction = direction;

            LagrangianDescriptorSolution sol = solve(LagrangianDescriptorProblem(prob, speed, grid, opts, integrator));
            assert(sol.field.size() == N);
            assert(sol.failed.empty());
            assert(sol.direction == direction && sol.method == method);

            for (const OutputRecord& record : sol.field)
            {
                assert(record.valid);
                assert(record.has(Branch::Forward) == (direction != Direction::Backward));
                assert(record.has(Branch::Backward) == (direction != Direction::Forward));
                if (record.lfwd) assert(std::isfinite(*record.lfwd) && *record.lfwd > 0.0);
                if (record.lbwd) assert(std::isfinite(*record.lbwd) && *record.lbwd > 0.0);
            }

            if (direction == Direction::Forward)
            {
                bool thrown = false;
                try { sol.field[0].get(Branch::Backward); }
                catch (const std::out_of_range&) { thrown = true; }
                assert(thrown);
            }
        }
    }

    // -------------------------------------------------------------------------
    // M = 1: every branch measures the elapsed time T
    // -------------------------------------------------------------------------
    for (Method method : {Method::Augmented, Method::Postprocessed})
    {
        DescriptorOptions opts;
        opts.method = method;

        LagrangianDescriptorSolution sol = solve(LagrangianDescriptorProblem(prob, one, grid, opts, integrator));
        for (const OutputRecord& record : sol.field)
        {
            assert(almost_equal(*record.lfwd, T, 1e-10));
            assert(almost_equal(*record.lbwd, T, 1e-10));
        }
    }

    // -------------------------------------------------------------------------
    // Augmented against post-processed
    // -------------------------------------------------------------------------
    {
        DescriptorOptions aug;
        DescriptorOptions post;
        post.method = Method::Postprocessed;

        LagrangianDescriptorSolution a = solve(LagrangianDescriptorProblem(prob, speed, grid, aug, integrator));
        LagrangianDescriptorSolution b = solve(LagrangianDescriptorProblem(prob, speed, grid, post, integrator));

        for (size_t k=0; k<N; ++k)
        {
            assert(relative_equal(*a.field[k].lfwd, *b.field[k].lfwd, 1e-4));
            assert(relative_equal(*a.field[k].lbwd, *b.field[k].lbwd, 1e-4));
        }

        post.quadrature = QuadratureRule::Trapezoidal;
        LagrangianDescriptorSolution c = solve(LagrangianDescriptorProblem(prob, speed, grid, post, integrator));
        for (size_t k=0; k<N; ++k)
        {
            assert(relative_equal(*a.field[k].lfwd, *c.field[k].lfwd, 1e-3));
        }
    }

    // -------------------------------------------------------------------------
    // Repeated solve and matrix view
    // -------------------------------------------------------------------------
    {
        LagrangianDescriptorProblem lagprob(prob, speed, grid, DescriptorOptions{}, integrator);
        LagrangianDescriptorSolution first  = solve(lagprob);
        LagrangianDescriptorSolution second = solve(lagprob);

        for (size_t k=0; k<N; ++k)
        {
            assert(*first.field[k].lfwd == *second.field[k].lfwd);
            assert(*first.field[k].lbwd == *second.field[k].lbwd);
        }

        mat_real fwd = first.field.toMatrix(Branch::Forward, first.grid);
        assert(fwd.size() == 3 && fwd[0].size() == 3);
        // Row 1 column 2 is grid entry 5 = (x, y) = (1, 0).
        assert(first.grid[5][0] == 1.0 && first.grid[5][1] == 0.0);
        assert(fwd[1][2] == *first.field[5].lfwd);

        vec_real bwd = first.field.values(Branch::Backward);
        assert(bwd.size() == N && bwd[3] == *first.field[3].lbwd);

        bool thrown = false;
        try { first.field.toMatrix(Branch::Forward, InitialConditionGrid::rectangular(0.0, 1.0, 2, 0.0, 1.0, 2)); }
        catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
    }

    return 0;
}
