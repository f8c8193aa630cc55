//==============================================================================
// DescriptorField.cpp
// Initial condition grids and ordered descriptor fields.
//==============================================================================

#include "DescriptorField.hpp"

InitialConditionGrid::InitialConditionGrid(std::vector<vec_real> pointsIn)
    : points(std::move(pointsIn)), nRows(points.size()), nCols(1)
{
}

InitialConditionGrid::InitialConditionGrid(std::vector<vec_real> pointsIn, size_t rows, size_t cols)
    : points(std::move(pointsIn)), nRows(rows), nCols(cols)
{
    if (rows * cols != points.size())
    {
        throw std::invalid_argument("Grid shape " + std::to_string(rows) + "x" + std::to_string(cols)
                                    + " does not hold " + std::to_string(points.size()) + " points.");
    }
}

//------------------------------------------------------------------------------
// rectangular: row r ↔ y_r, column c ↔ x_c, linear index r*nx + c.
// A single point per axis sits at the lower bound.
//------------------------------------------------------------------------------
InitialConditionGrid InitialConditionGrid::rectangular(real_t xmin, real_t xmax, size_t nx,
                                                       real_t ymin, real_t ymax, size_t ny)
{
    if (nx == 0 || ny == 0)
    {
        throw std::invalid_argument("Rectangular grid needs at least one point per axis.");
    }

    const real_t dx = nx > 1 ? (xmax - xmin) / static_cast<real_t>(nx - 1) : 0.0;
    const real_t dy = ny > 1 ? (ymax - ymin) / static_cast<real_t>(ny - 1) : 0.0;

    std::vector<vec_real> pts;
    pts.reserve(nx * ny);
    for (size_t r=0; r<ny; ++r)
    {
        for (size_t c=0; c<nx; ++c)
        {
            pts.push_back({xmin + static_cast<real_t>(c) * dx, ymin + static_cast<real_t>(r) * dy});
        }
    }

    return InitialConditionGrid(std::move(pts), ny, nx);
}

real_t OutputRecord::get(Branch branch) const
{
    const std::optional<real_t>& value = branch == Branch::Forward ? lfwd : lbwd;
    if (!value)
    {
        throw std::out_of_range("Record has no " + to_string(branch) + " descriptor.");
    }
    return *value;
}

vec_real DescriptorField::values(Branch branch) const
{
    vec_real out(records.size(), std::numeric_limits<real_t>::quiet_NaN());
    for (size_t i=0; i<records.size(); ++i)
    {
        if (records[i].has(branch))
        {
            out[i] = records[i].get(branch);
        }
    }
    return out;
}

mat_real DescriptorField::toMatrix(Branch branch, const InitialConditionGrid& grid) const
{
    if (grid.size() != records.size())
    {
        throw std::invalid_argument("Grid of size " + std::to_string(grid.size())
                                    + " does not match field of size " + std::to_string(records.size()) + ".");
    }

    const vec_real flat = values(branch);
    mat_real mat(grid.rows(), vec_real(grid.cols()));
    for (size_t r=0; r<grid.rows(); ++r)
    {
        for (size_t c=0; c<grid.cols(); ++c)
        {
            mat[r][c] = flat[r*grid.cols() + c];
        }
    }
    return mat;
}
