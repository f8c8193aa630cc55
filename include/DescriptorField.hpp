#pragma once
/**
 * @file DescriptorField.hpp
 * @brief Grid of initial conditions and the ordered descriptor field computed
 *        over it.
 *
 * @details
 * - **InitialConditionGrid**: ordered, immutable collection of N starting
 *   states; the index of an entry is its position in the output field.
 * - **OutputRecord**: forward and/or backward descriptor value of one grid
 *   entry; which of the two is present depends only on the Direction.
 * - **DescriptorField**: N records index-aligned with the grid.
 * - **SubproblemKey**: structured identity of one subproblem of an ensemble.
 */

#include "common.hpp"

/**
 * @class InitialConditionGrid
 * @brief Ordered collection of initial states, optionally shaped rows x cols.
 */
class InitialConditionGrid
{
  private:
    std::vector<vec_real> points; ///< Initial states, index = output position.
    size_t nRows;                 ///< Rows of the 2-D shape (N for a flat grid).
    size_t nCols;                 ///< Columns of the 2-D shape (1 for a flat grid).

  public:
    /**
     * @brief Flat grid of the given states (shape N x 1).
     */
    explicit InitialConditionGrid(std::vector<vec_real> pointsIn);

    /**
     * @brief Grid with an explicit shape; entry (r,c) lives at r*cols + c.
     * @throws std::invalid_argument if rows*cols != number of points.
     */
    InitialConditionGrid(std::vector<vec_real> pointsIn, size_t rows, size_t cols);

    /**
     * @brief Planar mesh {(x, y)} with nx points in [xmin,xmax] and ny in [ymin,ymax].
     *
     * Rows run over y, columns over x: entry (r,c) = (x_c, y_r).
     */
    static InitialConditionGrid rectangular(real_t xmin, real_t xmax, size_t nx,
                                            real_t ymin, real_t ymax, size_t ny);

    size_t size() const { return points.size(); }
    size_t rows() const { return nRows; }
    size_t cols() const { return nCols; }
    bool empty() const { return points.empty(); }

    const vec_real& operator[](size_t i) const { return points[i]; }

    /// Bounds-checked access, throws std::out_of_range.
    const vec_real& at(size_t i) const { return points.at(i); }
};

/**
 * @struct OutputRecord
 * @brief Descriptor values of one grid entry.
 */
struct OutputRecord
{
    std::optional<real_t> lfwd; ///< Forward descriptor, present for Forward/Both.
    std::optional<real_t> lbwd; ///< Backward descriptor, present for Backward/Both.
    bool valid = true;          ///< False if any contributing subproblem failed.

    /// Value of the given branch; throws std::out_of_range if absent.
    real_t get(Branch branch) const;

    bool has(Branch branch) const { return branch == Branch::Forward ? lfwd.has_value() : lbwd.has_value(); }
};

/**
 * @class DescriptorField
 * @brief Ordered descriptor values, index-aligned with an InitialConditionGrid.
 */
class DescriptorField
{
  private:
    std::vector<OutputRecord> records;

  public:
    DescriptorField() = default;
    explicit DescriptorField(size_t n) : records(n) {}

    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }

    OutputRecord& operator[](size_t i) { return records[i]; }
    const OutputRecord& operator[](size_t i) const { return records[i]; }
    const OutputRecord& at(size_t i) const { return records.at(i); }

    std::vector<OutputRecord>::const_iterator begin() const { return records.cbegin(); }
    std::vector<OutputRecord>::const_iterator end() const { return records.cend(); }

    /// Values of one branch in grid order; NaN where the branch is absent.
    vec_real values(Branch branch) const;

    /**
     * @brief Values of one branch reshaped to the grid's rows x cols.
     * @throws std::invalid_argument if the grid size differs from the field size.
     */
    mat_real toMatrix(Branch branch, const InitialConditionGrid& grid) const;
};

/**
 * @struct SubproblemKey
 * @brief Identity of one subproblem: its position in the batch, the grid
 *        entry (pair) it contributes to and the branch it computes.
 */
struct SubproblemKey
{
    size_t index;      ///< Position in the batch, 0..numSubproblems-1.
    size_t pairIndex;  ///< Grid entry / output position, 0..N-1.
    Branch branch;     ///< Forward or backward half.
};
