#pragma once
/**
 * @file common.hpp
 * @brief Common type aliases, enumerations, and third-party includes for the
 *        Lagrangian descriptor library.
 *
 * @details
 * This header centralizes:
 *  - Standard library and third-party includes.
 *  - Type aliases for reals, vectors/matrices and JSON documents.
 *  - Parallelism headers (OpenMP/MPI) enabled via compile-time flags.
 *  - The enumerations shared by every component (integration scheme, flow
 *    direction, descriptor method, branch of a subproblem).
 *  - Small numerical helpers (approximate equality).
 *
 * It is intended to be included across the project for consistent types
 * and helper functions.
 */

// ========== Standard Library ==========
#include <iostream>
#include <iomanip>
#include <cmath>
#include <vector>
#include <array>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <sstream>
#include <fstream>
#include <chrono>
#include <limits>

// ========== Third-Party Libraries ==========
#include <nlohmann/json.hpp> ///< JSON for Modern C++

// ========== LAPACK ==========
#include <lapacke.h>        ///< LAPACK C interface

// ========== Parallelism ==========
#ifdef USE_OPENMP
#include <omp.h>            ///< OpenMP parallelism
#endif

#ifdef USE_MPI
#include <mpi.h>            ///< MPI parallelism
#endif

#ifdef USE_HYBRID
#include <mpi.h>
#include <omp.h>
#endif

// ========== ENUM CLASSES ==========
/**
 * @enum Scheme
 * @brief Available implicit Runge–Kutta integration schemes.
 */
enum class Scheme { IRK1, IRK2, IRK3 };

/**
 * @enum Direction
 * @brief Direction(s) of the flow along which descriptors are accumulated.
 */
enum class Direction { Forward, Backward, Both };

/**
 * @enum Method
 * @brief How the descriptor integral is computed.
 *  - Augmented:     accumulators integrated alongside the trajectory.
 *  - Postprocessed: quadrature over an already computed trajectory.
 */
enum class Method { Augmented, Postprocessed };

/**
 * @enum Branch
 * @brief Forward or backward half of a descriptor.
 */
enum class Branch { Forward, Backward };

// ========== Aliases ===============
using real_t     = double;                     ///< Floating point type used globally.
using vec_real   = std::vector<real_t>;        ///< Vector of real values.
using mat_real   = std::vector<std::vector<real_t>>;   ///< Matrix of real values.
using json       = nlohmann::json;             ///< JSON type alias.

// ============ Common Functions =======

/**
 * @brief Check approximate equality of two real numbers.
 * @param a First number.
 * @param b Second number.
 * @param tol Absolute tolerance (default 1e-15).
 * @return true if |a-b| < tol.
 */
bool almost_equal(double a, double b, double tol = 1e-15);

/**
 * @brief Check approximate equality relative to the magnitude of the inputs.
 * @return true if |a-b| < tol * max(1, |a|, |b|).
 */
bool relative_equal(double a, double b, double tol);

/**
 * @brief True if every entry of the vector is finite.
 */
bool all_finite(const vec_real& vec);

/// Lower-case name of a direction ("forward", "backward", "both").
std::string to_string(Direction direction);

/// Lower-case name of a method ("augmented", "postprocessed").
std::string to_string(Method method);

/// Lower-case name of a branch ("forward", "backward").
std::string to_string(Branch branch);

