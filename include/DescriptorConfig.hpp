#pragma once
/**
 * @file DescriptorConfig.hpp
 * @brief Lightweight data structure for loading descriptor and integrator
 *        settings from JSON.
 *
 * @details
 * - **DescriptorConfig**: POD-style container that initializes itself from a
 *   JSON object (or file) and exposes the options of every layer: the
 *   descriptor (direction, method, quadrature), the integrator passed through
 *   to the ODEStepper, and the ensemble execution.
 */

#include <type_traits>

#include "common.hpp"
#include "Errors.hpp"
#include "ODEStepper.hpp"
#include "PostQuadrature.hpp"
#include "EnsembleSolver.hpp"
#include "LagrangianDescriptorProblem.hpp"

/**
 * @struct DescriptorConfig
 * @brief Configuration of one descriptor computation.
 *
 * @section fields Key Fields
 * - `Direction`     : "forward", "backward" or "both" (default "both").
 * - `Method`        : "augmented" or "postprocessed" (default "augmented").
 * - `Quadrature`    : "spline" or "trapezoidal" (default "spline").
 * - `SchemeIRK`     : Scheme (order) for implicit RK method (e.g. 1(2),2(4),3(6)).
 * - `Dt`            : Maximal step size.
 * - `PrecisionIRK`  : Tolerance for implicit RK stage iteration.
 * - `MaxIterIRK`    : Maximum stage iterations per IRK step.
 * - `SaveEverystep` : Keep every step of each trajectory.
 * - `FailFast`      : Raise IntegrationError when a subproblem fails.
 * - `Verbose`       : Print per-subproblem progress.
 */
struct DescriptorConfig
{
    DescriptorOptions descriptor;
    IntegratorOptions integrator;
    EnsembleOptions   ensemble;

    DescriptorConfig() = default;

    /**
     * @brief Construct from a JSON object; absent keys keep their defaults.
     *
     * Layout:
     * ```
     * {
     *   "Direction": "both", "Method": "augmented", "Quadrature": "spline",
     *   "SchemeIRK": 3, "Dt": 0.01, "PrecisionIRK": 1e-12, "MaxIterIRK": 100,
     *   "SaveEverystep": true, "FailFast": true, "Verbose": false
     * }
     * ```
     * @throws ConfigurationError for an unrecognised value, a value of the
     *         wrong type, or a non-positive Dt, PrecisionIRK or MaxIterIRK.
     */
    explicit DescriptorConfig(const json& configIn)
    {
        if (!configIn.is_object())
        {
            throw ConfigurationError("Descriptor configuration must be a JSON object.");
        }

        if (configIn.contains("Method"))
        {
            descriptor.method = parseMethod(readValue<std::string>(configIn, "Method", "a string"));
        }
        if (configIn.contains("Direction"))
        {
            descriptor.direction = parseDirection(readValue<std::string>(configIn, "Direction", "a string"));
        }
        if (configIn.contains("Quadrature"))
        {
            descriptor.quadrature = parseQuadrature(readValue<std::string>(configIn, "Quadrature", "a string"));
        }

        if (configIn.contains("SchemeIRK"))
        {
            switch (readValue<int>(configIn, "SchemeIRK", "an integer"))
            {
                case 1: integrator.scheme = Scheme::IRK1; break;
                case 2: integrator.scheme = Scheme::IRK2; break;
                case 3: integrator.scheme = Scheme::IRK3; break;
                default: throw ConfigurationError("Wrong IRK Scheme stage supplied: "
                                                  + configIn["SchemeIRK"].dump() + "; use 1, 2 or 3.");
            }
        }

        integrator.dt            = readPositive<real_t>(configIn, "Dt", integrator.dt, "a positive number");
        integrator.precision     = readPositive<real_t>(configIn, "PrecisionIRK", integrator.precision, "a positive number");
        integrator.maxIts        = readPositive<int>(configIn, "MaxIterIRK", integrator.maxIts, "a positive integer");
        integrator.saveEverystep = readValue<bool>(configIn, "SaveEverystep", integrator.saveEverystep, "a boolean");
        ensemble.failFast        = readValue<bool>(configIn, "FailFast", ensemble.failFast, "a boolean");
        ensemble.verbose         = readValue<bool>(configIn, "Verbose", ensemble.verbose, "a boolean");
    }

    /**
     * @brief Typed value of a present key.
     * @throws ConfigurationError naming the key and the expected type.
     */
    template <typename T>
    static T readValue(const json& configIn, const std::string& key, const std::string& expected)
    {
        const json& entry = configIn.at(key);

        bool matches = entry.is_string();
        if (std::is_same<T, bool>::value)        matches = entry.is_boolean();
        else if (std::is_integral<T>::value)     matches = entry.is_number_integer();
        else if (std::is_arithmetic<T>::value)   matches = entry.is_number();

        if (!matches)
        {
            throw ConfigurationError("Key `" + key + "` must be " + expected + ", got " + entry.dump() + ".");
        }
        return entry.get<T>();
    }

    /// Typed value of an optional key; absent keys give fallback.
    template <typename T>
    static T readValue(const json& configIn, const std::string& key, T fallback, const std::string& expected)
    {
        return configIn.contains(key) ? readValue<T>(configIn, key, expected) : fallback;
    }

    /// As readValue, additionally rejecting values that are not > 0.
    template <typename T>
    static T readPositive(const json& configIn, const std::string& key, T fallback, const std::string& expected)
    {
        const T value = readValue<T>(configIn, key, fallback, expected);
        if (!(value > T(0)))
        {
            throw ConfigurationError("Key `" + key + "` must be " + expected + ", got " + configIn.at(key).dump() + ".");
        }
        return value;
    }

    /**
     * @brief Load configuration from a JSON file.
     * @throws std::runtime_error if file cannot be opened.
     */
    static DescriptorConfig loadFromJson(const std::string& filename)
    {
        std::ifstream inFile(filename);
        if (!inFile)
        {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        json j;
        inFile >> j;

        return DescriptorConfig(j);
    }

    /// Configuration as JSON, in the layout accepted by the constructor.
    json toJson() const
    {
        json j;
        j["Direction"]     = to_string(descriptor.direction);
        j["Method"]        = to_string(descriptor.method);
        j["Quadrature"]    = to_string(descriptor.quadrature);
        j["SchemeIRK"]     = int(integrator.scheme)+1;
        j["Dt"]            = integrator.dt;
        j["PrecisionIRK"]  = integrator.precision;
        j["MaxIterIRK"]    = integrator.maxIts;
        j["SaveEverystep"] = integrator.saveEverystep;
        j["FailFast"]      = ensemble.failFast;
        j["Verbose"]       = ensemble.verbose;
        return j;
    }

    /// Parse "forward" / "backward" / "both".
    static Direction parseDirection(const std::string& value)
    {
        if (value == "forward")  return Direction::Forward;
        if (value == "backward") return Direction::Backward;
        if (value == "both")     return Direction::Both;
        throw ConfigurationError("Direction `" + value + "` not implemented; use either forward, backward or both.");
    }

    /// Parse "augmented" / "postprocessed".
    static Method parseMethod(const std::string& value)
    {
        if (value == "augmented")     return Method::Augmented;
        if (value == "postprocessed") return Method::Postprocessed;
        throw ConfigurationError("Method `" + value + "` not implemented; use either augmented or postprocessed.");
    }

    /// Parse "spline" / "trapezoidal".
    static QuadratureRule parseQuadrature(const std::string& value)
    {
        if (value == "spline")      return QuadratureRule::CubicSpline;
        if (value == "trapezoidal") return QuadratureRule::Trapezoidal;
        throw ConfigurationError("Quadrature `" + value + "` not implemented; use either spline or trapezoidal.");
    }

    /// Print a human-readable configuration summary to stdout.
    void print_config() const
    {
        std::cout << "Descriptor configuration:" << std::endl;
        std::cout << "Direction: " << to_string(descriptor.direction) << std::endl;
        std::cout << "Method: " << to_string(descriptor.method) << std::endl;
        std::cout << "Quadrature: " << to_string(descriptor.quadrature) << std::endl;
        std::cout << "SchemeIRK: " << int(integrator.scheme)+1 << std::endl;
        std::cout << "Dt: " << integrator.dt << std::endl;
        std::cout << "PrecisionIRK: " << integrator.precision << std::endl;
        std::cout << "MaxIterIRK: " << integrator.maxIts << std::endl;
        std::cout << "SaveEverystep: " << integrator.saveEverystep << std::endl;
        std::cout << "FailFast: " << ensemble.failFast << std::endl;
        std::cout << "Verbose: " << ensemble.verbose << std::endl;
    }
};
