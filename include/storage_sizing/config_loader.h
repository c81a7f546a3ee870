#pragma once
/*
===============================================================================
CONFIG LOADER — ProblemConfiguration from JSON
===============================================================================

FORMAT
------
    {
        "numberOfScenarios": 5,
        "numberOfDays": 365,
        "minNumberOfModules": 0,        "maxNumberOfModules": 200,
        "minStorageSizeKwh": 0,         "maxStorageSizeKwh": 100,
        "storagePricePerKwhEuro": 50,   "pricePerModuleEuro": 850,
        "maxWattsPerModule": 800,       "areaPerModuleM2": 1.2,

        "sampling": {                   (optional, every key optional)
            "seed": 42,
            "solarIrradiance": { "mean": 500,   "stddev": 200 },
            "consumption":     { "mean": 10000, "stddev": 2000 },
            "purchasePrice":   { "mean": 0.5,   "stddev": 0 },
            "sellPrice":       { "mean": 0.12,  "stddev": 0 }
        },
        "solver": {                     (optional, every key optional)
            "timeLimitSeconds": 0, "mipGap": 0, "threads": 0, "output": false
        }
    }

The ten top-level keys are required. Parse errors, missing keys, values of
the wrong type and failed validation all raise ConfigurationError.

===============================================================================
*/

#include <cstdint>
#include <filesystem>
#include <format>
#include <istream>
#include <string>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "configuration.h"
#include "errors.h"

namespace sizing {

    namespace config_detail {

        namespace bpt = boost::property_tree;

        /// @brief Value of an optional key; a present but malformed value throws ptree_bad_data
        template <typename T>
        T valueOr(const bpt::ptree& parent, const std::string& key, const T& fallback)
        {
            if (auto node = parent.get_child_optional(key)) {
                return node->get_value<T>();
            }
            return fallback;
        }

        inline NormalParameters readDistribution(const bpt::ptree& parent,
            const std::string& key,
            const NormalParameters& defaults)
        {
            NormalParameters p = defaults;
            if (auto node = parent.get_child_optional(key)) {
                p.mean = valueOr(*node, "mean", defaults.mean);
                p.stddev = valueOr(*node, "stddev", defaults.stddev);
            }
            return p;
        }

    } // namespace config_detail

    /**
     * @brief Build and validate a configuration from a parsed tree
     * @throws ConfigurationError on missing or malformed keys, or invalid values
     */
    inline ProblemConfiguration parseConfiguration(const boost::property_tree::ptree& root) {
        namespace bpt = boost::property_tree;
        ProblemConfiguration config;

        try {
            config.numberOfScenarios      = root.get<int>("numberOfScenarios");
            config.numberOfDays           = root.get<int>("numberOfDays");
            config.minNumberOfModules     = root.get<int>("minNumberOfModules");
            config.maxNumberOfModules     = root.get<int>("maxNumberOfModules");
            config.minStorageSizeKwh      = root.get<double>("minStorageSizeKwh");
            config.maxStorageSizeKwh      = root.get<double>("maxStorageSizeKwh");
            config.storagePricePerKwhEuro = root.get<double>("storagePricePerKwhEuro");
            config.pricePerModuleEuro     = root.get<double>("pricePerModuleEuro");
            config.maxWattsPerModule      = root.get<double>("maxWattsPerModule");
            config.areaPerModuleM2        = root.get<double>("areaPerModuleM2");

            if (auto sampling = root.get_child_optional("sampling")) {
                SamplingSettings& s = config.sampling;
                // read signed so that a negative seed is rejected, not wrapped
                const auto seed = config_detail::valueOr<long long>(
                    *sampling, "seed", static_cast<long long>(s.seed));
                if (seed < 0) {
                    throw ConfigurationError(std::format(
                        "configuration: sampling.seed must be non-negative, got {}", seed));
                }
                s.seed = static_cast<std::uint64_t>(seed);
                s.solarIrradiance = config_detail::readDistribution(*sampling, "solarIrradiance", s.solarIrradiance);
                s.consumption     = config_detail::readDistribution(*sampling, "consumption", s.consumption);
                s.purchasePrice   = config_detail::readDistribution(*sampling, "purchasePrice", s.purchasePrice);
                s.sellPrice       = config_detail::readDistribution(*sampling, "sellPrice", s.sellPrice);
            }

            if (auto solver = root.get_child_optional("solver")) {
                SolverSettings& s = config.solver;
                s.timeLimitSeconds = config_detail::valueOr(*solver, "timeLimitSeconds", s.timeLimitSeconds);
                s.mipGap           = config_detail::valueOr(*solver, "mipGap", s.mipGap);
                s.threads          = config_detail::valueOr(*solver, "threads", s.threads);
                s.output           = config_detail::valueOr(*solver, "output", s.output);
            }
        }
        catch (const bpt::ptree_bad_path& e) {
            throw ConfigurationError(std::string("configuration: missing key: ") + e.what());
        }
        catch (const bpt::ptree_bad_data& e) {
            throw ConfigurationError(std::string("configuration: malformed value: ") + e.what());
        }

        config.validate();
        return config;
    }

    /// @throws ConfigurationError if the stream is not valid JSON or the content is invalid
    inline ProblemConfiguration loadConfiguration(std::istream& in) {
        boost::property_tree::ptree root;
        try {
            boost::property_tree::read_json(in, root);
        }
        catch (const boost::property_tree::json_parser_error& e) {
            throw ConfigurationError(std::string("configuration: invalid JSON: ") + e.what());
        }
        return parseConfiguration(root);
    }

    /// @throws ConfigurationError if the file cannot be read or its content is invalid
    inline ProblemConfiguration loadConfiguration(const std::filesystem::path& path) {
        boost::property_tree::ptree root;
        try {
            boost::property_tree::read_json(path.string(), root);
        }
        catch (const boost::property_tree::json_parser_error& e) {
            throw ConfigurationError(std::string("configuration: cannot read ") + e.what());
        }
        return parseConfiguration(root);
    }

} // namespace sizing
