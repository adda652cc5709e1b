#pragma once
/*
===============================================================================
CONFIG — Solver settings and frontier run configuration
===============================================================================

OVERVIEW
--------
Two plain structs hold everything a frontier run can vary:

    SolverSettings  — Gurobi parameters applied to every portfolio model
    FrontierConfig  — market size and seed, risk-aversion grid, highlighted
                      samples, solver settings, optional CSV output path

Defaults reproduce the reference run: 10 assets, seed 1, 100 samples with
gamma log-spaced over [1e-2, 1e3], samples 29 and 40 highlighted.

Overrides arrive as a DataStore (see data_store.h). parseOverrides() fills one
from "key=value" strings and FrontierConfig::fromStore() applies it:

    auto store  = markowitz::parseOverrides({"n=20", "markers=5,50", "quiet=0"});
    auto config = markowitz::FrontierConfig::fromStore(store);

Keys
----
    n, samples                  int
    seed                        unsigned 64-bit
    gamma_min, gamma_max        double (base-10 exponents)
    markers                     comma-separated sample indices
    quiet                       0/1
    time_limit, bar_conv_tol    double
    threads, bar_iter_limit     int
    log_file, csv               string

EXCEPTION SAFETY
----------------
• parseOverrides(): std::invalid_argument on a malformed pair, unknown key or
  unparsable value
• validate(): std::invalid_argument naming the offending field

===============================================================================
*/

#include <charconv>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "data_store.h"

namespace markowitz {

    // ========================================================================
    // SOLVER SETTINGS
    // ========================================================================
    struct SolverSettings {
        bool quiet = true;              ///< OutputFlag = 0
        double timeLimit = 0.0;         ///< Seconds; 0 leaves Gurobi's default
        int threads = 0;                ///< 0 = automatic
        double barConvTol = 1e-9;       ///< BarConvTol
        int barIterLimit = -1;          ///< BarIterLimit; < 0 leaves the default
        std::string logFile;            ///< LogFile; empty disables

        void validate() const {
            if (timeLimit < 0.0) {
                throw std::invalid_argument(
                    std::format("SolverSettings: time_limit must be >= 0, got {}", timeLimit));
            }
            if (threads < 0) {
                throw std::invalid_argument(
                    std::format("SolverSettings: threads must be >= 0, got {}", threads));
            }
            if (!(barConvTol > 0.0 && barConvTol < 1.0)) {
                throw std::invalid_argument(
                    std::format("SolverSettings: bar_conv_tol must be in (0, 1), got {}", barConvTol));
            }
        }
    };

    // ========================================================================
    // FRONTIER CONFIG
    // ========================================================================
    struct FrontierConfig {
        int assets = 10;
        std::uint64_t seed = 1;
        int samples = 100;
        double gammaMinExponent = -2.0;
        double gammaMaxExponent = 3.0;
        std::vector<int> markers{ 29, 40 };
        SolverSettings solver;
        std::string csvPath;

        void validate() const {
            if (assets <= 0) {
                throw std::invalid_argument(
                    std::format("FrontierConfig: n must be positive, got {}", assets));
            }
            if (samples <= 0) {
                throw std::invalid_argument(
                    std::format("FrontierConfig: samples must be positive, got {}", samples));
            }
            if (samples > 1 && !(gammaMinExponent < gammaMaxExponent)) {
                throw std::invalid_argument(
                    std::format("FrontierConfig: gamma_min ({}) must be below gamma_max ({})",
                                gammaMinExponent, gammaMaxExponent));
            }
            for (int m : markers) {
                if (m < 0 || m >= samples) {
                    throw std::invalid_argument(
                        std::format("FrontierConfig: marker {} outside [0, {})", m, samples));
                }
            }
            solver.validate();
        }

        /**
         * @brief Defaults overridden by the entries of a DataStore
         * @throws std::bad_any_cast if an entry holds the wrong type
         */
        static FrontierConfig fromStore(const DataStore& store) {
            FrontierConfig c;
            auto find = [&](const char* key) -> const Value* {
                auto it = store.find(key);
                return it == store.end() ? nullptr : &it->second;
            };

            if (auto v = find("n"))              c.assets = v->get<int>();
            if (auto v = find("seed"))           c.seed = v->get<std::uint64_t>();
            if (auto v = find("samples"))        c.samples = v->get<int>();
            if (auto v = find("gamma_min"))      c.gammaMinExponent = v->get<double>();
            if (auto v = find("gamma_max"))      c.gammaMaxExponent = v->get<double>();
            if (auto v = find("markers"))        c.markers = v->get<std::vector<int>>();
            if (auto v = find("quiet"))          c.solver.quiet = v->get<bool>();
            if (auto v = find("time_limit"))     c.solver.timeLimit = v->get<double>();
            if (auto v = find("threads"))        c.solver.threads = v->get<int>();
            if (auto v = find("bar_conv_tol"))   c.solver.barConvTol = v->get<double>();
            if (auto v = find("bar_iter_limit")) c.solver.barIterLimit = v->get<int>();
            if (auto v = find("log_file"))       c.solver.logFile = v->get<std::string>();
            if (auto v = find("csv"))            c.csvPath = v->get<std::string>();

            return c;
        }
    };

    namespace config_detail {

        inline int parseInt(std::string_view key, std::string_view text) {
            int out = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                throw std::invalid_argument(
                    std::format("parseOverrides: {} expects an integer, got '{}'", key, text));
            }
            return out;
        }

        inline std::uint64_t parseSeed(std::string_view key, std::string_view text) {
            std::uint64_t out = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                throw std::invalid_argument(
                    std::format("parseOverrides: {} expects an unsigned 64-bit integer, got '{}'",
                                key, text));
            }
            return out;
        }

        inline double parseDouble(std::string_view key, std::string_view text) {
            double out = 0.0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            if (ec != std::errc() || ptr != text.data() + text.size()) {
                throw std::invalid_argument(
                    std::format("parseOverrides: {} expects a number, got '{}'", key, text));
            }
            return out;
        }

        inline bool parseBool(std::string_view key, std::string_view text) {
            if (text == "1" || text == "true")  return true;
            if (text == "0" || text == "false") return false;
            throw std::invalid_argument(
                std::format("parseOverrides: {} expects 0/1, got '{}'", key, text));
        }

        inline std::vector<int> parseIntList(std::string_view key, std::string_view text) {
            std::vector<int> out;
            while (!text.empty()) {
                const auto comma = text.find(',');
                out.push_back(parseInt(key, text.substr(0, comma)));
                if (comma == std::string_view::npos) break;
                text.remove_prefix(comma + 1);
                if (text.empty()) {
                    throw std::invalid_argument(
                        std::format("parseOverrides: {} has a trailing comma", key));
                }
            }
            return out;
        }

    } // namespace config_detail

    /**
     * @brief Parse "key=value" overrides into a DataStore
     *
     * @details Values are stored with the type FrontierConfig::fromStore()
     *          expects for the key. Later pairs override earlier ones.
     */
    inline DataStore parseOverrides(const std::vector<std::string>& args) {
        using namespace config_detail;

        DataStore store;
        for (const auto& arg : args) {
            const auto eq = arg.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::invalid_argument(
                    std::format("parseOverrides: expected key=value, got '{}'", arg));
            }
            const std::string key = arg.substr(0, eq);
            const std::string_view val = std::string_view(arg).substr(eq + 1);

            if (key == "n" || key == "samples" ||
                key == "threads" || key == "bar_iter_limit") {
                store[key] = parseInt(key, val);
            } else if (key == "seed") {
                store[key] = parseSeed(key, val);
            } else if (key == "gamma_min" || key == "gamma_max" ||
                       key == "time_limit" || key == "bar_conv_tol") {
                store[key] = parseDouble(key, val);
            } else if (key == "markers") {
                store[key] = parseIntList(key, val);
            } else if (key == "quiet") {
                store[key] = parseBool(key, val);
            } else if (key == "log_file" || key == "csv") {
                store[key] = std::string(val);
            } else {
                throw std::invalid_argument(
                    std::format("parseOverrides: unknown key '{}'", key));
            }
        }
        return store;
    }

} // namespace markowitz
