// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "core/run_config.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <utility>
#include <vector>

#include <getopt.h>

#include <nlohmann/json.hpp>

namespace cox_pmap::core {

namespace {

enum Option : int {
    OPT_HELP = 'h',
    OPT_BETA_A = 300,
    OPT_BETA_B,
    OPT_VAR_A,
    OPT_VAR_B,
    OPT_COV_AB,
    OPT_N_OBS,
    OPT_N_PREDICTORS,
    OPT_OUTPUT,
    OPT_VALIDITY_MASK,
    OPT_ANATOMY_MASK,
    OPT_SUMMARY,
    OPT_THREADS,
    OPT_STRICT_GEOMETRY,
    OPT_LOG_LEVEL,
    OPT_LOG_DIR,
    OPT_CONFIG
};

// The beta4/beta6/var4/var6/cov46 and n_obs/n_predictors spellings are kept
// for scripts written against the earlier per-study tool.
const option kLongOptions[] = {
    {"help",            no_argument,       nullptr, OPT_HELP},
    {"beta-a",          required_argument, nullptr, OPT_BETA_A},
    {"beta4",           required_argument, nullptr, OPT_BETA_A},
    {"beta-b",          required_argument, nullptr, OPT_BETA_B},
    {"beta6",           required_argument, nullptr, OPT_BETA_B},
    {"var-a",           required_argument, nullptr, OPT_VAR_A},
    {"var4",            required_argument, nullptr, OPT_VAR_A},
    {"var-b",           required_argument, nullptr, OPT_VAR_B},
    {"var6",            required_argument, nullptr, OPT_VAR_B},
    {"cov-ab",          required_argument, nullptr, OPT_COV_AB},
    {"cov46",           required_argument, nullptr, OPT_COV_AB},
    {"n-obs",           required_argument, nullptr, OPT_N_OBS},
    {"n_obs",           required_argument, nullptr, OPT_N_OBS},
    {"n-predictors",    required_argument, nullptr, OPT_N_PREDICTORS},
    {"n_predictors",    required_argument, nullptr, OPT_N_PREDICTORS},
    {"output",          required_argument, nullptr, OPT_OUTPUT},
    {"validity-mask",   required_argument, nullptr, OPT_VALIDITY_MASK},
    {"anatomy-mask",    required_argument, nullptr, OPT_ANATOMY_MASK},
    {"summary",         required_argument, nullptr, OPT_SUMMARY},
    {"threads",         required_argument, nullptr, OPT_THREADS},
    {"strict-geometry", no_argument,       nullptr, OPT_STRICT_GEOMETRY},
    {"log-level",       required_argument, nullptr, OPT_LOG_LEVEL},
    {"log-dir",         required_argument, nullptr, OPT_LOG_DIR},
    {"config",          required_argument, nullptr, OPT_CONFIG},
    {nullptr,           0,                 nullptr, 0}
};

std::expected<int, ConfigError> parseInt(const std::string& name, const std::string& text) {
    int value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            std::format("{} expects an integer, got '{}'", name, text)
        });
    }
    return value;
}

std::expected<void, ConfigError>
applyOption(RunConfig& config, int option, const std::string& value) {
    switch (option) {
        case OPT_BETA_A: config.betaAPath = value; break;
        case OPT_BETA_B: config.betaBPath = value; break;
        case OPT_VAR_A: config.varAPath = value; break;
        case OPT_VAR_B: config.varBPath = value; break;
        case OPT_COV_AB: config.covABPath = value; break;
        case OPT_OUTPUT: config.outputPath = value; break;
        case OPT_VALIDITY_MASK: config.validityMaskPath = value; break;
        case OPT_ANATOMY_MASK: config.anatomyMaskPath = value; break;
        case OPT_SUMMARY: config.summaryPath = value; break;
        case OPT_LOG_DIR: config.logDirectory = value; break;
        case OPT_STRICT_GEOMETRY: config.strictGeometry = true; break;
        case OPT_N_OBS: {
            auto n = parseInt("--n-obs", value);
            if (!n) return std::unexpected(n.error());
            config.nObservations = *n;
            break;
        }
        case OPT_N_PREDICTORS: {
            auto n = parseInt("--n-predictors", value);
            if (!n) return std::unexpected(n.error());
            config.nPredictors = *n;
            break;
        }
        case OPT_THREADS: {
            auto n = parseInt("--threads", value);
            if (!n) return std::unexpected(n.error());
            if (*n < 0) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "--threads must not be negative"
                });
            }
            config.threads = static_cast<unsigned int>(*n);
            break;
        }
        case OPT_LOG_LEVEL: {
            auto level = logging::logLevelFromString(value);
            if (!level) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    std::format("unknown log level '{}'", value)
                });
            }
            config.logLevel = *level;
            break;
        }
        default:
            break;
    }
    return {};
}

}  // anonymous namespace

std::expected<void, ConfigError> RunConfig::validate() const {
    const std::pair<const char*, const std::filesystem::path*> required[] = {
        {"--beta-a", &betaAPath},
        {"--beta-b", &betaBPath},
        {"--var-a", &varAPath},
        {"--var-b", &varBPath},
        {"--cov-ab", &covABPath},
        {"--output", &outputPath}
    };
    for (const auto& [flag, path] : required) {
        if (path->empty()) {
            return std::unexpected(ConfigError{ConfigError::Code::MissingArgument, flag});
        }
    }

    if (nObservations <= 0) {
        return std::unexpected(ConfigError{
            ConfigError::Code::MissingArgument,
            "--n-obs must be a positive number of observations"
        });
    }
    if (nPredictors <= 0) {
        return std::unexpected(ConfigError{
            ConfigError::Code::MissingArgument,
            "--n-predictors must be a positive number of predictors"
        });
    }
    if (degreesOfFreedom() <= 0) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            std::format("degrees of freedom n_obs - n_predictors - 1 = {} must be positive",
                        degreesOfFreedom())
        });
    }
    return {};
}

std::expected<RunConfig, ConfigError>
RunConfig::fromJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileError,
            "Cannot open " + path.string()
        });
    }

    RunConfig config;
    try {
        nlohmann::json j = nlohmann::json::parse(file);

        auto readPath = [&j](const char* key, std::filesystem::path& target) {
            if (j.contains(key)) {
                target = j.at(key).get<std::string>();
            }
        };
        auto readOptionalPath = [&j](const char* key,
                                     std::optional<std::filesystem::path>& target) {
            if (j.contains(key) && !j.at(key).is_null()) {
                target = j.at(key).get<std::string>();
            }
        };

        readPath("beta_a", config.betaAPath);
        readPath("beta_b", config.betaBPath);
        readPath("var_a", config.varAPath);
        readPath("var_b", config.varBPath);
        readPath("cov_ab", config.covABPath);
        readPath("output", config.outputPath);
        readPath("log_dir", config.logDirectory);
        readOptionalPath("validity_mask", config.validityMaskPath);
        readOptionalPath("anatomy_mask", config.anatomyMaskPath);
        readOptionalPath("summary", config.summaryPath);

        config.nObservations = j.value("n_obs", 0);
        config.nPredictors = j.value("n_predictors", 0);
        const int threads = j.value("threads", 0);
        if (threads < 0) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                std::format("threads must not be negative in {}", path.string())
            });
        }
        config.threads = static_cast<unsigned int>(threads);
        config.strictGeometry = j.value("strict_geometry", false);

        if (j.contains("log_level")) {
            auto name = j.at("log_level").get<std::string>();
            auto level = logging::logLevelFromString(name);
            if (!level) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    std::format("unknown log level '{}' in {}", name, path.string())
                });
            }
            config.logLevel = *level;
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::ParseError,
            std::format("{}: {}", path.string(), e.what())
        });
    }

    return config;
}

std::expected<RunConfig, ConfigError>
RunConfig::fromCommandLine(int argc, char* argv[]) {
    std::vector<std::pair<int, std::string>> options;
    std::optional<std::filesystem::path> configFile;

    // 0 forces glibc to reinitialise its scanner between calls
    optind = 0;
    opterr = 0;

    int next = 0;
    while ((next = getopt_long(argc, argv, ":h", kLongOptions, nullptr)) != -1) {
        switch (next) {
            case OPT_HELP:
                return std::unexpected(ConfigError{ConfigError::Code::HelpRequested, ""});
            case OPT_CONFIG:
                configFile = optarg;
                break;
            case ':':
                return std::unexpected(ConfigError{
                    ConfigError::Code::MissingArgument,
                    std::format("{} requires a value", argv[optind - 1])
                });
            case '?':
                return std::unexpected(ConfigError{
                    ConfigError::Code::UnknownOption,
                    argv[optind - 1]
                });
            default:
                options.emplace_back(next, optarg ? std::string(optarg) : std::string());
                break;
        }
    }

    if (optind < argc) {
        return std::unexpected(ConfigError{
            ConfigError::Code::UnknownOption,
            std::format("unexpected argument '{}'", argv[optind])
        });
    }

    RunConfig config;
    if (configFile) {
        auto loaded = fromJsonFile(*configFile);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    for (const auto& [option, value] : options) {
        if (auto applied = applyOption(config, option, value); !applied) {
            return std::unexpected(applied.error());
        }
    }

    return config;
}

std::string RunConfig::usage(const std::string& programName) {
    return std::format(
        "Usage: {} [options]\n"
        "\n"
        "Voxel-wise two-sided p-values for the sum of two Cox regression coefficients.\n"
        "\n"
        "Required:\n"
        "  --beta-a PATH        coefficient map of the first term        (alias --beta4)\n"
        "  --beta-b PATH        coefficient map of the second term       (alias --beta6)\n"
        "  --var-a PATH         variance map of the first coefficient    (alias --var4)\n"
        "  --var-b PATH         variance map of the second coefficient   (alias --var6)\n"
        "  --cov-ab PATH        covariance map of the two coefficients   (alias --cov46)\n"
        "  --n-obs N            number of observations (subjects)\n"
        "  --n-predictors K     number of predictors, including covariates,\n"
        "                       interaction term and intercept\n"
        "  --output PATH        output p-value map\n"
        "\n"
        "Optional:\n"
        "  --validity-mask PATH write 1 where p is defined, 0 where it was forced to 0\n"
        "  --anatomy-mask PATH  report forced voxels that fall inside this mask\n"
        "  --summary PATH       write a JSON run summary\n"
        "  --threads N          worker threads (0 = all cores)\n"
        "  --strict-geometry    fail when input origin/spacing/direction differ\n"
        "  --log-level LEVEL    trace, debug, info, warn, error, critical, off\n"
        "  --log-dir DIR        also write rotating log files to DIR\n"
        "  --config PATH        JSON file with the same settings (flags override it)\n"
        "  -h, --help           show this message\n"
        "\n"
        "Voxels with non-positive combined variance are written as p = 0. Mask the\n"
        "output by anatomy before interpreting it.\n",
        programName);
}

}  // namespace cox_pmap::core
