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

/**
 * @file run_config.hpp
 * @brief Run configuration for the combined p-value tool
 * @details Collects input/output paths, sample and predictor counts and
 *          execution options from the command line and, optionally, from a
 *          JSON configuration file. Command-line flags override values read
 *          from the file.
 *
 * JSON layout (all keys optional in the file, required ones must be
 * supplied by either source):
 * @code
 * {
 *   "beta_a": "beta4.nii.gz", "beta_b": "beta6.nii.gz",
 *   "var_a": "var4.nii.gz",   "var_b": "var6.nii.gz",
 *   "cov_ab": "cov46.nii.gz",
 *   "n_obs": 120, "n_predictors": 7,
 *   "output": "p_combined.nii.gz",
 *   "validity_mask": "valid.nii.gz", "anatomy_mask": "brain.nii.gz",
 *   "summary": "summary.json",
 *   "threads": 0, "strict_geometry": false,
 *   "log_level": "info", "log_dir": "logs"
 * }
 * @endcode
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/logging.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace cox_pmap::core {

/**
 * @brief Error information for configuration parsing and validation
 */
struct ConfigError {
    enum class Code {
        Success,
        HelpRequested,
        UnknownOption,
        MissingArgument,
        InvalidValue,
        FileError,
        ParseError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::HelpRequested: return "Help requested";
            case Code::UnknownOption: return "Unknown option: " + message;
            case Code::MissingArgument: return "Missing argument: " + message;
            case Code::InvalidValue: return "Invalid value: " + message;
            case Code::FileError: return "Configuration file error: " + message;
            case Code::ParseError: return "Configuration parse error: " + message;
        }
        return "Unknown error";
    }
};

struct RunConfig {
    // Inputs
    std::filesystem::path betaAPath;
    std::filesystem::path betaBPath;
    std::filesystem::path varAPath;
    std::filesystem::path varBPath;
    std::filesystem::path covABPath;

    /// Number of subjects
    int nObservations = 0;

    /// Model predictors including covariates, interaction term and intercept
    int nPredictors = 0;

    // Outputs
    std::filesystem::path outputPath;
    std::optional<std::filesystem::path> validityMaskPath;
    std::optional<std::filesystem::path> anatomyMaskPath;
    std::optional<std::filesystem::path> summaryPath;

    // Execution
    unsigned int threads = 0;
    bool strictGeometry = false;

    logging::LogLevel logLevel = logging::LogLevel::Info;
    std::filesystem::path logDirectory;

    /// n_observations - n_predictors - 1
    [[nodiscard]] int degreesOfFreedom() const noexcept {
        return nObservations - nPredictors - 1;
    }

    /**
     * @brief Check required fields and counts
     *
     * Rejects df <= 0 so that no t distribution is ever built with a
     * non-positive parameter.
     */
    [[nodiscard]] std::expected<void, ConfigError> validate() const;

    /**
     * @brief Read a JSON configuration file
     * @param path File whose keys match the long option names (with '_')
     */
    [[nodiscard]] static std::expected<RunConfig, ConfigError>
    fromJsonFile(const std::filesystem::path& path);

    /**
     * @brief Parse command-line arguments
     *
     * When --config is given the file is loaded first and the remaining
     * flags are applied on top of it. The result is not validated.
     *
     * @return HelpRequested for -h/--help
     */
    [[nodiscard]] static std::expected<RunConfig, ConfigError>
    fromCommandLine(int argc, char* argv[]);

    [[nodiscard]] static std::string usage(const std::string& programName);
};

}  // namespace cox_pmap::core
