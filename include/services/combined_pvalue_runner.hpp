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
 * @file combined_pvalue_runner.hpp
 * @brief End-to-end run: load maps, compute, write results
 * @details Drives one invocation of the tool from a validated RunConfig:
 *          loads the five input volumes, rejects mismatched shapes before
 *          any computation, checks spatial metadata, runs the
 *          CombinedSignificanceEngine and writes the p-value map with the
 *          geometry of the first coefficient map. Nothing is written when a
 *          validation step fails.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/run_config.hpp"
#include "services/export/run_summary.hpp"

#include <expected>
#include <string>

namespace cox_pmap::services {

/**
 * @brief Error information for a complete run
 */
struct RunError {
    enum class Code {
        Success,
        InvalidConfig,
        InputReadFailed,
        ShapeMismatch,
        GeometryMismatch,
        ProcessingFailed,
        OutputWriteFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    /// 1 configuration, 2 input validation, 3 I/O or processing
    [[nodiscard]] int exitCode() const noexcept {
        switch (code) {
            case Code::Success: return 0;
            case Code::InvalidConfig: return 1;
            case Code::ShapeMismatch:
            case Code::GeometryMismatch: return 2;
            case Code::InputReadFailed:
            case Code::ProcessingFailed:
            case Code::OutputWriteFailed: return 3;
        }
        return 3;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidConfig: return "Invalid configuration: " + message;
            case Code::InputReadFailed: return "Cannot read input: " + message;
            case Code::ShapeMismatch: return "Shape mismatch: " + message;
            case Code::GeometryMismatch: return "Geometry mismatch: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
            case Code::OutputWriteFailed: return "Cannot write output: " + message;
        }
        return "Unknown error";
    }
};

class CombinedPValueRunner {
public:
    /**
     * @brief Execute a run
     * @param config Run configuration; validated again here
     * @return Summary of the run (also written when config.summaryPath is set)
     */
    [[nodiscard]] std::expected<RunSummary, RunError>
    run(const core::RunConfig& config) const;
};

}  // namespace cox_pmap::services
