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
 * @file run_summary.hpp
 * @brief JSON summary of a combined p-value run
 * @details Records the inputs, degrees of freedom and outcome counts of one
 *          run so that forced (p = 0) voxels can be reviewed afterwards.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/run_config.hpp"
#include "services/statistics/combined_significance_engine.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace cox_pmap::services {

struct RunSummary {
    /// Significance level used for significantVoxelCount
    static constexpr double kAlpha = 0.05;

    core::RunConfig config;

    int degreesOfFreedom = 0;
    uint64_t voxelCount = 0;
    uint64_t forcedVoxelCount = 0;

    /// Only set when an anatomy mask was supplied
    std::optional<uint64_t> forcedWithinAnatomyCount;

    /// Range over voxels with a defined p-value; unset if there are none
    std::optional<double> minPValue;
    std::optional<double> maxPValue;

    /// Voxels with a defined p-value below kAlpha
    uint64_t significantVoxelCount = 0;

    /**
     * @brief Build a summary from a finished computation
     *
     * Uses the validity mask when present to tell forced zeros from genuine
     * p-values; without it every voxel with p = 0 is treated as forced.
     */
    [[nodiscard]] static RunSummary fromResult(
        const core::RunConfig& config,
        const CombinedSignificanceEngine::Result& result
    );

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Write the summary as indented JSON
     * @return Success or error message
     */
    [[nodiscard]] std::expected<void, std::string>
    writeTo(const std::filesystem::path& filePath) const;
};

}  // namespace cox_pmap::services
