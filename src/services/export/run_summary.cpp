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

#include "services/export/run_summary.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace cox_pmap::services {

namespace {

std::string pathString(const std::optional<std::filesystem::path>& path) {
    return path ? path->string() : std::string();
}

}  // anonymous namespace

RunSummary RunSummary::fromResult(
    const core::RunConfig& config,
    const CombinedSignificanceEngine::Result& result
) {
    RunSummary summary;
    summary.config = config;
    summary.degreesOfFreedom = config.degreesOfFreedom();
    summary.voxelCount = result.voxelCount;
    summary.forcedVoxelCount = result.forcedVoxelCount;

    if (!result.pValueMap) {
        return summary;
    }

    const double* p = result.pValueMap->GetBufferPointer();
    const uint8_t* valid = result.validityMask ? result.validityMask->GetBufferPointer() : nullptr;

    for (uint64_t i = 0; i < result.voxelCount; ++i) {
        // Without a mask a forced voxel is indistinguishable from p == 0
        const bool defined = valid ? valid[i] != 0 : p[i] != 0.0;
        if (!defined) {
            continue;
        }
        summary.minPValue = summary.minPValue ? std::min(*summary.minPValue, p[i]) : p[i];
        summary.maxPValue = summary.maxPValue ? std::max(*summary.maxPValue, p[i]) : p[i];
        if (p[i] < kAlpha) {
            ++summary.significantVoxelCount;
        }
    }

    return summary;
}

nlohmann::json RunSummary::toJson() const {
    nlohmann::json j;

    j["inputs"] = {
        {"beta_a", config.betaAPath.string()},
        {"beta_b", config.betaBPath.string()},
        {"var_a", config.varAPath.string()},
        {"var_b", config.varBPath.string()},
        {"cov_ab", config.covABPath.string()},
        {"anatomy_mask", pathString(config.anatomyMaskPath)}
    };
    j["model"] = {
        {"n_obs", config.nObservations},
        {"n_predictors", config.nPredictors},
        {"degrees_of_freedom", degreesOfFreedom}
    };
    j["outputs"] = {
        {"p_value_map", config.outputPath.string()},
        {"validity_mask", pathString(config.validityMaskPath)}
    };

    nlohmann::json voxels = {
        {"total", voxelCount},
        {"forced_to_zero", forcedVoxelCount},
        {"significant", significantVoxelCount},
        {"alpha", kAlpha}
    };
    voxels["forced_within_anatomy"] = forcedWithinAnatomyCount
        ? nlohmann::json(*forcedWithinAnatomyCount)
        : nlohmann::json(nullptr);
    voxels["min_p"] = minPValue ? nlohmann::json(*minPValue) : nlohmann::json(nullptr);
    voxels["max_p"] = maxPValue ? nlohmann::json(*maxPValue) : nlohmann::json(nullptr);
    j["voxels"] = voxels;

    return j;
}

std::expected<void, std::string>
RunSummary::writeTo(const std::filesystem::path& filePath) const {
    if (filePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec) {
            return std::unexpected("Cannot create directory: " + ec.message());
        }
    }

    std::ofstream file(filePath);
    if (!file.is_open()) {
        return std::unexpected("Failed to open file for writing: " + filePath.string());
    }

    file << toJson().dump(2) << '\n';
    if (!file) {
        return std::unexpected("Failed to write: " + filePath.string());
    }
    return {};
}

}  // namespace cox_pmap::services
