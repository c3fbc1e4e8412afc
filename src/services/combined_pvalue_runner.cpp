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

#include "services/combined_pvalue_runner.hpp"
#include "core/logging.hpp"
#include "core/volume_io.hpp"
#include "services/statistics/combined_significance_engine.hpp"

#include <array>
#include <format>
#include <utility>

namespace cox_pmap::services {

namespace {

using core::ScalarVolumeType;
using core::VolumeIO;

RunError fromSignificanceError(const SignificanceError& error) {
    switch (error.code) {
        case SignificanceError::Code::ShapeMismatch:
            return RunError{RunError::Code::ShapeMismatch, error.message};
        case SignificanceError::Code::InvalidDegreesOfFreedom:
            return RunError{RunError::Code::InvalidConfig, error.toString()};
        case SignificanceError::Code::InvalidInput:
        case SignificanceError::Code::ProcessingFailed:
        case SignificanceError::Code::Success:
            break;
    }
    return RunError{RunError::Code::ProcessingFailed, error.toString()};
}

}  // anonymous namespace

std::expected<RunSummary, RunError>
CombinedPValueRunner::run(const core::RunConfig& config) const {
    auto logger = logging::LoggerFactory::create("Runner");

    if (auto valid = config.validate(); !valid) {
        return std::unexpected(RunError{RunError::Code::InvalidConfig, valid.error().toString()});
    }

    logger->info("Combined p-value run: n_obs = {}, n_predictors = {}, df = {}",
                 config.nObservations, config.nPredictors, config.degreesOfFreedom());

    // Load inputs
    const std::array<std::pair<const char*, const std::filesystem::path*>, 5> sources = {{
        {"beta_a", &config.betaAPath},
        {"beta_b", &config.betaBPath},
        {"var_a", &config.varAPath},
        {"var_b", &config.varBPath},
        {"cov_ab", &config.covABPath}
    }};

    std::array<ScalarVolumeType::Pointer, 5> volumes;
    for (size_t i = 0; i < sources.size(); ++i) {
        auto volume = VolumeIO::load(*sources[i].second);
        if (!volume) {
            return std::unexpected(RunError{
                RunError::Code::InputReadFailed,
                std::format("{}: {}", sources[i].first, volume.error().toString())
            });
        }
        volumes[i] = std::move(*volume);
    }

    CombinedSignificanceEngine::Inputs inputs{
        volumes[0], volumes[1], volumes[2], volumes[3], volumes[4]
    };

    if (auto shape = CombinedSignificanceEngine::checkSameShape(inputs); !shape) {
        logger->error("{}", shape.error().toString());
        return std::unexpected(fromSignificanceError(shape.error()));
    }

    for (size_t i = 1; i < volumes.size(); ++i) {
        if (VolumeIO::sameGeometry(volumes[0], volumes[i])) {
            continue;
        }
        auto message = std::format("{} origin/spacing/direction differ from {}",
                                   sources[i].first, sources[0].first);
        if (config.strictGeometry) {
            logger->error("{}", message);
            return std::unexpected(RunError{RunError::Code::GeometryMismatch, message});
        }
        logger->warn("{}; the output uses the geometry of {}", message, sources[0].first);
    }

    core::MaskVolumeType::Pointer anatomyMask;
    if (config.anatomyMaskPath) {
        auto mask = VolumeIO::loadMask(*config.anatomyMaskPath);
        if (!mask) {
            return std::unexpected(RunError{
                RunError::Code::InputReadFailed,
                std::format("anatomy_mask: {}", mask.error().toString())
            });
        }
        anatomyMask = std::move(*mask);

        const auto maskSize = anatomyMask->GetLargestPossibleRegion().GetSize();
        const auto mapSize = volumes[0]->GetLargestPossibleRegion().GetSize();
        if (maskSize != mapSize) {
            return std::unexpected(RunError{
                RunError::Code::ShapeMismatch,
                std::format("anatomy mask is {}x{}x{} but the input maps are {}x{}x{}",
                            maskSize[0], maskSize[1], maskSize[2],
                            mapSize[0], mapSize[1], mapSize[2])
            });
        }
    }

    // Compute
    CombinedSignificanceEngine::Parameters params;
    params.degreesOfFreedom = config.degreesOfFreedom();
    params.threadCount = config.threads;
    // The summary needs the mask to tell a forced 0 from an underflowed tail
    params.produceValidityMask = true;

    CombinedSignificanceEngine engine;
    auto result = engine.compute(inputs, params);
    if (!result) {
        return std::unexpected(fromSignificanceError(result.error()));
    }

    auto summary = RunSummary::fromResult(config, *result);

    if (anatomyMask) {
        auto inside = CombinedSignificanceEngine::countForcedWithinMask(
            result->validityMask, anatomyMask);
        if (!inside) {
            return std::unexpected(fromSignificanceError(inside.error()));
        }
        summary.forcedWithinAnatomyCount = *inside;
        if (*inside > 0) {
            logger->warn("{} voxels inside the anatomy mask have p forced to 0; "
                         "these are undefined, not significant", *inside);
        } else {
            logger->info("No forced voxels inside the anatomy mask");
        }
    }

    // Write outputs
    if (auto saved = VolumeIO::save(result->pValueMap, config.outputPath, volumes[0]); !saved) {
        return std::unexpected(RunError{RunError::Code::OutputWriteFailed, saved.error().toString()});
    }

    if (config.validityMaskPath) {
        auto saved = VolumeIO::saveMask(result->validityMask, *config.validityMaskPath, volumes[0]);
        if (!saved) {
            return std::unexpected(RunError{
                RunError::Code::OutputWriteFailed, saved.error().toString()});
        }
    }

    if (config.summaryPath) {
        if (auto written = summary.writeTo(*config.summaryPath); !written) {
            return std::unexpected(RunError{RunError::Code::OutputWriteFailed, written.error()});
        }
        logger->info("Wrote {}", config.summaryPath->string());
    }

    return summary;
}

}  // namespace cox_pmap::services
