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

#include "services/statistics/combined_significance_engine.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <future>
#include <limits>
#include <thread>
#include <vector>

#include <boost/math/distributions/students_t.hpp>

#include <itkImageRegionConstIterator.h>

namespace cox_pmap::services {

namespace {

/// Smallest voxel range handed to one worker
constexpr size_t kMinVoxelsPerChunk = 16384;

/// Upper-tail probability doubled; t must not be NaN
double twoSided(const boost::math::students_t& dist, double tStatistic) {
    return 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(tStatistic)));
}

/// t statistic of beta_a + beta_b, NaN when the combined variance is not positive
double combinedTStatistic(double betaA, double betaB,
                          double varA, double varB, double covAB) {
    const double varSum = varA + varB + 2.0 * covAB;
    if (!(varSum > 0.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return (betaA + betaB) / std::sqrt(varSum);
}

struct Buffers {
    const double* betaA = nullptr;
    const double* betaB = nullptr;
    const double* varA = nullptr;
    const double* varB = nullptr;
    const double* covAB = nullptr;
    double* pValues = nullptr;
    uint8_t* validity = nullptr;
};

/// Evaluate voxels [begin, end); returns the number forced to 0
uint64_t evaluateRange(const Buffers& buf, size_t begin, size_t end, int df) {
    const boost::math::students_t dist(static_cast<double>(df));
    uint64_t forced = 0;

    for (size_t i = begin; i < end; ++i) {
        const double t = combinedTStatistic(
            buf.betaA[i], buf.betaB[i], buf.varA[i], buf.varB[i], buf.covAB[i]);

        const bool valid = !std::isnan(t);
        buf.pValues[i] = valid ? twoSided(dist, t) : 0.0;
        if (!valid) {
            ++forced;
        }
        if (buf.validity) {
            buf.validity[i] = valid ? 1 : 0;
        }
    }
    return forced;
}

const char* mapName(size_t index) {
    static constexpr const char* names[] = {"beta_a", "beta_b", "var_a", "var_b", "cov_ab"};
    return names[index];
}

std::string formatSize(const CombinedSignificanceEngine::ImageType::SizeType& size) {
    return std::format("{}x{}x{}", size[0], size[1], size[2]);
}

}  // anonymous namespace

std::expected<void, SignificanceError>
CombinedSignificanceEngine::checkSameShape(const Inputs& inputs) {
    const std::array<const ImageType*, 5> maps = {
        inputs.betaA.GetPointer(), inputs.betaB.GetPointer(),
        inputs.varA.GetPointer(), inputs.varB.GetPointer(),
        inputs.covAB.GetPointer()
    };

    for (size_t i = 0; i < maps.size(); ++i) {
        if (!maps[i]) {
            return std::unexpected(SignificanceError{
                SignificanceError::Code::InvalidInput,
                std::format("{} map is null", mapName(i))
            });
        }
    }

    const auto reference = maps[0]->GetLargestPossibleRegion().GetSize();
    for (size_t i = 1; i < maps.size(); ++i) {
        const auto size = maps[i]->GetLargestPossibleRegion().GetSize();
        if (size != reference) {
            return std::unexpected(SignificanceError{
                SignificanceError::Code::ShapeMismatch,
                std::format("input maps must have identical dimensions: {} is {} but {} is {}",
                            mapName(i), formatSize(size), mapName(0), formatSize(reference))
            });
        }
    }

    return {};
}

double CombinedSignificanceEngine::twoSidedPValue(double tStatistic, int degreesOfFreedom) {
    const boost::math::students_t dist(static_cast<double>(degreesOfFreedom));
    return twoSided(dist, tStatistic);
}

double CombinedSignificanceEngine::combinedPValue(
    double betaA,
    double betaB,
    double varA,
    double varB,
    double covAB,
    int degreesOfFreedom
) {
    const double t = combinedTStatistic(betaA, betaB, varA, varB, covAB);
    if (std::isnan(t)) {
        return 0.0;
    }
    return twoSidedPValue(t, degreesOfFreedom);
}

std::expected<CombinedSignificanceEngine::Result, SignificanceError>
CombinedSignificanceEngine::compute(const Inputs& inputs, const Parameters& params) const {
    auto logger = logging::LoggerFactory::create("CombinedSignificance");

    if (auto shape = checkSameShape(inputs); !shape) {
        logger->error("{}", shape.error().toString());
        return std::unexpected(shape.error());
    }

    if (!params.isValid()) {
        return std::unexpected(SignificanceError{
            SignificanceError::Code::InvalidDegreesOfFreedom,
            std::format("df must be positive, got {}", params.degreesOfFreedom)
        });
    }

    const auto region = inputs.betaA->GetLargestPossibleRegion();
    const size_t voxelCount = region.GetNumberOfPixels();

    Result result;
    result.voxelCount = voxelCount;

    try {
        result.pValueMap = ImageType::New();
        result.pValueMap->CopyInformation(inputs.betaA);
        result.pValueMap->SetRegions(region);
        result.pValueMap->Allocate();

        if (params.produceValidityMask) {
            result.validityMask = MaskType::New();
            result.validityMask->CopyInformation(inputs.betaA);
            result.validityMask->SetRegions(region);
            result.validityMask->Allocate();
        }

        Buffers buf;
        buf.betaA = inputs.betaA->GetBufferPointer();
        buf.betaB = inputs.betaB->GetBufferPointer();
        buf.varA = inputs.varA->GetBufferPointer();
        buf.varB = inputs.varB->GetBufferPointer();
        buf.covAB = inputs.covAB->GetBufferPointer();
        buf.pValues = result.pValueMap->GetBufferPointer();
        buf.validity = result.validityMask ? result.validityMask->GetBufferPointer() : nullptr;

        unsigned int workers = params.threadCount > 0
            ? params.threadCount
            : std::max(1u, std::thread::hardware_concurrency());
        const size_t maxChunks = std::max<size_t>(1, voxelCount / kMinVoxelsPerChunk);
        const size_t chunkCount = std::min<size_t>(workers, maxChunks);
        const size_t chunkSize = (voxelCount + chunkCount - 1) / chunkCount;

        logger->debug("Evaluating {} voxels in {} chunk(s), df = {}",
                      voxelCount, chunkCount, params.degreesOfFreedom);

        std::vector<std::future<uint64_t>> chunks;
        chunks.reserve(chunkCount);
        for (size_t begin = 0; begin < voxelCount; begin += chunkSize) {
            const size_t end = std::min(voxelCount, begin + chunkSize);
            chunks.push_back(std::async(std::launch::async,
                [&buf, begin, end, df = params.degreesOfFreedom]() {
                    return evaluateRange(buf, begin, end, df);
                }));
        }

        for (auto& chunk : chunks) {
            result.forcedVoxelCount += chunk.get();
        }
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(SignificanceError{
            SignificanceError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(SignificanceError{
            SignificanceError::Code::ProcessingFailed,
            std::string("Standard exception: ") + e.what()
        });
    }

    if (result.forcedVoxelCount > 0) {
        logger->warn("{} of {} voxels have non-positive combined variance and were set to p = 0; "
                     "mask the output by anatomy before interpreting it",
                     result.forcedVoxelCount, result.voxelCount);
    }
    logger->info("Combined p-value map computed ({} voxels)", result.voxelCount);

    return result;
}

std::expected<uint64_t, SignificanceError>
CombinedSignificanceEngine::countForcedWithinMask(
    const MaskType* validityMask,
    const MaskType* anatomyMask
) {
    if (!validityMask || !anatomyMask) {
        return std::unexpected(SignificanceError{
            SignificanceError::Code::InvalidInput,
            "Validity mask and anatomy mask are required"
        });
    }

    const auto validitySize = validityMask->GetLargestPossibleRegion().GetSize();
    const auto anatomySize = anatomyMask->GetLargestPossibleRegion().GetSize();
    if (validitySize != anatomySize) {
        return std::unexpected(SignificanceError{
            SignificanceError::Code::ShapeMismatch,
            std::format("anatomy mask is {} but the p-value map is {}",
                        formatSize(anatomySize), formatSize(validitySize))
        });
    }

    using IteratorType = itk::ImageRegionConstIterator<MaskType>;
    IteratorType validIt(validityMask, validityMask->GetLargestPossibleRegion());
    IteratorType anatomyIt(anatomyMask, anatomyMask->GetLargestPossibleRegion());

    uint64_t count = 0;
    for (validIt.GoToBegin(), anatomyIt.GoToBegin(); !validIt.IsAtEnd(); ++validIt, ++anatomyIt) {
        if (anatomyIt.Get() != 0 && validIt.Get() == 0) {
            ++count;
        }
    }
    return count;
}

}  // namespace cox_pmap::services
