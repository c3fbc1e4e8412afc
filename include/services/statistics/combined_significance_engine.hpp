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
 * @file combined_significance_engine.hpp
 * @brief Voxel-wise significance of the sum of two regression coefficients
 * @details Computes a two-sided p-value map for beta_a + beta_b from two
 *          coefficient maps, their variance maps and their covariance map,
 *          using a Student's t reference distribution with a volume-wide
 *          degrees of freedom.
 *
 * ## Degenerate voxels
 * A voxel whose combined variance var_a + var_b + 2 * cov_ab is not strictly
 * positive, or whose statistic is NaN, is written as p = 0. An infinite
 * statistic is not degenerate: it yields p = 0 with validity 1.
 * Such voxels normally lie outside the analysed anatomy. A p of 0 at a forced
 * voxel is NOT a significant result: mask the output by anatomy before
 * interpreting it, or request the validity mask and audit it.
 *
 * ## Thread Safety
 * - compute() holds no state and may be called concurrently
 * - Input images are only read
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <expected>
#include <string>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace cox_pmap::services {

/**
 * @brief Error information for combined significance computation
 */
struct SignificanceError {
    enum class Code {
        Success,
        InvalidInput,
        ShapeMismatch,
        InvalidDegreesOfFreedom,
        ProcessingFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::ShapeMismatch: return "Shape mismatch: " + message;
            case Code::InvalidDegreesOfFreedom:
                return "Invalid degrees of freedom: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Two-sided test of beta_a + beta_b at every voxel
 *
 * Per voxel:
 * @code
 * var_sum = var_a + var_b + 2 * cov_ab
 * t       = (beta_a + beta_b) / sqrt(var_sum)       // undefined if var_sum <= 0
 * p       = 2 * (1 - T_cdf(|t|, df))                // 0 if undefined
 * @endcode
 *
 * @example
 * @code
 * CombinedSignificanceEngine engine;
 * CombinedSignificanceEngine::Inputs inputs{betaA, betaB, varA, varB, covAB};
 *
 * CombinedSignificanceEngine::Parameters params;
 * params.degreesOfFreedom = nObs - nPredictors - 1;
 * params.produceValidityMask = true;
 *
 * auto result = engine.compute(inputs, params);
 * if (result) {
 *     auto pMap = result->pValueMap;
 * }
 * @endcode
 */
class CombinedSignificanceEngine {
public:
    /// Coefficient, variance, covariance and p-value maps
    using ImageType = itk::Image<double, 3>;

    /// 1 where p was computed, 0 where p was forced to 0
    using MaskType = itk::Image<uint8_t, 3>;

    /// The five input maps; all must share one voxel grid
    struct Inputs {
        ImageType::Pointer betaA;
        ImageType::Pointer betaB;
        ImageType::Pointer varA;
        ImageType::Pointer varB;
        ImageType::Pointer covAB;
    };

    struct Parameters {
        /// n_observations - n_predictors - 1, constant across the volume
        int degreesOfFreedom = 0;

        /// Worker count; 0 = hardware concurrency
        unsigned int threadCount = 0;

        /// Also return the validity mask
        bool produceValidityMask = false;

        [[nodiscard]] bool isValid() const noexcept {
            return degreesOfFreedom > 0;
        }
    };

    struct Result {
        /// Two-sided p-values, geometry of Inputs::betaA
        ImageType::Pointer pValueMap;

        /// Null unless Parameters::produceValidityMask was set
        MaskType::Pointer validityMask;

        uint64_t voxelCount = 0;

        /// Voxels whose p-value was forced to 0
        uint64_t forcedVoxelCount = 0;
    };

    CombinedSignificanceEngine() = default;

    /**
     * @brief Compute the p-value map for beta_a + beta_b
     *
     * Fails only for null inputs, mismatched shapes or df <= 0. Numeric
     * degeneracies at individual voxels are absorbed into the output.
     *
     * @param inputs Coefficient, variance and covariance maps
     * @param params Degrees of freedom and execution options
     * @return P-value map (and optional validity mask) on success
     */
    [[nodiscard]] std::expected<Result, SignificanceError>
    compute(const Inputs& inputs, const Parameters& params) const;

    /**
     * @brief Verify that all five maps are present and share one size
     * @return ShapeMismatch naming the first map that differs from betaA
     */
    [[nodiscard]] static std::expected<void, SignificanceError>
    checkSameShape(const Inputs& inputs);

    /**
     * @brief P-value of beta_a + beta_b at a single voxel
     *
     * Returns 0.0 when the combined variance is not positive or the
     * statistic is NaN. An infinite statistic gives 0.0 through the t tail.
     */
    [[nodiscard]] static double combinedPValue(
        double betaA,
        double betaB,
        double varA,
        double varB,
        double covAB,
        int degreesOfFreedom
    );

    /**
     * @brief 2 * (1 - T_cdf(|t|, df)) for a non-NaN t and df > 0
     */
    [[nodiscard]] static double twoSidedPValue(double tStatistic, int degreesOfFreedom);

    /**
     * @brief Count voxels forced to 0 that fall inside an anatomical mask
     *
     * A non-zero count means the p-value map contains zero-valued voxels
     * inside the analysed region that must not be read as significant.
     *
     * @param validityMask Mask returned by compute()
     * @param anatomyMask Non-zero inside the region of interest
     * @return Number of forced voxels inside the mask
     */
    [[nodiscard]] static std::expected<uint64_t, SignificanceError>
    countForcedWithinMask(const MaskType* validityMask, const MaskType* anatomyMask);
};

}  // namespace cox_pmap::services
