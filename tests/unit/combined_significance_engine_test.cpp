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
#include "../test_utils/map_generator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>
#include <random>
#include <thread>
#include <vector>

namespace cox_pmap::services {
namespace {

using test_utils::createLineMap;
using test_utils::createLineMask;
using test_utils::createMap;
using test_utils::createScalarMap;

using Engine = CombinedSignificanceEngine;

// Two-sided p for the reference voxel: beta 0.5 + 0.3, variance 0.04 + 0.09 + 2 * 0.01,
// df = 50. Closed-form even-df series of the Student's t CDF.
constexpr double kReferenceP = 0.04406941034388312;

Engine::Inputs scalarInputs(double betaA, double betaB,
                            double varA, double varB, double covAB) {
    return Engine::Inputs{
        createScalarMap(betaA), createScalarMap(betaB),
        createScalarMap(varA), createScalarMap(varB),
        createScalarMap(covAB)
    };
}

Engine::Parameters paramsWithDf(int df, bool mask = false) {
    Engine::Parameters params;
    params.degreesOfFreedom = df;
    params.produceValidityMask = mask;
    return params;
}

double firstVoxel(const Engine::Result& result) {
    return result.pValueMap->GetBufferPointer()[0];
}

class CombinedSignificanceEngineTest : public ::testing::Test {
protected:
    Engine engine_;
};

// =============================================================================
// SignificanceError tests
// =============================================================================

TEST(SignificanceErrorTest, DefaultIsSuccess) {
    SignificanceError error;

    EXPECT_TRUE(error.isSuccess());
    EXPECT_EQ(error.toString(), "Success");
}

TEST(SignificanceErrorTest, ShapeMismatchMessage) {
    SignificanceError error{SignificanceError::Code::ShapeMismatch, "var_b is 2x2x2"};

    EXPECT_FALSE(error.isSuccess());
    EXPECT_EQ(error.toString(), "Shape mismatch: var_b is 2x2x2");
}

// =============================================================================
// Per-voxel transform
// =============================================================================

TEST(CombinedPValueTest, ReferenceVoxel) {
    double p = Engine::combinedPValue(0.5, 0.3, 0.04, 0.09, 0.01, 50);

    EXPECT_NEAR(p, kReferenceP, 1e-10);
}

TEST(CombinedPValueTest, ZeroCovarianceIsSumOfIndependentCoefficients) {
    // var_sum = 0.13, t = 0.8 / sqrt(0.13)
    double p = Engine::combinedPValue(0.5, 0.3, 0.04, 0.09, 0.0, 50);

    EXPECT_NEAR(p, 0.031068401597452056, 1e-10);
    EXPECT_DOUBLE_EQ(p, Engine::twoSidedPValue(0.8 / std::sqrt(0.13), 50));
}

TEST(CombinedPValueTest, NegativeCovarianceLowersPValue) {
    // Negative covariance shrinks the combined variance and therefore p
    double independent = Engine::combinedPValue(0.5, 0.3, 0.04, 0.09, 0.0, 50);
    double anticorrelated = Engine::combinedPValue(0.5, 0.3, 0.04, 0.09, -0.02, 50);

    EXPECT_LT(anticorrelated, independent);
}

TEST(CombinedPValueTest, CauchyClosedForm) {
    // df = 1: p = 1 - (2 / pi) * atan(|t|)
    for (double t : {0.25, 1.0, 3.0, 12.0}) {
        double expected = 1.0 - 2.0 / std::numbers::pi * std::atan(t);
        EXPECT_NEAR(Engine::twoSidedPValue(t, 1), expected, 1e-12) << "t = " << t;
    }
}

TEST(CombinedPValueTest, TwoDegreesOfFreedomClosedForm) {
    // df = 2: p = 1 - |t| / sqrt(2 + t^2); beta_sum 2, var_sum 1 -> t = 2
    double p = Engine::combinedPValue(1.5, 0.5, 0.5, 0.3, 0.1, 2);

    EXPECT_NEAR(p, 1.0 - 2.0 / std::sqrt(6.0), 1e-12);
}

TEST(CombinedPValueTest, NegativeVarianceIsForcedToZero) {
    for (double beta : {-3.0, 0.0, 0.4, 25.0}) {
        EXPECT_EQ(Engine::combinedPValue(beta, beta, -0.01, 0.0, 0.0, 50), 0.0)
            << "beta = " << beta;
    }
}

TEST(CombinedPValueTest, ExactlyZeroCombinedVarianceIsForcedToZero) {
    // 0.04 + 0.04 + 2 * (-0.04) == 0
    EXPECT_EQ(Engine::combinedPValue(0.5, 0.3, 0.04, 0.04, -0.04, 50), 0.0);
}

TEST(CombinedPValueTest, NonFiniteInputIsForcedToZero) {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_EQ(Engine::combinedPValue(nan, 0.3, 0.04, 0.09, 0.01, 50), 0.0);
    EXPECT_EQ(Engine::combinedPValue(0.5, 0.3, nan, 0.09, 0.01, 50), 0.0);
    EXPECT_EQ(Engine::combinedPValue(0.5, 0.3, 0.04, 0.09, nan, 50), 0.0);
}

TEST(CombinedPValueTest, InfiniteCoefficientGivesZeroThroughTail) {
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_EQ(Engine::combinedPValue(inf, 0.3, 0.04, 0.09, 0.01, 50), 0.0);
    EXPECT_EQ(Engine::combinedPValue(0.5, -inf, 0.04, 0.09, 0.01, 50), 0.0);
}

TEST(CombinedPValueTest, InfiniteVarianceGivesOne) {
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_EQ(Engine::combinedPValue(0.5, 0.3, inf, 0.09, 0.01, 50), 1.0);
    EXPECT_EQ(Engine::combinedPValue(0.5, 0.3, 0.04, 0.09, inf, 50), 1.0);
}

TEST(CombinedPValueTest, OpposingInfinitiesAreForcedToZero) {
    const double inf = std::numeric_limits<double>::infinity();

    // inf + (-inf) is NaN
    EXPECT_EQ(Engine::combinedPValue(inf, -inf, 0.04, 0.09, 0.01, 50), 0.0);
    EXPECT_EQ(Engine::combinedPValue(0.5, 0.3, inf, 0.09, -inf, 50), 0.0);
}

TEST(CombinedPValueTest, ZeroSumGivesOne) {
    EXPECT_DOUBLE_EQ(Engine::combinedPValue(0.4, -0.4, 0.04, 0.09, 0.01, 50), 1.0);
}

TEST(CombinedPValueTest, SymmetricUnderNegation) {
    double positive = Engine::combinedPValue(0.5, 0.3, 0.04, 0.09, 0.01, 50);
    double negative = Engine::combinedPValue(-0.5, -0.3, 0.04, 0.09, 0.01, 50);

    EXPECT_DOUBLE_EQ(positive, negative);
}

TEST(CombinedPValueTest, ExtremeStatisticApproachesZero) {
    double p = Engine::combinedPValue(40.0, 10.0, 1e-4, 1e-4, 0.0, 50);

    EXPECT_GE(p, 0.0);
    EXPECT_LT(p, 1e-100);
}

// =============================================================================
// Volume computation
// =============================================================================

TEST_F(CombinedSignificanceEngineTest, SingleVoxelReference) {
    auto result = engine_.compute(scalarInputs(0.5, 0.3, 0.04, 0.09, 0.01), paramsWithDf(50));

    ASSERT_TRUE(result.has_value()) << result.error().toString();
    EXPECT_NEAR(firstVoxel(*result), kReferenceP, 1e-10);
    EXPECT_EQ(result->voxelCount, 1u);
    EXPECT_EQ(result->forcedVoxelCount, 0u);
    EXPECT_FALSE(result->validityMask);
}

TEST_F(CombinedSignificanceEngineTest, DegenerateVoxelIsZeroRegardlessOfBetas) {
    for (double beta : {-2.0, 0.0, 0.5, 100.0}) {
        auto result = engine_.compute(scalarInputs(beta, beta, -0.01, 0.0, 0.0),
                                      paramsWithDf(50, true));

        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(firstVoxel(*result), 0.0) << "beta = " << beta;
        EXPECT_EQ(result->forcedVoxelCount, 1u);
        ASSERT_TRUE(result->validityMask);
        EXPECT_EQ(result->validityMask->GetBufferPointer()[0], 0);
    }
}

TEST_F(CombinedSignificanceEngineTest, InfiniteStatisticIsComputedNotForced) {
    const double inf = std::numeric_limits<double>::infinity();
    auto result = engine_.compute(scalarInputs(inf, 0.3, 0.04, 0.09, 0.01),
                                  paramsWithDf(50, true));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(firstVoxel(*result), 0.0);
    EXPECT_EQ(result->forcedVoxelCount, 0u);
    ASSERT_TRUE(result->validityMask);
    EXPECT_EQ(result->validityMask->GetBufferPointer()[0], 1);
}

TEST_F(CombinedSignificanceEngineTest, MixedVoxelsAreIndependent) {
    // voxel 0: reference; voxel 1: degenerate variance; voxel 2: beta sum 0
    Engine::Inputs inputs{
        createLineMap({0.5, 0.9, 0.2}),
        createLineMap({0.3, 0.9, -0.2}),
        createLineMap({0.04, -0.01, 0.04}),
        createLineMap({0.09, 0.0, 0.09}),
        createLineMap({0.01, 0.0, 0.01})
    };

    auto result = engine_.compute(inputs, paramsWithDf(50, true));

    ASSERT_TRUE(result.has_value());
    const double* p = result->pValueMap->GetBufferPointer();
    EXPECT_NEAR(p[0], kReferenceP, 1e-10);
    EXPECT_EQ(p[1], 0.0);
    EXPECT_DOUBLE_EQ(p[2], 1.0);

    EXPECT_EQ(result->voxelCount, 3u);
    EXPECT_EQ(result->forcedVoxelCount, 1u);

    const uint8_t* valid = result->validityMask->GetBufferPointer();
    EXPECT_EQ(valid[0], 1);
    EXPECT_EQ(valid[1], 0);
    EXPECT_EQ(valid[2], 1);
}

TEST_F(CombinedSignificanceEngineTest, NegatedBetasGiveSameMap) {
    std::vector<double> a = {0.1, -0.7, 1.2, 0.0};
    std::vector<double> b = {0.4, 0.2, -0.3, 0.05};
    std::vector<double> negA, negB;
    for (size_t i = 0; i < a.size(); ++i) {
        negA.push_back(-a[i]);
        negB.push_back(-b[i]);
    }
    auto varA = createLineMap({0.02, 0.05, 0.1, 0.03});
    auto varB = createLineMap({0.03, 0.05, 0.2, 0.01});
    auto cov = createLineMap({0.0, -0.01, 0.05, 0.002});

    auto pos = engine_.compute({createLineMap(a), createLineMap(b), varA, varB, cov},
                               paramsWithDf(30));
    auto neg = engine_.compute({createLineMap(negA), createLineMap(negB), varA, varB, cov},
                               paramsWithDf(30));

    ASSERT_TRUE(pos.has_value());
    ASSERT_TRUE(neg.has_value());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_DOUBLE_EQ(pos->pValueMap->GetBufferPointer()[i],
                         neg->pValueMap->GetBufferPointer()[i]) << "voxel " << i;
    }
}

TEST_F(CombinedSignificanceEngineTest, OutputCopiesGeometryOfFirstCoefficientMap) {
    Engine::Inputs inputs{
        createMap(3, 4, 5, 0.5, 2.0, -90.0),
        createMap(3, 4, 5, 0.3),
        createMap(3, 4, 5, 0.04),
        createMap(3, 4, 5, 0.09),
        createMap(3, 4, 5, 0.01)
    };

    auto result = engine_.compute(inputs, paramsWithDf(50));

    ASSERT_TRUE(result.has_value());
    const auto& pMap = result->pValueMap;
    EXPECT_EQ(pMap->GetLargestPossibleRegion().GetSize(),
              inputs.betaA->GetLargestPossibleRegion().GetSize());
    EXPECT_DOUBLE_EQ(pMap->GetSpacing()[0], 2.0);
    EXPECT_DOUBLE_EQ(pMap->GetOrigin()[0], -90.0);
    EXPECT_EQ(result->voxelCount, 60u);
}

TEST_F(CombinedSignificanceEngineTest, OutputStaysWithinUnitInterval) {
    constexpr unsigned int n = 10;
    auto betaA = createMap(n, n, n);
    auto betaB = createMap(n, n, n);
    auto varA = createMap(n, n, n);
    auto varB = createMap(n, n, n);
    auto cov = createMap(n, n, n);

    std::mt19937 rng(7);
    std::normal_distribution<double> beta(0.0, 1.0);
    std::uniform_real_distribution<double> variance(-0.05, 0.5);
    std::uniform_real_distribution<double> covariance(-0.1, 0.1);
    for (size_t i = 0; i < n * n * n; ++i) {
        betaA->GetBufferPointer()[i] = beta(rng);
        betaB->GetBufferPointer()[i] = beta(rng);
        varA->GetBufferPointer()[i] = variance(rng);
        varB->GetBufferPointer()[i] = variance(rng);
        cov->GetBufferPointer()[i] = covariance(rng);
    }

    auto result = engine_.compute({betaA, betaB, varA, varB, cov}, paramsWithDf(12));

    ASSERT_TRUE(result.has_value());
    for (size_t i = 0; i < n * n * n; ++i) {
        double p = result->pValueMap->GetBufferPointer()[i];
        EXPECT_FALSE(std::isnan(p));
        EXPECT_GE(p, 0.0);
        EXPECT_LE(p, 1.0);
    }
}

TEST_F(CombinedSignificanceEngineTest, ResultDoesNotDependOnThreadCount) {
    // Large enough to be split into several chunks
    constexpr unsigned int nx = 64, ny = 64, nz = 16;
    auto betaA = createMap(nx, ny, nz);
    auto betaB = createMap(nx, ny, nz);
    auto varA = createMap(nx, ny, nz);
    auto varB = createMap(nx, ny, nz);
    auto cov = createMap(nx, ny, nz);

    const size_t total = static_cast<size_t>(nx) * ny * nz;
    for (size_t i = 0; i < total; ++i) {
        double x = static_cast<double>(i % 97) / 97.0;
        betaA->GetBufferPointer()[i] = x - 0.5;
        betaB->GetBufferPointer()[i] = 0.25 * std::sin(static_cast<double>(i));
        varA->GetBufferPointer()[i] = (i % 13 == 0) ? 0.0 : 0.02 + x * 0.1;
        varB->GetBufferPointer()[i] = (i % 13 == 0) ? 0.0 : 0.03;
        cov->GetBufferPointer()[i] = (i % 13 == 0) ? 0.0 : -0.005;
    }
    Engine::Inputs inputs{betaA, betaB, varA, varB, cov};

    auto serialParams = paramsWithDf(40, true);
    serialParams.threadCount = 1;
    auto parallelParams = paramsWithDf(40, true);
    parallelParams.threadCount = 8;

    auto serial = engine_.compute(inputs, serialParams);
    auto parallel = engine_.compute(inputs, parallelParams);

    ASSERT_TRUE(serial.has_value());
    ASSERT_TRUE(parallel.has_value());
    EXPECT_EQ(serial->forcedVoxelCount, parallel->forcedVoxelCount);
    EXPECT_EQ(serial->forcedVoxelCount, (total + 12) / 13);

    for (size_t i = 0; i < total; ++i) {
        ASSERT_EQ(serial->pValueMap->GetBufferPointer()[i],
                  parallel->pValueMap->GetBufferPointer()[i]) << "voxel " << i;
        ASSERT_EQ(serial->validityMask->GetBufferPointer()[i],
                  parallel->validityMask->GetBufferPointer()[i]) << "voxel " << i;
    }
}

TEST_F(CombinedSignificanceEngineTest, ConcurrentCallsAfterLoggingReconfigure) {
    constexpr int kCallers = 8;
    const auto inputs = scalarInputs(0.5, 0.3, 0.04, 0.09, 0.01);

    logging::LogConfig quiet;
    quiet.level = logging::LogLevel::Off;

    for (int round = 0; round < 50; ++round) {
        // Drops every registered logger, so all callers race to recreate it
        logging::LoggerFactory::configure(quiet);

        std::vector<double> pValues(kCallers, -1.0);
        std::vector<std::thread> callers;
        for (int i = 0; i < kCallers; ++i) {
            callers.emplace_back([this, &inputs, &pValues, i] {
                auto result = engine_.compute(inputs, paramsWithDf(50));
                if (result) {
                    pValues[i] = firstVoxel(*result);
                }
            });
        }
        for (auto& caller : callers) {
            caller.join();
        }

        for (double p : pValues) {
            ASSERT_NEAR(p, kReferenceP, 1e-10) << "round " << round;
        }
    }

    logging::LoggerFactory::configure(logging::LogConfig{});
}

// =============================================================================
// Failure conditions
// =============================================================================

TEST_F(CombinedSignificanceEngineTest, ShapeMismatchInAnyInputIsRejected) {
    const char* names[] = {"beta_b", "var_a", "var_b", "cov_ab"};

    for (int odd = 0; odd < 4; ++odd) {
        Engine::Inputs inputs{
            createMap(4, 4, 4, 0.5),
            createMap(odd == 0 ? 5 : 4, 4, 4, 0.3),
            createMap(4, odd == 1 ? 3 : 4, 4, 0.04),
            createMap(4, 4, odd == 2 ? 2 : 4, 0.09),
            createMap(odd == 3 ? 1 : 4, 4, 4, 0.01)
        };

        auto result = engine_.compute(inputs, paramsWithDf(50));

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, SignificanceError::Code::ShapeMismatch);
        EXPECT_NE(result.error().message.find(names[odd]), std::string::npos)
            << result.error().message;
    }
}

TEST_F(CombinedSignificanceEngineTest, CheckSameShapeAcceptsMatchingMaps) {
    Engine::Inputs inputs = scalarInputs(0.5, 0.3, 0.04, 0.09, 0.01);

    EXPECT_TRUE(Engine::checkSameShape(inputs).has_value());
}

TEST_F(CombinedSignificanceEngineTest, NullInputIsRejected) {
    Engine::Inputs inputs = scalarInputs(0.5, 0.3, 0.04, 0.09, 0.01);
    inputs.covAB = nullptr;

    auto result = engine_.compute(inputs, paramsWithDf(50));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SignificanceError::Code::InvalidInput);
    EXPECT_NE(result.error().message.find("cov_ab"), std::string::npos);
}

TEST_F(CombinedSignificanceEngineTest, NonPositiveDegreesOfFreedomIsRejected) {
    for (int df : {0, -1, -40}) {
        auto result = engine_.compute(scalarInputs(0.5, 0.3, 0.04, 0.09, 0.01),
                                      paramsWithDf(df));

        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, SignificanceError::Code::InvalidDegreesOfFreedom);
    }
}

// =============================================================================
// Forced voxel audit
// =============================================================================

TEST(CountForcedWithinMaskTest, CountsOnlyForcedVoxelsInsideAnatomy) {
    auto validity = createLineMask({1, 0, 0, 1, 0});
    auto anatomy = createLineMask({1, 1, 0, 0, 3});

    auto count = Engine::countForcedWithinMask(validity, anatomy);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2u);
}

TEST(CountForcedWithinMaskTest, NoForcedVoxelsInsideAnatomy) {
    auto validity = createLineMask({1, 1, 0});
    auto anatomy = createLineMask({1, 1, 0});

    auto count = Engine::countForcedWithinMask(validity, anatomy);

    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 0u);
}

TEST(CountForcedWithinMaskTest, RejectsMismatchedMask) {
    auto validity = createLineMask({1, 0, 0});
    auto anatomy = createLineMask({1, 1});

    auto count = Engine::countForcedWithinMask(validity, anatomy);

    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code, SignificanceError::Code::ShapeMismatch);
}

TEST(CountForcedWithinMaskTest, RejectsNullMask) {
    auto validity = createLineMask({1, 0});

    auto count = Engine::countForcedWithinMask(validity, nullptr);

    ASSERT_FALSE(count.has_value());
    EXPECT_EQ(count.error().code, SignificanceError::Code::InvalidInput);
}

}  // namespace
}  // namespace cox_pmap::services
