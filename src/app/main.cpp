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

#include "core/logging.hpp"
#include "core/run_config.hpp"
#include "services/combined_pvalue_runner.hpp"

#include <filesystem>
#include <iostream>

int main(int argc, char* argv[])
{
    using namespace cox_pmap;

    const std::string programName = std::filesystem::path(argv[0]).filename().string();

    auto config = core::RunConfig::fromCommandLine(argc, argv);
    if (!config) {
        if (config.error().code == core::ConfigError::Code::HelpRequested) {
            std::cout << core::RunConfig::usage(programName);
            return 0;
        }
        std::cerr << programName << ": " << config.error().toString() << "\n\n"
                  << core::RunConfig::usage(programName);
        return 1;
    }

    if (auto valid = config->validate(); !valid) {
        std::cerr << programName << ": " << valid.error().toString() << "\n";
        return 1;
    }

    logging::LogConfig logConfig;
    logConfig.level = config->logLevel;
    logConfig.logDirectory = config->logDirectory;
    logging::LoggerFactory::configure(logConfig);

    auto logger = logging::LoggerFactory::create("cox_pmap");

    services::CombinedPValueRunner runner;
    auto summary = runner.run(*config);
    if (!summary) {
        logger->critical("{}", summary.error().toString());
        if (summary.error().code != services::RunError::Code::OutputWriteFailed) {
            logger->critical("No output was written");
        }
        logging::LoggerFactory::shutdown();
        return summary.error().exitCode();
    }

    logger->info("Done: {} voxels, {} forced to p = 0, {} with p < {}",
                 summary->voxelCount, summary->forcedVoxelCount,
                 summary->significantVoxelCount, services::RunSummary::kAlpha);

    logging::LoggerFactory::shutdown();
    return 0;
}
