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
 * @file volume_io.hpp
 * @brief Reading and writing of scalar volumes
 * @details Loads coefficient, variance and covariance maps as double
 *          precision ITK images and writes result maps back to disk,
 *          optionally re-using the spatial metadata of a reference volume.
 *          NIfTI (.nii, .nii.gz) and NRRD (.nrrd, .nhdr) are selected by
 *          file extension.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace cox_pmap::core {

/// Error types for volume I/O
enum class VolumeIoError {
    FileNotFound,
    UnsupportedFormat,
    ReadFailed,
    WriteFailed
};

/// Error result with message
struct VolumeIoErrorInfo {
    VolumeIoError code;
    std::string message;

    [[nodiscard]] std::string toString() const;
};

/// Volume types
using ScalarVolumeType = itk::Image<double, 3>;
using MaskVolumeType = itk::Image<uint8_t, 3>;

/**
 * @brief Loads and saves 3D scalar volumes
 *
 * Voxel values are converted to double on load regardless of the on-disk
 * pixel type. Geometry (origin, spacing, direction) is preserved.
 */
class VolumeIO {
public:
    /// File formats recognised by extension
    enum class Format {
        NIfTI,
        NRRD,
        Unknown
    };

    [[nodiscard]] static Format formatFromPath(const std::filesystem::path& path);

    /**
     * @brief Load a scalar volume
     * @param path NIfTI or NRRD file
     * @return Double precision image on success
     */
    [[nodiscard]] static std::expected<ScalarVolumeType::Pointer, VolumeIoErrorInfo>
    load(const std::filesystem::path& path);

    /**
     * @brief Load a binary/label mask (any non-zero voxel is inside)
     */
    [[nodiscard]] static std::expected<MaskVolumeType::Pointer, VolumeIoErrorInfo>
    loadMask(const std::filesystem::path& path);

    /**
     * @brief Save a scalar volume
     *
     * When @p reference is given, its origin, spacing and direction are
     * written instead of the image's own. Missing parent directories are
     * created.
     *
     * @param image Volume to write
     * @param path Destination file
     * @param reference Optional geometry source (same size as @p image)
     */
    [[nodiscard]] static std::expected<void, VolumeIoErrorInfo>
    save(const ScalarVolumeType* image,
         const std::filesystem::path& path,
         const itk::ImageBase<3>* reference = nullptr);

    /**
     * @brief Save a mask volume, see save()
     */
    [[nodiscard]] static std::expected<void, VolumeIoErrorInfo>
    saveMask(const MaskVolumeType* mask,
             const std::filesystem::path& path,
             const itk::ImageBase<3>* reference = nullptr);

    /**
     * @brief Compare origin, spacing and direction of two volumes
     * @param tolerance Absolute tolerance per component
     */
    [[nodiscard]] static bool sameGeometry(const itk::ImageBase<3>* a,
                                           const itk::ImageBase<3>* b,
                                           double tolerance = 1e-4);
};

}  // namespace cox_pmap::core
