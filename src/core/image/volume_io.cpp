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

#include "core/volume_io.hpp"
#include "core/logging.hpp"

#include <cmath>
#include <format>
#include <system_error>

#include <itkImageFileReader.h>
#include <itkImageFileWriter.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>
#include <itkNiftiImageIO.h>
#include <itkNrrdImageIO.h>

namespace cox_pmap::core {

namespace {

itk::ImageIOBase::Pointer createImageIO(VolumeIO::Format format) {
    switch (format) {
        case VolumeIO::Format::NIfTI: return itk::NiftiImageIO::New().GetPointer();
        case VolumeIO::Format::NRRD:  return itk::NrrdImageIO::New().GetPointer();
        case VolumeIO::Format::Unknown: break;
    }
    return nullptr;
}

template <typename TImage>
std::expected<typename TImage::Pointer, VolumeIoErrorInfo>
readImage(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(VolumeIoErrorInfo{
            VolumeIoError::FileNotFound,
            "File not found: " + path.string()
        });
    }

    auto imageIO = createImageIO(VolumeIO::formatFromPath(path));
    if (!imageIO) {
        return std::unexpected(VolumeIoErrorInfo{
            VolumeIoError::UnsupportedFormat,
            "Unsupported volume format: " + path.string()
        });
    }

    try {
        using ReaderType = itk::ImageFileReader<TImage>;
        auto reader = ReaderType::New();
        reader->SetFileName(path.string());
        reader->SetImageIO(imageIO);
        reader->Update();

        typename TImage::Pointer image = reader->GetOutput();
        image->DisconnectPipeline();
        return image;
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(VolumeIoErrorInfo{
            VolumeIoError::ReadFailed,
            std::format("Failed to read {}: {}", path.string(), e.GetDescription())
        });
    }
}

template <typename TImage>
std::expected<void, VolumeIoErrorInfo>
writeImage(const TImage* image,
           const std::filesystem::path& path,
           const itk::ImageBase<3>* reference) {
    if (!image) {
        return std::unexpected(VolumeIoErrorInfo{
            VolumeIoError::WriteFailed,
            "Image to write is null"
        });
    }

    auto imageIO = createImageIO(VolumeIO::formatFromPath(path));
    if (!imageIO) {
        return std::unexpected(VolumeIoErrorInfo{
            VolumeIoError::UnsupportedFormat,
            "Unsupported volume format: " + path.string()
        });
    }

    typename TImage::Pointer output = TImage::New();
    output->Graft(image);

    if (reference) {
        const auto refSize = reference->GetLargestPossibleRegion().GetSize();
        const auto size = image->GetLargestPossibleRegion().GetSize();
        if (refSize != size) {
            return std::unexpected(VolumeIoErrorInfo{
                VolumeIoError::WriteFailed,
                std::format("Reference geometry {}x{}x{} does not match image {}x{}x{}",
                            refSize[0], refSize[1], refSize[2], size[0], size[1], size[2])
            });
        }
        output->SetOrigin(reference->GetOrigin());
        output->SetSpacing(reference->GetSpacing());
        output->SetDirection(reference->GetDirection());
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(VolumeIoErrorInfo{
                VolumeIoError::WriteFailed,
                std::format("Cannot create directory {}: {}",
                            path.parent_path().string(), ec.message())
            });
        }
    }

    try {
        using WriterType = itk::ImageFileWriter<TImage>;
        auto writer = WriterType::New();
        writer->SetInput(output);
        writer->SetFileName(path.string());
        writer->SetImageIO(imageIO);
        writer->Update();
        return {};
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(VolumeIoErrorInfo{
            VolumeIoError::WriteFailed,
            std::format("Failed to write {}: {}", path.string(), e.GetDescription())
        });
    }
}

}  // anonymous namespace

std::string VolumeIoErrorInfo::toString() const {
    switch (code) {
        case VolumeIoError::FileNotFound: return "File not found: " + message;
        case VolumeIoError::UnsupportedFormat: return "Unsupported format: " + message;
        case VolumeIoError::ReadFailed: return "Read failed: " + message;
        case VolumeIoError::WriteFailed: return "Write failed: " + message;
    }
    return "Unknown error: " + message;
}

VolumeIO::Format VolumeIO::formatFromPath(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    auto stem = path.stem().extension().string();

    if (ext == ".nii" || (ext == ".gz" && stem == ".nii")) {
        return Format::NIfTI;
    }
    if (ext == ".nrrd" || ext == ".nhdr") {
        return Format::NRRD;
    }
    return Format::Unknown;
}

std::expected<ScalarVolumeType::Pointer, VolumeIoErrorInfo>
VolumeIO::load(const std::filesystem::path& path) {
    auto logger = logging::LoggerFactory::create("VolumeIO");

    auto result = readImage<ScalarVolumeType>(path);
    if (!result) {
        logger->error("{}", result.error().toString());
        return result;
    }

    const auto size = (*result)->GetLargestPossibleRegion().GetSize();
    logger->debug("Loaded {} ({}x{}x{})", path.string(), size[0], size[1], size[2]);
    return result;
}

std::expected<MaskVolumeType::Pointer, VolumeIoErrorInfo>
VolumeIO::loadMask(const std::filesystem::path& path) {
    auto volume = load(path);
    if (!volume) {
        return std::unexpected(volume.error());
    }

    auto mask = MaskVolumeType::New();
    mask->CopyInformation(*volume);
    mask->SetRegions((*volume)->GetLargestPossibleRegion());
    mask->Allocate();

    itk::ImageRegionConstIterator<ScalarVolumeType> in(*volume, (*volume)->GetLargestPossibleRegion());
    itk::ImageRegionIterator<MaskVolumeType> out(mask, mask->GetLargestPossibleRegion());
    for (in.GoToBegin(), out.GoToBegin(); !in.IsAtEnd(); ++in, ++out) {
        out.Set(in.Get() != 0.0 ? 1 : 0);
    }

    return mask;
}

std::expected<void, VolumeIoErrorInfo>
VolumeIO::save(const ScalarVolumeType* image,
               const std::filesystem::path& path,
               const itk::ImageBase<3>* reference) {
    auto result = writeImage(image, path, reference);
    if (result) {
        logging::LoggerFactory::create("VolumeIO")->info("Wrote {}", path.string());
    }
    return result;
}

std::expected<void, VolumeIoErrorInfo>
VolumeIO::saveMask(const MaskVolumeType* mask,
                   const std::filesystem::path& path,
                   const itk::ImageBase<3>* reference) {
    auto result = writeImage(mask, path, reference);
    if (result) {
        logging::LoggerFactory::create("VolumeIO")->info("Wrote {}", path.string());
    }
    return result;
}

bool VolumeIO::sameGeometry(const itk::ImageBase<3>* a,
                            const itk::ImageBase<3>* b,
                            double tolerance) {
    if (!a || !b) {
        return false;
    }
    if (a->GetLargestPossibleRegion().GetSize() != b->GetLargestPossibleRegion().GetSize()) {
        return false;
    }

    for (unsigned int i = 0; i < 3; ++i) {
        if (std::abs(a->GetOrigin()[i] - b->GetOrigin()[i]) > tolerance) return false;
        if (std::abs(a->GetSpacing()[i] - b->GetSpacing()[i]) > tolerance) return false;
        for (unsigned int j = 0; j < 3; ++j) {
            if (std::abs(a->GetDirection()[i][j] - b->GetDirection()[i][j]) > tolerance) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace cox_pmap::core
