#include "core/Segmenter.hpp"
#include "core/Errors.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <cstdio>
#include <system_error>

namespace podcapture {
namespace core {

namespace {

void removeQuietly(const std::vector<std::filesystem::path>& files) {
    for (const auto& file : files) {
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec) {
            Logger::warn("Could not remove partial segment " + file.string() + ": " + ec.message());
        }
    }
}

} // namespace

Segmenter::Segmenter(RangeExtractor& extractor) : extractor_(extractor) {
}

std::filesystem::path Segmenter::partPath(const std::filesystem::path& file, int index) {
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "_part%03d", index);

    std::filesystem::path part = file.parent_path();
    part /= file.stem().string() + suffix + file.extension().string();
    return part;
}

std::vector<AudioPart> Segmenter::segment(const std::filesystem::path& file, std::uintmax_t maxSizeBytes,
                                          const DurationProbe& probe) const {
    std::error_code ec;
    const std::uintmax_t sizeBytes = std::filesystem::file_size(file, ec);
    if (ec) {
        throw SegmentError(SegmentError::Kind::SourceMissing,
                           "Capture file is missing: " + file.string() + " (" + ec.message() + ")");
    }

    if (maxSizeBytes == 0 || sizeBytes <= maxSizeBytes) {
        return {AudioPart{1, file.string(), sizeBytes}};
    }

    const std::uintmax_t partsCount = (sizeBytes + maxSizeBytes - 1) / maxSizeBytes;
    Logger::info("Splitting " + file.string() + " (" + std::to_string(sizeBytes) + " bytes) into " +
                 std::to_string(partsCount) + " parts");

    auto duration = probe.probe(file);
    if (!duration || !(*duration > 0.0)) {
        throw SegmentError(SegmentError::Kind::ProbeFailed, "Could not determine duration of " + file.string());
    }

    const long segmentSeconds = static_cast<long>(std::ceil(*duration / static_cast<double>(partsCount)));

    // `attempted` holds every part file left on disk, failed extractions included.
    std::vector<std::filesystem::path> written;
    std::vector<std::filesystem::path> attempted;
    for (std::uintmax_t i = 0; i < partsCount; ++i) {
        const int index = static_cast<int>(i) + 1;
        auto dest = partPath(file, index);

        bool ok = extractor_.extract(file, dest, static_cast<long>(i) * segmentSeconds, segmentSeconds);
        bool exists = std::filesystem::exists(dest, ec);
        if (exists) {
            attempted.push_back(dest);
        }
        if (ok && exists) {
            written.push_back(dest);
        } else {
            Logger::warn("Extraction of part " + std::to_string(index) + " from " + file.string() + " failed");
        }
    }

    if (written.size() != partsCount) {
        removeQuietly(attempted);
        throw SegmentError(SegmentError::Kind::SegmentIncomplete,
                           "Only " + std::to_string(written.size()) + " of " + std::to_string(partsCount) +
                           " parts were produced for " + file.string());
    }

    std::vector<AudioPart> parts;
    parts.reserve(written.size());
    for (size_t i = 0; i < written.size(); ++i) {
        std::uintmax_t partSize = std::filesystem::file_size(written[i], ec);
        parts.push_back(AudioPart{static_cast<int>(i) + 1, written[i].string(), ec ? 0 : partSize});
    }

    std::filesystem::remove(file, ec);
    if (ec) {
        Logger::warn("Could not remove original capture " + file.string() + ": " + ec.message());
    }
    return parts;
}

} // namespace core
} // namespace podcapture
