#pragma once

#include "core/Episode.hpp"
#include "core/MediaTools.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace podcapture {
namespace core {

// Splits captures larger than a size threshold into time-contiguous parts.
//
// A file at or below the threshold comes back as a single part pointing at
// the original. Larger files are cut into ceil(size / maxSizeBytes) ranges of
// ceil(duration / partsCount) seconds each and written next to the source as
// "<stem>_partNNN<ext>". The source is removed only once every part exists.
// On any failure SegmentError is thrown, the source is left in place and
// part files from the failed attempt are deleted.
//
// AudioPart::path holds the path as passed in; callers relativize it.
class Segmenter {
public:
    explicit Segmenter(RangeExtractor& extractor);

    std::vector<AudioPart> segment(const std::filesystem::path& file, std::uintmax_t maxSizeBytes,
                                   const DurationProbe& probe) const;

    static std::filesystem::path partPath(const std::filesystem::path& file, int index);

private:
    RangeExtractor& extractor_;
};

} // namespace core
} // namespace podcapture
