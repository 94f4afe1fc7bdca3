#include "omr/DetectorConfig.hpp"
#include "omr/Errors.hpp"

#include <cmath>
#include <sstream>

namespace omr {

namespace {

void require(bool condition, const std::string& field, const std::string& rule) {
    if (!condition) {
        throw ConfigError("invalid " + field + ": " + rule);
    }
}

bool finite(double v) { return std::isfinite(v); }

}

void DetectorConfig::validate() const {
    require(finite(fillThreshold) && fillThreshold >= 0.0 && fillThreshold <= 100.0,
            "fill_threshold", "must be within [0, 100]");

    require(finite(bubbleAreaRange.min) && finite(bubbleAreaRange.max),
            "bubble_area_range", "bounds must be finite");
    require(bubbleAreaRange.min >= 0.0, "bubble_area_range", "min must be >= 0");
    require(bubbleAreaRange.min <= bubbleAreaRange.max, "bubble_area_range", "min must be <= max");

    require(finite(aspectRatioRange.min) && finite(aspectRatioRange.max),
            "aspect_ratio_range", "bounds must be finite");
    require(aspectRatioRange.min > 0.0, "aspect_ratio_range", "min must be > 0");
    require(aspectRatioRange.min <= aspectRatioRange.max, "aspect_ratio_range", "min must be <= max");

    require(finite(rowThreshold) && rowThreshold >= 0.0, "row_threshold", "must be >= 0");

    require(blurKernel >= 1 && blurKernel % 2 == 1, "blur_kernel", "must be odd and >= 1");
    require(adaptiveBlockSize >= 3 && adaptiveBlockSize % 2 == 1,
            "adaptive_block_size", "must be odd and >= 3");
    require(finite(adaptiveC), "adaptive_c", "must be finite");
    require(noiseBlobArea >= 0, "noise_blob_area", "must be >= 0");
}

std::string DetectorConfig::describe() const {
    std::ostringstream oss;
    oss << "fill_threshold=" << fillThreshold
        << " bubble_area_range=(" << bubbleAreaRange.min << "," << bubbleAreaRange.max << ")"
        << " aspect_ratio_range=(" << aspectRatioRange.min << "," << aspectRatioRange.max << ")"
        << " row_threshold=" << rowThreshold
        << " debug=" << (debug ? "true" : "false")
        << " threshold=" << (adaptiveThreshold ? "adaptive" : "otsu");
    return oss.str();
}

}
