#ifndef OMR_DETECTOR_CONFIG_HPP
#define OMR_DETECTOR_CONFIG_HPP

#include <string>

namespace omr {

// Closed interval [min, max].
struct Range {
    double min;
    double max;

    bool contains(double v) const { return v >= min && v <= max; }
};

struct DetectorConfig {
    double fillThreshold = 40.0;               // percentage, 0..100
    Range bubbleAreaRange{200.0, 8000.0};      // bounding-box area in pixels
    Range aspectRatioRange{0.7, 1.3};          // width / height
    double rowThreshold = 15.0;                // max |y - row mean| in pixels
    bool debug = false;                        // keep per-bubble fill ratios

    // Preprocessing
    int blurKernel = 5;
    bool adaptiveThreshold = false;
    int adaptiveBlockSize = 31;
    double adaptiveC = 5.0;
    int noiseBlobArea = 20;

    // Throws ConfigError naming the first invalid field.
    void validate() const;

    std::string describe() const;
};

}

#endif
