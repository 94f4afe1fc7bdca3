#ifndef OMR_PREPROCESSOR_HPP
#define OMR_PREPROCESSOR_HPP

#include "omr/DetectorConfig.hpp"
#include "omr/Types.hpp"

#include <opencv2/core.hpp>

namespace omr {

// Turns a decoded sheet image into a BinaryMask of ink pixels.
class Preprocessor {
public:
    explicit Preprocessor(const DetectorConfig& config);

    // Throws ImageLoadError for empty or unsupported images.
    BinaryMask preprocess(const cv::Mat& image) const;

    static cv::Mat toGray(const cv::Mat& image);

private:
    int blurKernel_;
    bool adaptive_;
    int blockSize_;
    double adaptiveC_;
    int noiseBlobArea_;

    void removeSpeckle(cv::Mat& mask) const;
};

}

#endif
