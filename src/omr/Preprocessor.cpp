#include "omr/Preprocessor.hpp"
#include "omr/Errors.hpp"

#include <opencv2/imgproc.hpp>

namespace omr {

Preprocessor::Preprocessor(const DetectorConfig& config)
    : blurKernel_(config.blurKernel),
      adaptive_(config.adaptiveThreshold),
      blockSize_(config.adaptiveBlockSize),
      adaptiveC_(config.adaptiveC),
      noiseBlobArea_(config.noiseBlobArea)
{
}

cv::Mat Preprocessor::toGray(const cv::Mat& image) {
    if (image.empty() || image.rows <= 0 || image.cols <= 0) {
        throw ImageLoadError("image is empty");
    }
    if (image.depth() != CV_8U) {
        throw ImageLoadError("unsupported image depth, expected 8-bit");
    }

    cv::Mat gray;
    switch (image.channels()) {
    case 1:
        gray = image;
        break;
    case 3:
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        break;
    case 4:
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        break;
    default:
        throw ImageLoadError("unsupported channel count " + std::to_string(image.channels()));
    }
    return gray;
}

BinaryMask Preprocessor::preprocess(const cv::Mat& image) const {
    cv::Mat gray = toGray(image);

    cv::Mat blurImg;
    if (blurKernel_ > 1)
        cv::GaussianBlur(gray, blurImg, cv::Size(blurKernel_, blurKernel_), 0);
    else
        blurImg = gray.clone();

    cv::Mat thr;
    if (adaptive_) {
        cv::adaptiveThreshold(blurImg, thr, 255,
                              cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                              cv::THRESH_BINARY_INV,
                              blockSize_, adaptiveC_);
    } else {
        cv::threshold(blurImg, thr, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
    }

    removeSpeckle(thr);
    return thr;
}

void Preprocessor::removeSpeckle(cv::Mat& mask) const {
    if (noiseBlobArea_ <= 0) return;

    cv::Mat labels, stats, centroids;
    int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);

    std::vector<uchar> keep(n, 1);
    keep[0] = 0;
    bool anyDropped = false;
    for (int i = 1; i < n; ++i) {
        if (stats.at<int>(i, cv::CC_STAT_AREA) < noiseBlobArea_) {
            keep[i] = 0;
            anyDropped = true;
        }
    }
    if (!anyDropped) return;

    for (int y = 0; y < mask.rows; ++y) {
        const int* lab = labels.ptr<int>(y);
        uchar* m = mask.ptr<uchar>(y);
        for (int x = 0; x < mask.cols; ++x) {
            if (!keep[lab[x]]) m[x] = 0;
        }
    }
}

}
