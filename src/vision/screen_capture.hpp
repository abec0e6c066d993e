#pragma once

#include <chrono>

#include <QImage>

#include <opencv2/core.hpp>

#include "common/config.hpp"

namespace matchwatch {

class ScreenCapture
{
public:
    virtual ~ScreenCapture() = default;

    // BGR image of the region in screen coordinates. Throws CaptureError.
    virtual cv::Mat captureRegion(const CaptureRegion &region) = 0;
};

// Deep copy of a QImage as an 8-bit BGR matrix. Empty for a null image.
cv::Mat toBgrMat(const QImage &image);

/**
 * QtScreenCapture grabs from the primary screen. QScreen may only be used on
 * the GUI thread, so calls from worker threads are marshalled there and
 * bounded by a timeout.
 */
class QtScreenCapture : public ScreenCapture
{
public:
    explicit QtScreenCapture(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000));

    cv::Mat captureRegion(const CaptureRegion &region) override;

private:
    std::chrono::milliseconds m_timeout;
};

} // namespace matchwatch
