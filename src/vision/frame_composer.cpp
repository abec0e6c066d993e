#include "vision/frame_composer.hpp"

#include <string>

#include <opencv2/imgproc.hpp>

#include "common/errors.hpp"

namespace matchwatch {

namespace {

cv::Mat asBgr(const cv::Mat &image)
{
    if (image.channels() == 3) {
        return image;
    }
    cv::Mat bgr;
    if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    } else {
        throw CaptureError("unsupported channel count " + std::to_string(image.channels()));
    }
    return bgr;
}

} // namespace

FrameComposer::FrameComposer(const CaptureRegion &killFeed,
                             const CaptureRegion &roundEnd,
                             double scaleFactor)
    : m_roundEnd(roundEnd)
{
    if (killFeed.width <= 0 || killFeed.height <= 0
        || roundEnd.width <= 0 || roundEnd.height <= 0) {
        throw ConfigError("capture regions need a positive size");
    }

    m_geometry.targetWidth = roundEnd.width;
    const double killFeedScale = static_cast<double>(m_geometry.targetWidth) / killFeed.width;
    m_geometry.killFeedHeight = static_cast<int>(killFeed.height * killFeedScale);
    m_geometry.finalWidth = static_cast<int>(m_geometry.targetWidth * scaleFactor);
    m_geometry.finalHeight =
        static_cast<int>((roundEnd.height + m_geometry.killFeedHeight) * scaleFactor);

    if (m_geometry.killFeedHeight <= 0 || m_geometry.finalWidth <= 0
        || m_geometry.finalHeight <= 0) {
        throw ConfigError("scale factor reduces the composite frame to nothing");
    }
}

cv::Mat FrameComposer::compose(const cv::Mat &killFeed, const cv::Mat &roundEnd) const
{
    if (killFeed.empty() || roundEnd.empty()) {
        throw CaptureError("cannot compose an empty region");
    }

    cv::Mat top = asBgr(roundEnd);
    // Grabs on scaled displays can come back larger than requested.
    if (top.cols != m_geometry.targetWidth || top.rows != m_roundEnd.height) {
        cv::Mat resized;
        cv::resize(top, resized, cv::Size(m_geometry.targetWidth, m_roundEnd.height), 0, 0,
                   cv::INTER_NEAREST);
        top = resized;
    }

    cv::Mat bottom;
    cv::resize(asBgr(killFeed), bottom,
               cv::Size(m_geometry.targetWidth, m_geometry.killFeedHeight), 0, 0,
               cv::INTER_NEAREST);

    cv::Mat stacked;
    cv::vconcat(top, bottom, stacked);

    cv::Mat result;
    cv::resize(stacked, result, cv::Size(m_geometry.finalWidth, m_geometry.finalHeight), 0, 0,
               cv::INTER_AREA);
    return result;
}

} // namespace matchwatch
