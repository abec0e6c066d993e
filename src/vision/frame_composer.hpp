#pragma once

#include <opencv2/core.hpp>

#include "common/config.hpp"

namespace matchwatch {

struct FrameGeometry {
    int targetWidth = 0;
    int killFeedHeight = 0;
    int finalWidth = 0;
    int finalHeight = 0;
};

/**
 * FrameComposer stacks the round-end region above the kill-feed region and
 * downscales the result. All sizes are fixed at construction so the capture
 * loop does no geometry work.
 */
class FrameComposer
{
public:
    // Throws ConfigError when the regions or the scale collapse to an empty frame.
    FrameComposer(const CaptureRegion &killFeed, const CaptureRegion &roundEnd, double scaleFactor);

    const FrameGeometry &geometry() const { return m_geometry; }

    // Throws CaptureError on empty input.
    cv::Mat compose(const cv::Mat &killFeed, const cv::Mat &roundEnd) const;

private:
    CaptureRegion m_roundEnd;
    FrameGeometry m_geometry;
};

} // namespace matchwatch
