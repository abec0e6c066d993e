#pragma once

#include <atomic>
#include <cstddef>
#include <thread>

#include <opencv2/core.hpp>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "vision/frame_composer.hpp"
#include "vision/latest_frame_slot.hpp"
#include "vision/screen_capture.hpp"

namespace matchwatch {

using FrameSlot = LatestFrameSlot<cv::Mat>;

/**
 * FrameProducer captures both regions on its own thread as fast as the
 * capture delay allows and keeps only the newest composite in the slot.
 * It never waits for the consumer.
 */
class FrameProducer
{
public:
    FrameProducer(VisionConfig config,
                  ScreenCapture &capture,
                  FrameSlot &slot,
                  const CancellationToken &token);
    ~FrameProducer();

    FrameProducer(const FrameProducer &) = delete;
    FrameProducer &operator=(const FrameProducer &) = delete;

    void start();
    void wait();
    bool isRunning() const;

    // Capture and compose one frame. Throws CaptureError.
    cv::Mat captureOnce();

    // captureOnce() plus the slot write. Errors are logged and reported as false.
    bool runCycle();

    const FrameGeometry &geometry() const { return m_composer.geometry(); }
    std::size_t framesProduced() const { return m_produced.load(); }
    std::size_t captureErrors() const { return m_errors.load(); }

private:
    void run();

    VisionConfig m_config;
    ScreenCapture &m_capture;
    FrameSlot &m_slot;
    const CancellationToken &m_token;
    FrameComposer m_composer;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_produced{0};
    std::atomic<std::size_t> m_errors{0};
};

} // namespace matchwatch
