#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <opencv2/core.hpp>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "common/event_sink.hpp"
#include "vision/event_debouncer.hpp"
#include "vision/frame_producer.hpp"
#include "vision/image_classifier.hpp"

namespace matchwatch {

struct Classification {
    VisualLabel label = VisualLabel::NoEvent;
    // Model output, or the failure message for VisualLabel::Error.
    std::string raw;
};

/**
 * FrameClassifier consumes the newest frame at a fixed cadence, classifies it
 * and publishes the debounced result. A slow model call only delays this
 * thread; capture keeps running.
 */
class FrameClassifier
{
public:
    using Clock = std::function<EventDebouncer::TimePoint()>;

    FrameClassifier(ClassifierConfig config,
                    ImageClassifier &classifier,
                    FrameSlot &slot,
                    const CancellationToken &token,
                    EventSink *sink = nullptr,
                    Clock clock = Clock());
    ~FrameClassifier();

    FrameClassifier(const FrameClassifier &) = delete;
    FrameClassifier &operator=(const FrameClassifier &) = delete;

    void start();
    void wait();
    bool isRunning() const;

    // Encode and classify one frame. Never throws; failures come back as Error.
    Classification classifyFrame(const cv::Mat &frame);

    // One cadence step: wait briefly for a frame, classify, debounce, publish.
    // Returns the surfaced event, or std::nullopt when there was no frame or
    // the label is still cooling down.
    std::optional<VisualEvent> runTick();

    // Ad-hoc read for external consumers. Does not wait and does not touch
    // the debounce state; an empty slot reads as NoEvent.
    Classification classifyLatestFrame();

    std::size_t surfacedCount() const { return m_surfaced.load(); }
    std::size_t suppressedCount() const { return m_suppressed.load(); }

private:
    void run();
    std::optional<VisualEvent> surface(const Classification &result);

    ClassifierConfig m_config;
    ImageClassifier &m_classifier;
    FrameSlot &m_slot;
    const CancellationToken &m_token;
    EventSink *m_sink = nullptr;
    Clock m_clock;
    EventDebouncer m_debouncer;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_surfaced{0};
    std::atomic<std::size_t> m_suppressed{0};
};

} // namespace matchwatch
