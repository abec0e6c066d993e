#include "vision/frame_producer.hpp"

#include <utility>

#include "common/logging.hpp"

namespace matchwatch {

FrameProducer::FrameProducer(VisionConfig config,
                             ScreenCapture &capture,
                             FrameSlot &slot,
                             const CancellationToken &token)
    : m_config(std::move(config))
    , m_capture(capture)
    , m_slot(slot)
    , m_token(token)
    , m_composer(m_config.killFeed, m_config.roundEnd, m_config.scaleFactor)
{
}

FrameProducer::~FrameProducer()
{
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void FrameProducer::start()
{
    if (m_thread.joinable()) {
        return;
    }
    m_running = true;
    m_thread = std::thread([this]() { run(); });
}

void FrameProducer::wait()
{
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool FrameProducer::isRunning() const
{
    return m_running.load();
}

cv::Mat FrameProducer::captureOnce()
{
    const cv::Mat killFeed = m_capture.captureRegion(m_config.killFeed);
    const cv::Mat roundEnd = m_capture.captureRegion(m_config.roundEnd);
    return m_composer.compose(killFeed, roundEnd);
}

bool FrameProducer::runCycle()
{
    try {
        m_slot.put(captureOnce());
        ++m_produced;
        return true;
    } catch (const std::exception &ex) {
        ++m_errors;
        MWLOG_WARN(QStringLiteral("FrameProducer"),
                   QStringLiteral("runCycle"),
                   QStringLiteral("capture_failed"),
                   QStringLiteral("exception"),
                   QStringLiteral("backoff"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"what", ex.what()},
                                   {"errors", m_errors.load()}}));
        return false;
    }
}

void FrameProducer::run()
{
    const FrameGeometry &geometry = m_composer.geometry();
    MWLOG_INFO(QStringLiteral("FrameProducer"),
               QStringLiteral("run"),
               QStringLiteral("producer_started"),
               QStringLiteral("daemon_start"),
               QStringLiteral("latest_frame_slot"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"finalWidth", geometry.finalWidth},
                               {"finalHeight", geometry.finalHeight},
                               {"captureDelayMs", m_config.captureDelay.count()}}));

    while (!m_token.stopRequested()) {
        const bool ok = runCycle();
        if (m_token.waitFor(ok ? m_config.captureDelay : m_config.errorBackoff)) {
            break;
        }
    }

    m_running = false;
    MWLOG_INFO(QStringLiteral("FrameProducer"),
               QStringLiteral("run"),
               QStringLiteral("producer_stopped"),
               QStringLiteral("stop_requested"),
               QStringLiteral("cancellation_token"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"produced", m_produced.load()},
                               {"discarded", m_slot.discardedCount()},
                               {"errors", m_errors.load()}}));
}

} // namespace matchwatch
