#include "vision/frame_classifier.hpp"

#include <utility>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace matchwatch {

namespace {

QByteArray encodeJpeg(const cv::Mat &frame, int quality)
{
    std::vector<uchar> buffer;
    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, quality};
    if (!cv::imencode(".jpg", frame, buffer, params)) {
        throw ClassifierError("JPEG encoding failed");
    }
    return QByteArray(reinterpret_cast<const char *>(buffer.data()),
                      static_cast<int>(buffer.size()));
}

} // namespace

FrameClassifier::FrameClassifier(ClassifierConfig config,
                                 ImageClassifier &classifier,
                                 FrameSlot &slot,
                                 const CancellationToken &token,
                                 EventSink *sink,
                                 Clock clock)
    : m_config(std::move(config))
    , m_classifier(classifier)
    , m_slot(slot)
    , m_token(token)
    , m_sink(sink)
    , m_clock(clock ? std::move(clock) : Clock([]() { return std::chrono::steady_clock::now(); }))
    , m_debouncer(m_config.cooldown)
{
}

FrameClassifier::~FrameClassifier()
{
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void FrameClassifier::start()
{
    if (m_thread.joinable()) {
        return;
    }
    m_running = true;
    m_thread = std::thread([this]() { run(); });
}

void FrameClassifier::wait()
{
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool FrameClassifier::isRunning() const
{
    return m_running.load();
}

Classification FrameClassifier::classifyFrame(const cv::Mat &frame)
{
    Classification result;
    try {
        if (frame.empty()) {
            throw ClassifierError("empty frame");
        }
        result.raw = m_classifier.classify(encodeJpeg(frame, m_config.jpegQuality));
        result.label = parseLabel(result.raw);
    } catch (const std::exception &ex) {
        result.label = VisualLabel::Error;
        result.raw = std::string("ERROR: ") + ex.what();
    }
    return result;
}

Classification FrameClassifier::classifyLatestFrame()
{
    const std::optional<cv::Mat> frame = m_slot.take();
    if (!frame.has_value()) {
        return Classification{VisualLabel::NoEvent, std::string()};
    }
    return classifyFrame(*frame);
}

std::optional<VisualEvent> FrameClassifier::runTick()
{
    const std::optional<cv::Mat> frame = m_slot.takeFor(m_config.frameWait);
    if (!frame.has_value() || m_token.stopRequested()) {
        return std::nullopt;
    }
    return surface(classifyFrame(*frame));
}

std::optional<VisualEvent> FrameClassifier::surface(const Classification &result)
{
    if (!m_debouncer.shouldSurface(result.label, m_clock())) {
        ++m_suppressed;
        MWLOG_DEBUG(QStringLiteral("FrameClassifier"),
                    QStringLiteral("surface"),
                    QStringLiteral("visual_event_suppressed"),
                    QStringLiteral("cooldown"),
                    QStringLiteral("debounce"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"label", toVisualLabelString(result.label)}}));
        return std::nullopt;
    }

    VisualEvent event;
    event.label = result.label;
    event.timestamp = std::chrono::system_clock::now();
    event.detail = result.raw;
    ++m_surfaced;

    if (m_sink) {
        m_sink->publishVisualEvent(event);
    }
    return event;
}

void FrameClassifier::run()
{
    const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / m_config.inferenceHz));

    MWLOG_INFO(QStringLiteral("FrameClassifier"),
               QStringLiteral("run"),
               QStringLiteral("classifier_started"),
               QStringLiteral("daemon_start"),
               QStringLiteral("fixed_cadence"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"model", m_config.model},
                               {"inferenceHz", m_config.inferenceHz},
                               {"cooldownMs", m_config.cooldown.count()}}));

    while (!m_token.stopRequested()) {
        const auto tickStart = std::chrono::steady_clock::now();
        runTick();

        const auto elapsed = std::chrono::steady_clock::now() - tickStart;
        if (elapsed < period && m_token.waitFor(period - elapsed)) {
            break;
        }
    }

    m_running = false;
    MWLOG_INFO(QStringLiteral("FrameClassifier"),
               QStringLiteral("run"),
               QStringLiteral("classifier_stopped"),
               QStringLiteral("stop_requested"),
               QStringLiteral("cancellation_token"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"surfaced", m_surfaced.load()},
                               {"suppressed", m_suppressed.load()}}));
}

} // namespace matchwatch
