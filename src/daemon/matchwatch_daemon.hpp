#pragma once

#include <memory>

#include <QObject>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "daemon/history_store.hpp"
#include "daemon/state_fetcher.hpp"
#include "daemon/state_poller.hpp"
#include "daemon/tactical_event_detector.hpp"
#include "daemon/visual_event_journal.hpp"
#include "vision/frame_classifier.hpp"
#include "vision/frame_producer.hpp"
#include "vision/image_classifier.hpp"
#include "vision/screen_capture.hpp"

namespace matchwatch {

class MatchwatchApiServer;

// Replaceable adapters at the three external boundaries. Anything left null is
// filled with the production implementation.
struct DaemonCollaborators {
    std::unique_ptr<StateFetcher> fetcher;
    std::unique_ptr<ScreenCapture> capture;
    std::unique_ptr<ImageClassifier> classifier;
};

/**
 * MatchwatchDaemon wires both sensor channels:
 * - StatePoller on its own thread (fetch, diff, detect, persist)
 * - FrameProducer and FrameClassifier on two more threads
 * - MatchwatchApiServer on the Qt event loop for out-of-process consumers
 *
 * All loops share one cancellation token. It is designed to be owned from
 * main() and driven by Qt's event loop.
 */
class MatchwatchDaemon : public QObject
{
    Q_OBJECT
public:
    // Throws ConfigError before anything starts.
    explicit MatchwatchDaemon(WatchConfig config,
                              DaemonCollaborators collaborators = DaemonCollaborators(),
                              QObject *parent = nullptr);
    ~MatchwatchDaemon() override;

    void start();
    // Signals every loop and joins them. Safe to call more than once.
    void stop();

    const WatchConfig &config() const { return m_config; }
    TacticalEventDetector &detector() { return *m_detector; }
    HistoryStore &history() { return *m_history; }
    VisualEventJournal &journal() { return *m_journal; }
    FrameClassifier *frameClassifier() { return m_frameClassifier.get(); }

private:
    WatchConfig m_config;
    CancellationToken m_token;
    bool m_started = false;

    std::unique_ptr<VisualEventJournal> m_journal;
    std::unique_ptr<TacticalEventDetector> m_detector;
    std::unique_ptr<HistoryStore> m_history;
    std::unique_ptr<StateFetcher> m_fetcher;
    std::unique_ptr<StatePoller> m_poller;

    std::unique_ptr<ScreenCapture> m_capture;
    std::unique_ptr<ImageClassifier> m_classifier;
    std::unique_ptr<FrameSlot> m_frameSlot;
    std::unique_ptr<FrameProducer> m_frameProducer;
    std::unique_ptr<FrameClassifier> m_frameClassifier;

    std::unique_ptr<MatchwatchApiServer> m_apiServer;
};

} // namespace matchwatch
