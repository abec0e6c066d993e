#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <thread>

#include "common/cancellation_token.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "daemon/history_store.hpp"
#include "daemon/state_fetcher.hpp"
#include "daemon/tactical_event_detector.hpp"

namespace matchwatch {

enum class TickResult {
    Accepted,
    Skipped,
    Failed
};

/**
 * StatePoller drives one fetch per interval on its own thread and pushes each
 * accepted snapshot through diff, detection and history, strictly in order.
 *
 * A failed or empty fetch skips the tick and keeps the previous snapshot. An
 * exception escaping a tick is logged and followed by a short backoff; it
 * never ends the loop.
 */
class StatePoller
{
public:
    StatePoller(std::string seriesId,
                PollerConfig config,
                StateFetcher &fetcher,
                TacticalEventDetector &detector,
                HistoryStore &history,
                const CancellationToken &token);
    ~StatePoller();

    StatePoller(const StatePoller &) = delete;
    StatePoller &operator=(const StatePoller &) = delete;

    void start();
    // Blocks until the loop has observed the stop request and exited.
    void wait();
    bool isRunning() const;

    // One poll cycle. Called by the loop; exposed for tests.
    TickResult runTick();

    // Owned by the polling thread. Only read it from that thread or after wait().
    const std::optional<Snapshot> &previousSnapshot() const { return m_previous; }

    std::size_t acceptedCount() const { return m_accepted.load(); }
    std::size_t skippedCount() const { return m_skipped.load(); }
    std::size_t failedCount() const { return m_failed.load(); }

private:
    void run();
    void processSnapshot(const Snapshot &current);

    std::string m_seriesId;
    PollerConfig m_config;
    StateFetcher &m_fetcher;
    TacticalEventDetector &m_detector;
    HistoryStore &m_history;
    const CancellationToken &m_token;

    std::optional<Snapshot> m_previous;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<std::size_t> m_accepted{0};
    std::atomic<std::size_t> m_skipped{0};
    std::atomic<std::size_t> m_failed{0};
};

} // namespace matchwatch
