#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include "common/config.hpp"
#include "common/models.hpp"
#include "common/ring_buffer.hpp"

namespace matchwatch {

// Reads a persisted history file. Returns std::nullopt and fills
// errorMessage when the file is missing or is not a JSON array of entries.
std::optional<std::vector<HistoryEntry>> loadHistoryFile(const QString &path,
                                                         std::string *errorMessage = nullptr);

/**
 * HistoryStore keeps the rolling window of accepted snapshots and mirrors a
 * simplified projection of it to disk after every append.
 *
 * The on-disk file is rewritten atomically as a whole (QSaveFile), so readers
 * never observe a partial write. Write failures are logged and swallowed.
 */
class HistoryStore
{
public:
    static constexpr std::size_t kDefaultRecent = 10;

    explicit HistoryStore(HistoryConfig config);

    // Snapshots without players are rejected and return false. A failed disk
    // write does not reject the snapshot.
    bool append(const Snapshot &snapshot);

    // Newest `limit` snapshots of the in-memory window, oldest first.
    std::vector<Snapshot> recent(std::size_t limit = kDefaultRecent) const;
    std::optional<Snapshot> latest() const;
    std::size_t size() const;
    std::size_t capacity() const;

    // Whatever is on disk, including entries written by a previous run.
    std::vector<HistoryEntry> readPersisted() const;

    QString filePath() const;
    std::size_t writeFailures() const;

private:
    bool persistLocked();

    HistoryConfig m_config;
    QString m_filePath;

    mutable std::mutex m_mutex;
    RingBuffer<Snapshot> m_window;
    std::size_t m_writeFailures = 0;
};

} // namespace matchwatch
