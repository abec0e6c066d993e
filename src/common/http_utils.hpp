#pragma once

#include <chrono>
#include <map>
#include <string>

#include <QByteArray>

namespace matchwatch {

struct HttpResponse {
    int statusCode = 0;
    QByteArray body;
};

// Blocking POST for worker threads. Spins a private event loop in the calling
// thread, so it must not be called from a thread that shares a
// QNetworkAccessManager. Throws std::runtime_error (with `what` describing
// the transport error) on connection failure or timeout. HTTP error statuses
// are returned, not thrown.
HttpResponse postJson(const std::string &url,
                      const QByteArray &body,
                      const std::map<std::string, std::string> &headers,
                      std::chrono::milliseconds timeout);

} // namespace matchwatch
