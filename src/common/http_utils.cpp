#include "common/http_utils.hpp"

#include <stdexcept>

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace matchwatch {

HttpResponse postJson(const std::string &url,
                      const QByteArray &body,
                      const std::map<std::string, std::string> &headers,
                      std::chrono::milliseconds timeout)
{
    QNetworkAccessManager manager;
    QNetworkRequest request(QUrl(QString::fromStdString(url)));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setRawHeader("Accept", "application/json");
    for (const auto &[name, value] : headers) {
        request.setRawHeader(QByteArray::fromStdString(name), QByteArray::fromStdString(value));
    }

    QNetworkReply *reply = manager.post(request, body);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(static_cast<int>(timeout.count()));
    if (!reply->isFinished()) {
        loop.exec();
    }
    timer.stop();

    HttpResponse response;
    response.statusCode =
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QNetworkReply::NetworkError error = reply->error();
    const QString errorText = reply->errorString();
    response.body = reply->readAll();
    reply->deleteLater();

    if (timedOut) {
        throw std::runtime_error("request timed out after "
                                 + std::to_string(timeout.count()) + " ms");
    }
    // HTTP-level errors carry a status code and are reported to the caller.
    if (error != QNetworkReply::NoError && response.statusCode == 0) {
        throw std::runtime_error(errorText.toStdString());
    }
    return response;
}

} // namespace matchwatch
