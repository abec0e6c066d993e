#include "vision/screen_capture.hpp"

#include <future>
#include <memory>

#include <QCoreApplication>
#include <QGuiApplication>
#include <QMetaObject>
#include <QPixmap>
#include <QScreen>
#include <QThread>

#include "common/errors.hpp"

namespace matchwatch {

namespace {

QImage grabPrimaryScreen(const CaptureRegion &region)
{
    QScreen *screen = QGuiApplication::primaryScreen();
    if (!screen) {
        return QImage();
    }
    const QPixmap pixmap =
        screen->grabWindow(0, region.left, region.top, region.width, region.height);
    return pixmap.toImage();
}

} // namespace

cv::Mat toBgrMat(const QImage &image)
{
    if (image.isNull()) {
        return cv::Mat();
    }
    const QImage bgr = image.convertToFormat(QImage::Format_BGR888);
    const cv::Mat view(bgr.height(), bgr.width(), CV_8UC3,
                       const_cast<uchar *>(bgr.constBits()),
                       static_cast<std::size_t>(bgr.bytesPerLine()));
    return view.clone();
}

QtScreenCapture::QtScreenCapture(std::chrono::milliseconds timeout)
    : m_timeout(timeout)
{
}

cv::Mat QtScreenCapture::captureRegion(const CaptureRegion &region)
{
    QCoreApplication *app = QCoreApplication::instance();
    if (!app) {
        throw CaptureError("no application instance for screen capture");
    }

    QImage image;
    if (QThread::currentThread() == app->thread()) {
        image = grabPrimaryScreen(region);
    } else {
        auto promise = std::make_shared<std::promise<QImage>>();
        std::future<QImage> future = promise->get_future();
        QMetaObject::invokeMethod(
            app,
            [promise, region]() { promise->set_value(grabPrimaryScreen(region)); },
            Qt::QueuedConnection);
        if (future.wait_for(m_timeout) != std::future_status::ready) {
            throw CaptureError("screen grab timed out");
        }
        image = future.get();
    }

    cv::Mat frame = toBgrMat(image);
    if (frame.empty()) {
        throw CaptureError("screen grab returned an empty image");
    }
    return frame;
}

} // namespace matchwatch
