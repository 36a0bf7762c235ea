#include "providers/http_client.hpp"
#include "core/logging.hpp"
#include <QByteArray>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace providers {

HttpResponse QtHttpClient::post(const HttpRequest& request) {
    HttpResponse out;
    QNetworkAccessManager manager;
    QNetworkRequest req(QUrl(QString::fromStdString(request.url)));
    for (const auto& h : request.headers) {
        req.setRawHeader(QByteArray::fromStdString(h.first), QByteArray::fromStdString(h.second));
    }

    QNetworkReply* reply = manager.post(req, QByteArray::fromStdString(request.body));
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    timer.start(request.timeout_ms);
    loop.exec();

    if (!reply->isFinished()) {
        out.timed_out = true;
        reply->abort();
        core::log_warn("[http] request to " + reply->url().host().toStdString() + " timed out after " +
                       std::to_string(request.timeout_ms) + "ms");
    } else {
        out.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        out.body = reply->readAll().toStdString();
        if (reply->error() != QNetworkReply::NoError && out.status == 0) {
            out.network_error = reply->errorString().toStdString();
        }
    }
    core::log_debug("[http] " + reply->url().host().toStdString() + " -> " + std::to_string(out.status));
    reply->deleteLater();
    return out;
}

std::string describe_failure(const HttpResponse& r) {
    if (r.timed_out) return "request timed out";
    if (!r.network_error.empty()) return "network error: " + r.network_error;
    return "HTTP " + std::to_string(r.status);
}

}
