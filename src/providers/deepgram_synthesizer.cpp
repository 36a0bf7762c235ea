#include "providers/deepgram_synthesizer.hpp"
#include "core/logging.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

namespace providers {

using core::ErrorCode;
using core::make_error;
using core::make_unexpected;

std::string speak_url(const std::string& base, const std::string& voice_id) {
    QUrl url(QString::fromStdString(base));
    QUrlQuery q(url);
    q.addQueryItem("model", QString::fromStdString(voice_id));
    q.addQueryItem("encoding", "mp3");
    url.setQuery(q);
    return url.toString(QUrl::FullyEncoded).toStdString();
}

core::Expected<dub::AudioBytes, core::Error> DeepgramSynthesizer::generate_speech(
    const std::string& text, const std::string& target_language, const std::string& voice_id) {
    HttpRequest req;
    req.url = speak_url(opts_.url, voice_id.empty() ? opts_.fallback_voice : voice_id);
    req.timeout_ms = opts_.timeout_ms;
    req.headers["Authorization"] = "Token " + opts_.api_key;
    req.headers["Content-Type"] = "application/json";
    QJsonObject body;
    body["text"] = QString::fromStdString(text);
    req.body = QJsonDocument(body).toJson(QJsonDocument::Compact).toStdString();

    const HttpResponse resp = http_.post(req);
    if (!resp.ok()) {
        core::log_warn("[speak] " + target_language + ": " + describe_failure(resp));
        return make_unexpected(make_error(ErrorCode::Synthesis, "synthesis",
                                          "speech service failed (" + describe_failure(resp) + ")"));
    }
    if (resp.body.empty()) {
        return make_unexpected(make_error(ErrorCode::Synthesis, "synthesis", "speech service returned no audio"));
    }
    return dub::AudioBytes(resp.body.begin(), resp.body.end());
}

}
