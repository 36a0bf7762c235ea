#include "providers/openai_translator.hpp"
#include "core/logging.hpp"
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <map>

namespace providers {

using core::ErrorCode;
using core::make_error;
using core::make_unexpected;

std::string language_name(const std::string& code) {
    static const std::map<std::string, std::string> names = {
        {"en", "English"}, {"es", "Spanish"}, {"fr", "French"},     {"de", "German"},
        {"ja", "Japanese"}, {"zh", "Chinese"}, {"ko", "Korean"},    {"pt", "Portuguese"},
        {"it", "Italian"}, {"ru", "Russian"}, {"ar", "Arabic"},     {"hi", "Hindi"},
    };
    auto it = names.find(code);
    return it != names.end() ? it->second : code;
}

std::string build_translation_body(const std::string& model, const std::string& text,
                                   const std::string& target_language, const std::string& source_language) {
    const std::string system = "You are a professional translator. Translate the following text from " +
                               language_name(source_language) + " to " + language_name(target_language) +
                               ". Maintain the original tone, style, and meaning. Return only the translated text.";
    QJsonObject sys;
    sys["role"] = "system";
    sys["content"] = QString::fromStdString(system);
    QJsonObject user;
    user["role"] = "user";
    user["content"] = QString::fromStdString(text);

    QJsonObject root;
    root["model"] = QString::fromStdString(model);
    root["messages"] = QJsonArray{sys, user};
    root["max_tokens"] = 2000;
    root["temperature"] = 0.3;
    return QJsonDocument(root).toJson(QJsonDocument::Compact).toStdString();
}

bool parse_translation_response(const std::string& body, std::string& text) {
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(body), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) return false;
    const QJsonArray choices = doc.object().value("choices").toArray();
    if (choices.isEmpty()) return false;
    const QJsonValue content = choices.at(0).toObject().value("message").toObject().value("content");
    if (!content.isString()) return false;
    text = content.toString().trimmed().toStdString();
    return true;
}

core::Expected<std::string, core::Error> OpenAiTranslator::translate(
    const std::string& text, const std::string& target_language, const std::string& source_language) {
    HttpRequest req;
    req.url = opts_.url;
    req.timeout_ms = opts_.timeout_ms;
    req.headers["Authorization"] = "Bearer " + opts_.api_key;
    req.headers["Content-Type"] = "application/json";
    req.body = build_translation_body(opts_.model, text, target_language, source_language);

    const HttpResponse resp = http_.post(req);
    if (!resp.ok()) {
        core::log_warn("[translate] " + target_language + ": " + describe_failure(resp));
        return make_unexpected(make_error(ErrorCode::Translation, "translation",
                                          "translation service failed (" + describe_failure(resp) + ")"));
    }
    std::string out;
    if (!parse_translation_response(resp.body, out)) {
        return make_unexpected(make_error(ErrorCode::Translation, "translation", "translation response is malformed"));
    }
    if (out.empty()) {
        return make_unexpected(make_error(ErrorCode::Translation, "translation", "translation service returned no text"));
    }
    return out;
}

}
