#pragma once
#include <string>
#include <utility>
#include "dub/translator.hpp"
#include "providers/http_client.hpp"

namespace providers {

// "es" -> "Spanish"; unknown codes come back unchanged.
std::string language_name(const std::string& code);

// Chat-completions request body for one translation.
std::string build_translation_body(const std::string& model, const std::string& text,
                                   const std::string& target_language, const std::string& source_language);

// Extracts choices[0].message.content (trimmed). Returns false on malformed JSON.
bool parse_translation_response(const std::string& body, std::string& text);

class OpenAiTranslator : public dub::Translator {
public:
    struct Options {
        std::string url = "https://api.openai.com/v1/chat/completions";
        std::string model = "gpt-4o-mini";
        std::string api_key;
        int timeout_ms = 60000;
    };

    OpenAiTranslator(HttpClient& http, Options opts) : http_(http), opts_(std::move(opts)) {}

    core::Expected<std::string, core::Error> translate(
        const std::string& text, const std::string& target_language, const std::string& source_language) override;

private:
    HttpClient& http_;
    Options opts_;
};

}
