#include "diar/voice_catalog.hpp"
#include "core/logging.hpp"
#include <QByteArray>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <algorithm>
#include <utility>

namespace diar {

namespace {

const char* kFallbackLanguage = "en";

void sort_by_pitch(std::vector<VoiceCatalogEntry>& voices) {
    std::stable_sort(voices.begin(), voices.end(),
                     [](const VoiceCatalogEntry& a, const VoiceCatalogEntry& b) { return a.pitch_hz < b.pitch_hz; });
}

} // namespace

VoiceCatalog VoiceCatalog::builtin() {
    VoiceCatalog c;
    c.set_language("es", {"aura-2-celeste-es",
                          {{"aura-2-nestor-es", 125.0f, "male"}, {"aura-2-celeste-es", 210.0f, "female"}}});
    c.set_language("en", {"aura-asteria-en",
                          {{"aura-orion-en", 120.0f, "male"}, {"aura-asteria-en", 220.0f, "female"}}});
    return c;
}

void VoiceCatalog::set_language(const std::string& language, LanguageVoices voices) {
    sort_by_pitch(voices.voices);
    if (voices.default_voice.empty() && !voices.voices.empty()) {
        voices.default_voice = voices.voices.front().voice_name;
    }
    m_languages[language] = std::move(voices);
}

const LanguageVoices& VoiceCatalog::for_language(const std::string& language) const {
    auto it = m_languages.find(language);
    if (it != m_languages.end()) return it->second;
    auto fb = m_languages.find(kFallbackLanguage);
    if (fb != m_languages.end()) return fb->second;
    static const LanguageVoices empty;
    return empty;
}

std::vector<std::string> VoiceCatalog::languages() const {
    std::vector<std::string> out;
    for (const auto& kv : m_languages) out.push_back(kv.first);
    return out;
}

bool VoiceCatalog::from_json(const std::string& json, const VoiceCatalog& base, VoiceCatalog& out, std::string& error) {
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        error = "voice catalog is not a JSON object: " + perr.errorString().toStdString();
        return false;
    }

    VoiceCatalog result = base;
    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        const std::string lang = it.key().toStdString();
        if (!it.value().isObject()) {
            error = "voice catalog entry '" + lang + "' is not an object";
            return false;
        }
        const QJsonObject obj = it.value().toObject();
        LanguageVoices lv;
        lv.default_voice = obj.value("default").toString().toStdString();
        for (const auto& v : obj.value("voices").toArray()) {
            const QJsonObject vo = v.toObject();
            VoiceCatalogEntry e;
            e.voice_name = vo.value("name").toString().toStdString();
            e.pitch_hz = static_cast<float>(vo.value("pitch").toDouble(0.0));
            e.gender = vo.value("gender").toString().toStdString();
            if (e.voice_name.empty() || e.pitch_hz <= 0.0f) {
                error = "voice catalog '" + lang + "' has a voice without name or pitch";
                return false;
            }
            lv.voices.push_back(std::move(e));
        }
        if (lv.voices.empty()) {
            error = "voice catalog '" + lang + "' lists no voices";
            return false;
        }
        result.set_language(lang, std::move(lv));
    }
    out = std::move(result);
    return true;
}

bool VoiceCatalog::load_file(const std::string& path, const VoiceCatalog& base, VoiceCatalog& out, std::string& error) {
    QFile f(QString::fromStdString(path));
    if (!f.open(QIODevice::ReadOnly)) {
        error = "cannot open voice catalog " + path;
        return false;
    }
    const QByteArray bytes = f.readAll();
    if (!from_json(bytes.toStdString(), base, out, error)) return false;
    core::log_info("[voices] loaded catalog " + path + " (" + std::to_string(out.languages().size()) + " languages)");
    return true;
}

}
