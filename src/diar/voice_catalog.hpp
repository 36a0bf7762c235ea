#pragma once
#include <map>
#include <string>
#include <vector>

namespace diar {

struct VoiceCatalogEntry {
    std::string voice_name;
    float pitch_hz = 0.0f;
    std::string gender;
};

struct LanguageVoices {
    std::string default_voice;
    std::vector<VoiceCatalogEntry> voices; // ascending pitch
};

// Per-language synthetic voices. Immutable once built; safe to share across threads.
class VoiceCatalog {
public:
    // Spanish and English stock voices.
    static VoiceCatalog builtin();

    // Parses {"es": {"default": "...", "voices": [{"name", "pitch", "gender"}]}}.
    // Languages in the file replace the same language in `base`.
    // Returns false and sets `error` on malformed input; `out` is untouched then.
    static bool from_json(const std::string& json, const VoiceCatalog& base, VoiceCatalog& out, std::string& error);
    static bool load_file(const std::string& path, const VoiceCatalog& base, VoiceCatalog& out, std::string& error);

    // Voices for `language`; unknown languages get the English list.
    const LanguageVoices& for_language(const std::string& language) const;
    bool has_language(const std::string& language) const { return m_languages.count(language) > 0; }
    std::vector<std::string> languages() const;

    void set_language(const std::string& language, LanguageVoices voices);

private:
    std::map<std::string, LanguageVoices> m_languages;
};

}
