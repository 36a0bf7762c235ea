#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>
#include "audio/audio_tool_runner.hpp"
#include "audio/media_probe.hpp"
#include "core/logging.hpp"
#include "core/scoped_temp_dir.hpp"
#include "providers/deepgram_synthesizer.hpp"
#include "providers/openai_translator.hpp"
#include "fakes.hpp"

// Replays one canned response and keeps the last request.
class ScriptedHttp : public providers::HttpClient {
public:
    providers::HttpResponse next;
    providers::HttpRequest last;
    providers::HttpResponse post(const providers::HttpRequest& r) override {
        last = r;
        return next;
    }
};

static void test_ffprobe_parse() {
    const std::string json = R"({
        "streams": [
            {"codec_type": "video", "codec_name": "h264", "disposition": {"attached_pic": 0}},
            {"codec_type": "audio", "codec_name": "aac", "sample_rate": "48000", "channels": 2}
        ],
        "format": {"format_name": "mov,mp4,m4a,3gp,3g2,mj2", "duration": "12.480000"}
    })";
    auto r = audio::parse_ffprobe_json(json);
    assert(r);
    assert(r.value().has_audio && r.value().has_video);
    assert(r.value().sample_rate == 48000 && r.value().channels == 2);
    assert(r.value().codec == "aac" && r.value().format == "mov");
    assert(r.value().duration_seconds > 12.47 && r.value().duration_seconds < 12.49);

    // cover art does not make an mp3 a video
    auto mp3 = audio::parse_ffprobe_json(R"({"streams": [
        {"codec_type": "audio", "codec_name": "mp3", "sample_rate": "44100", "channels": 1},
        {"codec_type": "video", "codec_name": "png", "disposition": {"attached_pic": 1}}],
        "format": {"format_name": "mp3", "duration": "3.0"}})");
    assert(mp3 && !mp3.value().has_video);

    auto silent = audio::parse_ffprobe_json(R"({"streams": [{"codec_type": "video"}], "format": {}})");
    assert(silent && !silent.value().has_audio);
    assert(!audio::parse_ffprobe_json("not json"));
}

static void test_media_probe() {
    core::ScopedTempDir tmp("probe_test_");
    fakes::FakeToolRunner runner;
    audio::MediaProbe probe(runner);
    bool threw = false;
    try {
        probe.probe("/definitely/not/here.wav");
    } catch (const core::MediaNotFoundError&) {
        threw = true;
    }
    assert(threw);

    // unreadable media
    const std::string junk = (tmp.path() / "junk.mp3").string();
    std::ofstream(junk) << "garbage";
    threw = false;
    try {
        probe.probe(junk);
    } catch (const core::UnsupportedFormatError& e) {
        threw = e.code() == core::ErrorCode::UnsupportedFormat;
    }
    assert(threw);

    // a video container has its audio extracted before decoding
    const std::string clip = fakes::write_tmp(tmp.path(), "clip.mp4", fakes::sine(2.0, 300.0f, 48000));
    runner.video_inputs.insert(clip);
    audio::MediaInfo info;
    const std::string wav = probe.prepare_canonical(clip, tmp.path().string(), "voice", 44100, info);
    assert(info.has_video && info.has_audio);
    assert(runner.extract_calls == 1);
    assert(std::filesystem::exists(tmp.path() / "voice_extracted.wav"));
    assert(std::filesystem::exists(clip));
    audio::PcmBuffer canonical;
    assert(audio::read_wav(wav, canonical));
    assert(canonical.sample_rate == 44100 && canonical.channels == 1);
    assert(std::fabs(canonical.duration_seconds() - 2.0) < 0.01);

    // a hung extraction is a probe timeout
    runner.extract_timeout = true;
    threw = false;
    try {
        probe.prepare_canonical(clip, tmp.path().string(), "voice2", 44100, info);
    } catch (const core::ProbeTimeoutError& e) {
        threw = e.code() == core::ErrorCode::ProbeTimeout;
    }
    assert(threw);
    runner.extract_timeout = false;

    runner.probe_timeout = true;
    threw = false;
    try {
        probe.probe(clip);
    } catch (const core::ProbeTimeoutError&) {
        threw = true;
    }
    assert(threw);
}

static void test_translator() {
    assert(providers::language_name("es") == "Spanish");
    assert(providers::language_name("tlh") == "tlh");

    const std::string body = providers::build_translation_body("gpt-4o-mini", "Hello", "es", "en");
    const QJsonObject req = QJsonDocument::fromJson(QByteArray::fromStdString(body)).object();
    assert(req.value("model").toString() == "gpt-4o-mini");
    assert(req.value("temperature").toDouble() == 0.3);
    const QJsonArray msgs = req.value("messages").toArray();
    assert(msgs.size() == 2);
    assert(msgs.at(0).toObject().value("content").toString().contains("from English to Spanish"));
    assert(msgs.at(1).toObject().value("content").toString() == "Hello");

    ScriptedHttp http;
    providers::OpenAiTranslator::Options opts;
    opts.api_key = "sk-secret";
    providers::OpenAiTranslator tr(http, opts);

    http.next.status = 200;
    http.next.body = R"({"choices": [{"message": {"role": "assistant", "content": "  Hola  "}}]})";
    auto ok = tr.translate("Hello", "es", "en");
    assert(ok && ok.value() == "Hola");
    assert(http.last.headers.at("Authorization") == "Bearer sk-secret");

    http.next.status = 429;
    http.next.body = R"({"error": "rate limited"})";
    auto limited = tr.translate("Hello", "es", "en");
    assert(!limited && limited.error().code == core::ErrorCode::Translation);
    assert(limited.error().message.find("429") != std::string::npos);
    assert(limited.error().message.find("sk-secret") == std::string::npos);

    http.next.status = 200;
    http.next.body = R"({"choices": []})";
    assert(!tr.translate("Hello", "es", "en"));

    http.next = providers::HttpResponse{};
    http.next.timed_out = true;
    auto slow = tr.translate("Hello", "es", "en");
    assert(!slow && slow.error().message.find("timed out") != std::string::npos);
}

static void test_synthesizer() {
    const std::string url = providers::speak_url("https://api.deepgram.com/v1/speak", "aura-2-celeste-es");
    assert(url.find("model=aura-2-celeste-es") != std::string::npos);
    assert(url.find("encoding=mp3") != std::string::npos);

    ScriptedHttp http;
    providers::DeepgramSynthesizer::Options opts;
    opts.api_key = "dg-secret";
    providers::DeepgramSynthesizer tts(http, opts);

    http.next.status = 200;
    http.next.body = std::string("ID3\x03\x00audio", 10);
    auto ok = tts.generate_speech("Hola", "es", "aura-2-celeste-es");
    assert(ok && ok.value().size() == 10);
    assert(http.last.headers.at("Authorization") == "Token dg-secret");
    const QJsonObject sent = QJsonDocument::fromJson(QByteArray::fromStdString(http.last.body)).object();
    assert(sent.value("text").toString() == "Hola");

    // empty voice falls back
    (void)tts.generate_speech("Hola", "es", "");
    assert(http.last.url.find("aura-asteria-en") != std::string::npos);

    http.next.status = 500;
    auto failed = tts.generate_speech("Hola", "es", "v");
    assert(!failed && failed.error().code == core::ErrorCode::Synthesis);

    http.next.status = 200;
    http.next.body.clear();
    assert(!tts.generate_speech("Hola", "es", "v"));
}

int main() {
    core::set_log_level(core::LogLevel::Error);
    test_ffprobe_parse();
    test_media_probe();
    test_translator();
    test_synthesizer();
    return 0;
}
