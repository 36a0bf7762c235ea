// Copyright (c) 2025 Dubline
// Console front end: dub one recording into one or more languages.
#include <QCoreApplication>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "app/dubbing_controller.hpp"
#include "asr/whisper_transcriber.hpp"
#include "audio/audio_tool_runner.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "diar/voice_catalog.hpp"
#include "dub/pipeline.hpp"
#include "providers/deepgram_synthesizer.hpp"
#include "providers/http_client.hpp"
#include "providers/openai_translator.hpp"

static void print_usage() {
    std::cerr <<
        "usage: dub_file <voice> --source <lang> --target <lang>[,<lang>...]\n"
        "                [--background <file>] [--job-id <id>] [--out <dir>]\n"
        "                [--duck] [--voice-gain g] [--background-gain g]\n"
        "                [--catalog <json>] [--captions] [--archive] [--format wav|m4a]\n"
        "                [--model <whisper model>] [--max-workers n] [-v]\n"
        "environment: OPENAI_API_KEY, DEEPGRAM_API_KEY, DUBLINE_* overrides\n";
}

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

int main(int argc, char** argv) {
    QCoreApplication qapp(argc, argv);

    core::Config cfg = core::load_config_from_env();
    dub::PipelineRequest request;
    std::string targets;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        std::string v;
        if (a == "-h" || a == "--help") { print_usage(); return 0; }
        if (a == "-v" || a == "--verbose") { verbose = true; continue; }
        if (a == "--duck") { cfg.ducking = true; continue; }
        if (a == "--captions") { cfg.captions = true; continue; }
        if (a == "--archive") { cfg.archive = true; continue; }
        if (a == "--background" && next(v)) { request.background_path = v; continue; }
        if (a == "--source" && next(v)) { request.source_language = v; continue; }
        if (a == "--target" && next(v)) { targets = v; continue; }
        if (a == "--job-id" && next(v)) { request.job_id = v; continue; }
        if (a == "--out" && next(v)) { cfg.output_dir = v; continue; }
        if (a == "--voice-gain" && next(v)) { cfg.voice_gain = std::strtof(v.c_str(), nullptr); continue; }
        if (a == "--background-gain" && next(v)) { cfg.background_gain = std::strtof(v.c_str(), nullptr); continue; }
        if (a == "--catalog" && next(v)) { cfg.voice_catalog_path = v; continue; }
        if (a == "--format" && next(v)) { cfg.export_format = v; continue; }
        if (a == "--model" && next(v)) { cfg.whisper_model = v; continue; }
        if (a == "--max-workers" && next(v)) { cfg.max_workers = std::atoi(v.c_str()); continue; }
        if (!a.empty() && a[0] != '-' && request.voice_path.empty()) { request.voice_path = a; continue; }
        std::cerr << "unknown or incomplete argument: " << a << "\n";
        print_usage();
        return 2;
    }
    if (verbose) cfg.log_level = "debug";
    core::set_log_level(core::parse_log_level(cfg.log_level));

    request.target_languages = split_list(targets);
    if (request.voice_path.empty() || request.source_language.empty() || request.target_languages.empty()) {
        print_usage();
        return 2;
    }
    if (request.job_id.empty()) request.job_id = std::filesystem::path(request.voice_path).stem().string();

    const auto problems = cfg.validate(true);
    if (!problems.empty()) {
        for (const auto& p : problems) core::log_error("[config] " + p);
        return 2;
    }

    diar::VoiceCatalog catalog = diar::VoiceCatalog::builtin();
    if (!cfg.voice_catalog_path.empty()) {
        std::string err;
        if (!diar::VoiceCatalog::load_file(cfg.voice_catalog_path, diar::VoiceCatalog::builtin(), catalog, err)) {
            core::log_error("[config] " + err);
            return 2;
        }
    }

    audio::ToolTimeouts timeouts;
    timeouts.probe_ms = cfg.probe_timeout_ms;
    timeouts.extract_ms = cfg.extract_timeout_ms;
    timeouts.default_ms = cfg.tool_timeout_ms;
    audio::FfmpegToolRunner runner(timeouts);

    asr::WhisperTranscriber::Options asr_opts;
    asr_opts.model = cfg.whisper_model;
    asr_opts.speaker_model = cfg.speaker_model;
    asr_opts.max_speakers = cfg.max_speakers;
    asr::WhisperTranscriber transcriber(runner, asr_opts);

    providers::QtHttpClient http;
    providers::OpenAiTranslator::Options tr_opts;
    tr_opts.url = cfg.translation_url;
    tr_opts.model = cfg.translation_model;
    tr_opts.api_key = cfg.openai_api_key;
    tr_opts.timeout_ms = cfg.http_timeout_ms;
    providers::OpenAiTranslator translator(http, tr_opts);

    providers::DeepgramSynthesizer::Options tts_opts;
    tts_opts.url = cfg.synthesis_url;
    tts_opts.api_key = cfg.deepgram_api_key;
    tts_opts.timeout_ms = cfg.http_timeout_ms;
    providers::DeepgramSynthesizer synthesizer(http, tts_opts);

    dub::DubbingPipeline pipeline(transcriber, translator, synthesizer, runner, catalog, cfg);
    app::DubbingController controller(pipeline);
    controller.subscribe_to_progress([](int pct, const std::string& msg) {
        std::cout << "[" << pct << "%] " << msg << std::endl;
    });

    if (!controller.start_job(request)) return 1;
    controller.wait();

    int failed = 0;
    for (const auto& kv : controller.results()) {
        const auto& o = kv.second;
        if (o.ok) {
            std::cout << kv.first << ": ok " << o.result.final_audio_path;
            if (o.substituted_segments > 0) {
                std::cout << " (" << o.substituted_segments << "/" << o.segments << " segments silent)";
            }
            std::cout << "\n";
        } else {
            ++failed;
            std::cout << kv.first << ": FAILED at " << o.error.stage << ": " << o.error.message << "\n";
        }
    }
    std::cout << "job " << request.job_id << ": " << app::state_name(controller.get_status().state) << "\n";
    return failed == 0 ? 0 : 1;
}
