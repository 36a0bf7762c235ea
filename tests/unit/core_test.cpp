#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include "core/bounded_executor.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/expected.hpp"
#include "core/logging.hpp"
#include "core/scoped_temp_dir.hpp"

static void test_errors() {
    core::SynthesisError e("service timed out");
    assert(e.code() == core::ErrorCode::Synthesis);
    assert(e.error().stage == "synthesis");
    assert(std::string(e.what()).find("service timed out") != std::string::npos);

    try {
        throw core::MediaNotFoundError("missing");
    } catch (const core::PipelineError& pe) {
        assert(pe.code() == core::ErrorCode::MediaNotFound);
        assert(pe.error().stage == "probe");
    }
    assert(std::string(core::error_code_name(core::ErrorCode::Mixing)) == "MixingError");

    // every named error carries its own code and stage
    assert(core::UnsupportedFormatError("x").code() == core::ErrorCode::UnsupportedFormat);
    assert(core::ProbeTimeoutError("x").error().stage == "probe");
    assert(core::ProbeTimeoutError("x").code() == core::ErrorCode::ProbeTimeout);
    assert(core::ToolError("x").code() == core::ErrorCode::ToolFailure);
    assert(core::ToolError("x").error().stage == "audio-tool");
    assert(core::TranscriptionError("x").error().stage == "transcription");
    assert(core::TranslationError("x").code() == core::ErrorCode::Translation);
    assert(core::ReconstructionError("x").error().stage == "reconstruction");
    assert(core::MixingError("x").code() == core::ErrorCode::Mixing);
    assert(core::MixingError("x").error().message == "x");
}

static void test_expected() {
    core::Expected<int, core::Error> ok = 7;
    assert(ok && ok.value() == 7);

    core::Expected<int, core::Error> bad = core::make_unexpected(
        core::make_error(core::ErrorCode::Translation, "translation", "quota"));
    assert(!bad);
    assert(bad.error().code == core::ErrorCode::Translation);
    bool threw = false;
    try {
        (void)bad.value();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
}

static void test_config() {
    core::Config c;
    assert(c.validate(false).empty());
    assert(!c.validate(true).empty());  // no provider keys
    c.openai_api_key = "k1";
    c.deepgram_api_key = "k2";
    assert(c.validate(true).empty());
    c.export_format = "flac";
    c.max_workers = 0;
    assert(c.validate(true).size() == 2);
}

static void test_temp_dir() {
    std::filesystem::path kept;
    {
        core::ScopedTempDir tmp("core_test_");
        kept = tmp.path();
        assert(std::filesystem::is_directory(kept));
        std::ofstream(tmp.file("a.txt")) << "x";
        auto sub = tmp.subdir("es");
        std::ofstream((sub / "b.txt").string()) << "y";
    }
    assert(!std::filesystem::exists(kept));

    // cleanup also runs while unwinding
    try {
        core::ScopedTempDir tmp("core_test_");
        kept = tmp.path();
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    assert(!std::filesystem::exists(kept));
}

static void test_executor() {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> done{0};
    {
        core::BoundedExecutor ex(2);
        for (int i = 0; i < 8; ++i) {
            ex.submit([&] {
                int now = ++running;
                int p = peak.load();
                while (now > p && !peak.compare_exchange_weak(p, now)) {}
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                --running;
                ++done;
            });
        }
        ex.submit([] { throw std::runtime_error("task failure is logged, not fatal"); });
        ex.wait_all();
    }
    assert(done == 8);
    assert(peak <= 2);
}

int main() {
    core::set_log_level(core::LogLevel::Error);
    assert(core::parse_log_level("DEBUG") == core::LogLevel::Debug);
    assert(core::parse_log_level("nonsense") == core::LogLevel::Info);
    test_errors();
    test_expected();
    test_config();
    test_temp_dir();
    test_executor();
    return 0;
}
