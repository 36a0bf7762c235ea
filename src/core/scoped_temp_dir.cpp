#include "core/scoped_temp_dir.hpp"
#include "core/logging.hpp"
#include <atomic>
#include <chrono>
#include <random>
#include <stdexcept>
#include <system_error>

namespace core {

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned> g_counter{0};

std::string unique_suffix() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(now) + "_" + std::to_string(g_counter.fetch_add(1)) + "_" + std::to_string(rng() % 100000);
}
} // namespace

ScopedTempDir::ScopedTempDir(const std::string& prefix, const std::string& root) {
    fs::path base = root.empty() ? fs::temp_directory_path() : fs::path(root);
    std::error_code ec;
    fs::create_directories(base, ec);
    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path candidate = base / (prefix + unique_suffix());
        if (fs::create_directory(candidate, ec)) {
            path_ = candidate;
            log_debug("[tmp] created " + path_.string());
            return;
        }
    }
    throw std::runtime_error("could not create temporary working directory");
}

ScopedTempDir::~ScopedTempDir() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log_warn("[tmp] failed to remove working directory: " + ec.message());
    } else {
        log_debug("[tmp] removed " + path_.string());
    }
}

fs::path ScopedTempDir::subdir(const std::string& name) const {
    fs::path p = path_ / name;
    fs::create_directories(p);
    return p;
}

}
