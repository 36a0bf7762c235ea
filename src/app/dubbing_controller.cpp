// Copyright (c) 2025 Dubline
// Application API - Dubbing Controller Implementation

#include "app/dubbing_controller.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"

#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

namespace app {

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class DubbingControllerImpl {
public:
    explicit DubbingControllerImpl(dub::DubbingPipeline& pipeline) : pipeline_(pipeline) {}
    ~DubbingControllerImpl() { wait(); }

    bool start(const dub::PipelineRequest& request);
    void wait();
    bool is_running() const { return running_; }
    JobStatus get_status() const;
    std::map<std::string, dub::LanguageOutcome> results() const;

    void subscribe_to_progress(ProgressCallback cb);
    void subscribe_to_languages(LanguageCallback cb);
    void subscribe_to_status(StatusCallback cb);
    void clear_subscriptions();

private:
    void run_job(dub::PipelineRequest request);
    void emit_progress(int percent, const std::string& message);
    void emit_language(const LanguageEvent& ev);
    void emit_status(const JobStatus& status);

    dub::DubbingPipeline& pipeline_;

    mutable std::mutex state_mutex_;
    std::atomic<bool> running_{false};
    JobStatus status_;
    std::map<std::string, dub::LanguageOutcome> results_;

    mutable std::mutex callbacks_mutex_;
    std::vector<ProgressCallback> progress_callbacks_;
    std::vector<LanguageCallback> language_callbacks_;
    std::vector<StatusCallback> status_callbacks_;

    std::thread job_thread_;
};

//==============================================================================
// Job Control
//==============================================================================

bool DubbingControllerImpl::start(const dub::PipelineRequest& request) {
    if (request.target_languages.empty()) {
        core::log_error("[controller] job has no target languages");
        return false;
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        core::log_warn("[controller] a job is already running");
        return false;
    }
    if (job_thread_.joinable()) job_thread_.join();

    JobStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        results_.clear();
        status_ = JobStatus{};
        status_.state = JobStatus::State::RUNNING;
        status_.job_id = request.job_id;
        status_.languages_total = static_cast<int>(request.target_languages.size());
        snapshot = status_;
    }
    emit_status(snapshot);
    job_thread_ = std::thread(&DubbingControllerImpl::run_job, this, request);
    return true;
}

void DubbingControllerImpl::wait() {
    if (job_thread_.joinable()) job_thread_.join();
}

void DubbingControllerImpl::run_job(dub::PipelineRequest request) {
    std::map<std::string, dub::LanguageOutcome> outcomes;
    try {
        outcomes = pipeline_.run(request, [this](int pct, const std::string& msg) { emit_progress(pct, msg); });
    } catch (const std::exception& e) {
        core::log_error(std::string("[controller] job ") + request.job_id + " aborted: " + e.what());
        outcomes.clear();
        for (const auto& lang : request.target_languages) {
            dub::LanguageOutcome o;
            o.result.language_code = lang;
            o.error = core::make_error(core::ErrorCode::ToolFailure, "pipeline", "job aborted by an internal error");
            outcomes[lang] = o;
        }
    }

    int failed = 0;
    for (const auto& kv : outcomes) {
        if (!kv.second.ok) ++failed;
        emit_language(LanguageEvent{kv.first, kv.second});
    }

    JobStatus snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        results_ = std::move(outcomes);
        status_.languages_failed = failed;
        if (failed == 0) status_.state = JobStatus::State::FINISHED;
        else if (failed == status_.languages_total) status_.state = JobStatus::State::FAILED;
        else status_.state = JobStatus::State::PARTIAL;
        snapshot = status_;
    }
    running_ = false;
    emit_status(snapshot);
}

JobStatus DubbingControllerImpl::get_status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

std::map<std::string, dub::LanguageOutcome> DubbingControllerImpl::results() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return results_;
}

//==============================================================================
// Event Subscription
//==============================================================================

void DubbingControllerImpl::subscribe_to_progress(ProgressCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    progress_callbacks_.push_back(std::move(cb));
}

void DubbingControllerImpl::subscribe_to_languages(LanguageCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    language_callbacks_.push_back(std::move(cb));
}

void DubbingControllerImpl::subscribe_to_status(StatusCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    status_callbacks_.push_back(std::move(cb));
}

void DubbingControllerImpl::clear_subscriptions() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    progress_callbacks_.clear();
    language_callbacks_.clear();
    status_callbacks_.clear();
}

void DubbingControllerImpl::emit_progress(int percent, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        status_.percent = percent;
        status_.message = message;
    }
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& cb : progress_callbacks_) {
        try {
            cb(percent, message);
        } catch (const std::exception& e) {
            core::log_error(std::string("[controller] progress callback threw: ") + e.what());
        }
    }
}

void DubbingControllerImpl::emit_language(const LanguageEvent& ev) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& cb : language_callbacks_) {
        try {
            cb(ev);
        } catch (const std::exception& e) {
            core::log_error(std::string("[controller] language callback threw: ") + e.what());
        }
    }
}

void DubbingControllerImpl::emit_status(const JobStatus& status) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& cb : status_callbacks_) {
        try {
            cb(status);
        } catch (const std::exception& e) {
            core::log_error(std::string("[controller] status callback threw: ") + e.what());
        }
    }
}

//==============================================================================
// Public API Forwarding
//==============================================================================

DubbingController::DubbingController(dub::DubbingPipeline& pipeline)
    : impl_(std::make_unique<DubbingControllerImpl>(pipeline)) {}

DubbingController::~DubbingController() = default;

bool DubbingController::start_job(const dub::PipelineRequest& request) { return impl_->start(request); }
void DubbingController::wait() { impl_->wait(); }
bool DubbingController::is_running() const { return impl_->is_running(); }
JobStatus DubbingController::get_status() const { return impl_->get_status(); }
std::map<std::string, dub::LanguageOutcome> DubbingController::results() const { return impl_->results(); }

void DubbingController::subscribe_to_progress(ProgressCallback callback) { impl_->subscribe_to_progress(std::move(callback)); }
void DubbingController::subscribe_to_languages(LanguageCallback callback) { impl_->subscribe_to_languages(std::move(callback)); }
void DubbingController::subscribe_to_status(StatusCallback callback) { impl_->subscribe_to_status(std::move(callback)); }
void DubbingController::clear_subscriptions() { impl_->clear_subscriptions(); }

const char* state_name(JobStatus::State state) {
    switch (state) {
    case JobStatus::State::IDLE:     return "idle";
    case JobStatus::State::RUNNING:  return "running";
    case JobStatus::State::FINISHED: return "finished";
    case JobStatus::State::PARTIAL:  return "partial";
    case JobStatus::State::FAILED:   return "failed";
    }
    return "?";
}

} // namespace app
