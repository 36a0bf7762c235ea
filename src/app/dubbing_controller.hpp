// Copyright (c) 2025 Dubline
// Application API - Dubbing Controller Interface
//
// Runs dubbing jobs in the background and fans pipeline events out to
// subscribers (CLI, tests, future front ends).

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "dub/pipeline.hpp"

namespace app {

class DubbingControllerImpl;

//==============================================================================
// Event Structures
//==============================================================================

/// Job status snapshot
struct JobStatus {
    /// Current state of the controller
    enum class State {
        IDLE,                                     ///< No job submitted yet
        RUNNING,                                  ///< Job in progress
        FINISHED,                                 ///< All languages succeeded
        PARTIAL,                                  ///< Some languages failed
        FAILED                                    ///< Every language failed
    };

    State state = State::IDLE;
    std::string job_id;
    int percent = 0;                              ///< Last reported progress
    std::string message;                          ///< Last progress message
    int languages_total = 0;
    int languages_failed = 0;
};

/// Per-language completion event
struct LanguageEvent {
    std::string language;
    dub::LanguageOutcome outcome;
};

//==============================================================================
// Callback Types
//==============================================================================

using ProgressCallback = std::function<void(int percent, const std::string& message)>;
using LanguageCallback = std::function<void(const LanguageEvent&)>;
using StatusCallback = std::function<void(const JobStatus&)>;

//==============================================================================
// Main Controller Class
//==============================================================================

/// Background runner for dubbing jobs.
///
/// Thread Safety:
/// - All public methods are thread-safe
/// - Callbacks are invoked from the job thread (progress may come from
///   language workers, but never concurrently)
///
/// Example:
/// @code
/// DubbingController controller(pipeline);
/// controller.subscribe_to_progress([](int pct, const std::string& msg) {
///     std::cout << pct << "% " << msg << "\n";
/// });
/// controller.start_job(request);
/// controller.wait();
/// @endcode
class DubbingController {
public:
    /// @param pipeline Configured pipeline; must outlive the controller
    explicit DubbingController(dub::DubbingPipeline& pipeline);

    /// Destructor (waits for a running job)
    ~DubbingController();

    DubbingController(const DubbingController&) = delete;
    DubbingController& operator=(const DubbingController&) = delete;

    /// Start a job on a background thread
    /// @return false if a job is already running or the request is empty
    bool start_job(const dub::PipelineRequest& request);

    /// Block until the current job (if any) finished
    void wait();

    bool is_running() const;
    JobStatus get_status() const;

    /// Outcomes of the last finished job, keyed by language
    std::map<std::string, dub::LanguageOutcome> results() const;

    void subscribe_to_progress(ProgressCallback callback);
    void subscribe_to_languages(LanguageCallback callback);
    void subscribe_to_status(StatusCallback callback);
    void clear_subscriptions();

private:
    std::unique_ptr<DubbingControllerImpl> impl_;  ///< PIMPL implementation
};

/// Lower-case state name ("running", ...)
const char* state_name(JobStatus::State state);

} // namespace app
