#pragma once

#include "execution/ExecutionState.hpp"
#include "execution/JobSubmitter.hpp"
#include "upstream/RelayEvent.hpp"
#include "workflow/WorkflowStore.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <set>
#include <string>

namespace flowrelay {
namespace execution {

/**
 * Outcome of one job
 */
struct ExecutionResult {
    ExecutionState state = ExecutionState::Idle;
    std::string promptId;
    std::string imageFilename;
    std::string imageSubfolder;
    std::string imageUrl;
    std::string errorMessage;

    bool hasImage() const { return !imageFilename.empty(); }
};

/**
 * Latest progress report of the running job
 */
struct ExecutionProgress {
    int value = 0;
    int max = 0;
    std::string node;
};

struct CoordinatorOptions {
    std::string saveImageNodeId = "9";
    std::string viewBaseUrl = "http://127.0.0.1:8188";  // engine base URL for /view links

    // History lookup when no `executed` event carried an image
    int historyAttempts = 12;
    std::chrono::milliseconds historyRetryDelay{1000};  // grows by half of itself per attempt
};

/**
 * Turns the engine's event stream into a blocking "run and wait" call
 *
 * Owns the process-wide ExecutionState. Every transition happens under one
 * mutex, whether it comes from an HTTP thread (submit, timeout, interrupt
 * fallback) or from the upstream read thread (events, disconnect). Each
 * submission arms a one-shot promise that the event path resolves exactly
 * once and the waiting caller reads exactly once.
 */
class ExecutionCoordinator {
public:
    ExecutionCoordinator(JobSubmitter& submitter, CoordinatorOptions options);

    ExecutionCoordinator(const ExecutionCoordinator&) = delete;
    ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

    /**
     * Submit a graph and block until the job reaches a terminal state.
     *
     * Throws AlreadyRunning if a job is queued or running, SubmissionRejected
     * or UpstreamUnreachable if the engine refuses the job, ExecutionFailed
     * if it errors and ExecutionTimeout if no terminal event arrives in time.
     * An interrupted job is returned with state Interrupted.
     */
    ExecutionResult submitAndWait(const workflow::WorkflowSnapshot& graph,
                                  std::chrono::milliseconds timeout);

    /**
     * Interpret one engine event (called from the upstream read loop)
     */
    void onEvent(const upstream::RelayEvent& event);

    /**
     * Upstream socket closed: an in-flight job becomes errored, and every
     * later submitAndWait() throws UpstreamUnreachable
     */
    void onUpstreamClosed();

    /**
     * Fill in the image of a completed job from the engine's history.
     *
     * Polls GET /history/{prompt_id} up to `historyAttempts` times and only
     * accepts an image the engine actually serves (HEAD on its /view URL).
     * The save-image node is preferred. Blocks between attempts; call it
     * outside any lock. Returns false if no accessible image turned up.
     */
    bool recoverImage(ExecutionResult& result);

    /**
     * Wait up to `grace` for the engine to acknowledge an interrupt. If the
     * job is still in flight afterwards it is forced to Interrupted and its
     * waiter released. Returns true if no forcing was needed.
     */
    bool awaitInterruptAck(std::chrono::milliseconds grace);

    ExecutionState state() const;
    std::string currentPromptId() const;
    ExecutionProgress progress() const;
    ExecutionResult lastResult() const;

    /// Number of prompt ids currently ignored after a timeout or forced interrupt
    size_t abandonedCount() const;

    /// Oldest abandoned prompt ids are forgotten beyond this many
    static constexpr size_t kMaxAbandoned = 64;

private:
    bool acceptsLocked(const upstream::RelayEvent& event);
    void captureOutputLocked(const nlohmann::json& data);
    void finishLocked(ExecutionState state, const std::string& message);
    void abandonLocked(const std::string& promptId);
    std::string viewTarget(const std::string& filename, const std::string& subfolder,
                           const std::string& type) const;
    std::string viewUrl(const std::string& filename, const std::string& subfolder,
                        const std::string& type) const;

    JobSubmitter& m_submitter;
    CoordinatorOptions m_options;

    mutable std::mutex m_mutex;
    std::condition_variable m_stateChanged;
    ExecutionState m_state = ExecutionState::Idle;
    uint64_t m_generation = 0;

    // Current job
    std::string m_promptId;
    std::promise<ExecutionResult> m_promise;
    bool m_resolved = true;
    ExecutionResult m_current;
    bool m_imageFromSaveNode = false;
    ExecutionProgress m_progress;

    ExecutionResult m_lastResult;
    bool m_upstreamClosed = false;

    // Prompt ids whose waiter was released early, oldest first
    std::set<std::string> m_abandoned;
    std::deque<std::string> m_abandonedOrder;
};

} // namespace execution
} // namespace flowrelay
