/**
 * @file execution_context.hpp
 * @brief Isolated execution context hosting one language engine
 *
 * An IsolatedExecutionContext owns exactly one engine and one worker thread.
 * Callers never touch the engine: they post commands and receive events
 * through futures, and the worker runs commands one at a time in FIFO order.
 *
 * Lifecycle:
 *   UNINITIALIZED -> LOADING_RUNTIME -> READY -> EXECUTING -> (READY | TERMINATED)
 *   LOADING_RUNTIME -> FAILED if the runtime cannot be bootstrapped
 *
 * Design Pattern: Active Object. The engine lives in shared state that the
 * worker thread co-owns, so terminate() can abandon a runaway call without
 * waiting for it.
 */

#ifndef LIVERUN_EXECUTION_CONTEXT_HPP
#define LIVERUN_EXECUTION_CONTEXT_HPP

#include "context_protocol.hpp"
#include "engine_interface.hpp"
#include "logger.hpp"
#include "security_policy.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace liverun {

/**
 * @brief Per-context counters
 */
struct ContextStats {
    size_t commands_processed;   ///< Terminal events produced by the worker
    size_t failed_commands;      ///< Of which error events or failed results
    double busy_time_ms;         ///< Wall time spent inside the engine

    ContextStats() : commands_processed(0), failed_commands(0), busy_time_ms(0.0) {}
};

/**
 * @brief Single-engine execution context
 *
 * Usage Example:
 *   @code
 *   auto context = std::make_shared<IsolatedExecutionContext>(
 *       factory.create_engine("python"), config.security.build_policy());
 *   context->initialize();
 *
 *   auto reply = context->post(ContextCommand::execute("exec_1", "print(1)", 5000));
 *   if (reply.wait_for(std::chrono::milliseconds(5250)) == std::future_status::timeout) {
 *       context->terminate();
 *   } else {
 *       ContextEvent event = reply.get();
 *   }
 *   @endcode
 */
class IsolatedExecutionContext {
public:
    /**
     * @brief Listener for progress events of the command in flight
     */
    using ProgressListener = std::function<void(const ContextEvent& event)>;

    /**
     * @brief Constructor
     *
     * @param engine Engine to host (transfers ownership)
     * @param policy Capability object applied once at bootstrap
     * @param logger Logger instance (optional, uses default if nullptr)
     *
     * @throws std::invalid_argument If engine is null
     */
    IsolatedExecutionContext(
        std::unique_ptr<ILanguageEngine> engine,
        const SecurityPolicy& policy,
        Logger* logger = nullptr
    );

    /**
     * @brief Destructor - terminates the context
     */
    ~IsolatedExecutionContext();

    IsolatedExecutionContext(const IsolatedExecutionContext&) = delete;
    IsolatedExecutionContext& operator=(const IsolatedExecutionContext&) = delete;

    /**
     * @brief Bootstrap the runtime and start the worker
     *
     * Blocks until the engine is READY. Applies the security policy exactly once.
     *
     * @throws EngineLoadError If the runtime fails to bootstrap (state becomes FAILED)
     * @throws std::runtime_error If the context was already initialized
     */
    void initialize();

    /**
     * @brief Queue a command
     *
     * A terminate command terminates the context immediately and resolves with
     * an error event. Commands posted to a context that is not READY or
     * EXECUTING resolve immediately with an error event.
     *
     * @param command Command to run
     * @return Future resolving to the terminal event for command.id
     */
    std::future<ContextEvent> post(const ContextCommand& command);

    /**
     * @brief Queue a syntax check
     *
     * Resolves with a result event: success when no problems were found,
     * otherwise error lists the problems and metadata["problems"] holds them.
     */
    std::future<ContextEvent> validate(const std::string& id, const std::string& code);

    /**
     * @brief Terminate the context (best effort, idempotent)
     *
     * Interrupts the command in flight, fails it and every queued command with
     * a context_terminated error event, and releases the worker. A terminated
     * context never runs another command.
     */
    void terminate() noexcept;

    /**
     * @brief Whether a command with this id is queued or running
     */
    bool has_command(const std::string& id) const;

    /**
     * @brief Whether the command with this id is the one in flight
     */
    bool is_running(const std::string& id) const;

    /**
     * @brief Drop a command that has not started yet
     *
     * The command resolves with an error event; the context is untouched.
     *
     * @return False if no queued command has this id
     */
    bool cancel_queued(const std::string& id);

    void set_progress_listener(ProgressListener listener);

    ContextState get_state() const;

    /**
     * @brief Whether the context can still accept commands
     */
    bool is_usable() const;

    /**
     * @brief Commands queued or running
     */
    size_t pending() const;

    ContextStats get_stats() const;

    /**
     * @brief Metadata of the hosted engine
     */
    const EngineInfo& get_info() const { return info_; }

    const std::string& language() const { return info_.language; }

    /**
     * @brief Time the runtime finished loading
     */
    std::chrono::steady_clock::time_point loaded_at() const { return loaded_at_; }

    /**
     * @brief Bootstrap duration
     */
    double load_time_ms() const { return load_time_ms_; }

private:
    enum class TaskKind { COMMAND, VALIDATE };

    struct Task {
        TaskKind kind;
        ContextCommand command;
        std::promise<ContextEvent> promise;
        bool settled;

        Task() : kind(TaskKind::COMMAND), settled(false) {}
    };

    /**
     * @brief State shared with the worker thread
     *
     * Outlives the context object when terminate() abandons a busy worker.
     */
    struct Shared {
        mutable std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::shared_ptr<Task>> queue;
        std::shared_ptr<Task> current;
        ContextState state;
        bool stop;
        std::unique_ptr<ILanguageEngine> engine;
        ProgressListener progress_listener;
        ContextStats stats;
        Logger* logger;

        Shared() : state(ContextState::UNINITIALIZED), stop(false), logger(nullptr) {}
    };

    std::shared_ptr<Shared> shared_;
    SecurityPolicy policy_;
    EngineInfo info_;
    std::thread worker_;
    std::chrono::steady_clock::time_point loaded_at_;
    double load_time_ms_;

    std::future<ContextEvent> enqueue(std::shared_ptr<Task> task);

    static void worker_loop(std::shared_ptr<Shared> shared);
    static ContextEvent run_task(Shared& shared, const Task& task);
    static void transition(Shared& shared, ContextState new_state);
    static void settle(Task& task, ContextEvent event);
};

/**
 * @brief Shared reference to a loaded engine hosted in its context
 */
using EngineHandle = std::shared_ptr<IsolatedExecutionContext>;

} // namespace liverun

#endif // LIVERUN_EXECUTION_CONTEXT_HPP
