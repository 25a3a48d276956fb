/**
 * @file python_engine.hpp
 * @brief Python execution in a long-lived, policy-enforcing worker process
 *
 * initialize() spawns one python3 worker, waits for it to import the default
 * packages and install the security policy, and keeps it hot. Each execute()
 * sends one JSON line and reads events until the matching result arrives.
 *
 * Inside the worker:
 * - User code runs with a fresh globals dict per call whose __builtins__ has
 *   the blocked functions replaced by stubs and __import__ replaced by a
 *   guard that consults the module deny-list
 * - An audit hook, installed before the worker reports ready and never
 *   switched off, refuses process spawning, sockets, file writes, filesystem
 *   mutation, native loading and heap or cross-thread frame inspection
 * - User code runs on its own thread, so no frame it can reach belongs to
 *   the worker. At the timeout the thread gets an asynchronous exception
 *   and the worker survives
 * - stdout/stderr are captured per call; matplotlib figures and pandas
 *   DataFrames become artifacts and are cleared afterwards
 *
 * The worker itself runs under rlimits (address space, open files, file
 * size, no core dumps). If it stops answering it is killed and respawned on
 * the next call.
 */

#ifndef LIVERUN_ENGINES_PYTHON_ENGINE_HPP
#define LIVERUN_ENGINES_PYTHON_ENGINE_HPP

#include "../engine_interface.hpp"
#include "../context_protocol.hpp"
#include <sys/types.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace liverun {

/**
 * @brief Worker process settings
 */
struct PythonEngineOptions {
    std::string interpreter;                    ///< Executable name or path (default: python3)
    uint64_t memory_limit_bytes;                ///< RLIMIT_AS for the worker (0 = unlimited)
    std::vector<std::string> default_packages;  ///< Imported at bootstrap; failures are non-fatal
    uint32_t startup_timeout_ms;                ///< Budget for the worker to report ready
    uint32_t watchdog_grace_ms;                 ///< Extra wait past a call's timeout before killing the worker
    size_t max_capture_bytes;                   ///< Per-call cap on captured stdout/stderr inside the worker

    PythonEngineOptions()
        : interpreter("python3"),
          memory_limit_bytes(1024ULL * 1024 * 1024),
          default_packages({"numpy", "pandas", "matplotlib"}),
          startup_timeout_ms(60000),
          watchdog_grace_ms(2000),
          max_capture_bytes(1024 * 1024) {}
};

class PythonEngine : public ILanguageEngine {
public:
    explicit PythonEngine(PythonEngineOptions options = PythonEngineOptions());
    ~PythonEngine() override;

    PythonEngine(const PythonEngine&) = delete;
    PythonEngine& operator=(const PythonEngine&) = delete;

    /**
     * @brief Spawn the worker and wait for it to report ready
     * @throws EngineLoadError if the interpreter is missing, crashes or times out
     */
    void initialize(const SecurityPolicy& policy) override;

    EngineInfo get_info() const override {
        return EngineInfo("Python Worker Engine", "1.0.0", "python", true, 40 * 1024 * 1024);
    }

    EngineOutput execute(const std::string& code, const ExecutionOptions& options) override;

    /**
     * @brief Import additional packages into the hot worker
     *
     * Nothing is downloaded; a dependency must already be installed for the
     * interpreter.
     *
     * @throws ExecutionError if a dependency is blocked or not importable
     */
    std::vector<std::string> install_dependencies(const std::vector<std::string>& dependencies) override;

    /**
     * @brief Compile without running
     */
    std::vector<std::string> validate_syntax(const std::string& code) override;

    /**
     * @brief Kill the worker (thread-safe); the current call fails
     */
    void interrupt() noexcept override;

    void set_progress_callback(ProgressCallback callback) override;

    void dispose() noexcept override;

    bool is_initialized() const override {
        return initialized_;
    }

    /**
     * @brief Packages imported at bootstrap or through install_dependencies()
     */
    const std::vector<std::string>& loaded_packages() const { return loaded_packages_; }

    /**
     * @brief Interpreter version reported by the worker
     */
    const std::string& python_version() const { return python_version_; }

    /**
     * @brief Worker process id (-1 if none)
     */
    pid_t worker_pid() const { return pid_.load(); }

    /**
     * @brief Python source of the worker
     */
    static const char* bootstrap_script();

private:
    PythonEngineOptions options_;
    std::unique_ptr<SecurityPolicy> policy_;
    bool initialized_;

    std::atomic<pid_t> pid_;
    int channel_fd_;                  ///< Our end of the socketpair carrying JSON lines
    int stderr_fd_;                   ///< Worker's fd 2, drained into stderr_tail_
    std::string read_buffer_;
    std::string stderr_tail_;
    std::mutex callback_mutex_;
    ProgressCallback progress_callback_;

    std::vector<std::string> loaded_packages_;
    std::string python_version_;
    uint64_t request_counter_;

    void spawn_worker();
    void stop_worker(bool graceful) noexcept;
    bool worker_alive();
    void ensure_worker();

    void send_message(const nlohmann::json& message);

    /**
     * @brief Read one protocol line
     * @return false if the deadline passed first
     * @throws ExecutionError if the worker closed the channel
     */
    bool read_line(std::string& line, std::chrono::steady_clock::time_point deadline);

    /**
     * @brief Read events until the terminal one for id, forwarding progress
     * @return false if the deadline passed first
     */
    bool await_event(const std::string& id, std::chrono::steady_clock::time_point deadline,
                     nlohmann::json& message);

    std::string describe_exit(int status) const;
    std::string next_id(const char* prefix);
};

} // namespace liverun

#endif // LIVERUN_ENGINES_PYTHON_ENGINE_HPP
