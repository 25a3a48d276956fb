#include "python_engine.hpp"
#include "../logger.hpp"
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <thread>

namespace liverun {

namespace {

const size_t kStderrTailBytes = 4096;

std::string resolve_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char* path = std::getenv("PATH");
    std::stringstream dirs(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

std::string matplotlib_config_dir() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    dir /= "liverun-mplconfig-" + std::to_string(getuid());
    std::filesystem::create_directories(dir, ec);
    return dir.string();
}

void set_limit(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = rl.rlim_max = value;
    setrlimit(resource, &rl);
}

// Collect the exit status of a worker that closed its channel, killing it if it lingers
int reap_child(pid_t pid) {
    int status = 0;
    for (int i = 0; i < 50; ++i) {
        if (waitpid(pid, &status, WNOHANG) == pid) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    return status;
}

} // namespace

PythonEngine::PythonEngine(PythonEngineOptions options)
    : options_(std::move(options)),
      initialized_(false),
      pid_(-1),
      channel_fd_(-1),
      stderr_fd_(-1),
      request_counter_(0) {}

PythonEngine::~PythonEngine() {
    dispose();
}

// ============================================================================
// Worker process management
// ============================================================================

void PythonEngine::spawn_worker() {
    std::string interpreter = resolve_executable(options_.interpreter);
    if (interpreter.empty()) {
        throw EngineLoadError("Python interpreter '" + options_.interpreter + "' not found");
    }

    json config;
    config["policy"] = policy_->to_json();
    config["defaultPackages"] = options_.default_packages;
    config["maxCaptureBytes"] = options_.max_capture_bytes;
    std::string config_arg = config.dump();

    // Everything the child needs is prepared before fork()
    std::string mpl_dir = matplotlib_config_dir();
    const char* path_env = std::getenv("PATH");
    std::vector<std::string> env_strings = {
        std::string("PATH=") + (path_env ? path_env : "/usr/local/bin:/usr/bin:/bin"),
        "HOME=" + mpl_dir,
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8",
        "MPLBACKEND=Agg",
        "MPLCONFIGDIR=" + mpl_dir,
        "OPENBLAS_NUM_THREADS=1",
        "OMP_NUM_THREADS=1",
        "MKL_NUM_THREADS=1",
    };
    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(&entry[0]);
    }
    envp.push_back(nullptr);

    std::string script = bootstrap_script();
    std::vector<std::string> arg_strings = {interpreter, "-I", "-B", "-c", script, config_arg};
    std::vector<char*> argv;
    for (auto& arg : arg_strings) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    long open_max = sysconf(_SC_OPEN_MAX);
    int max_fd = open_max > 0 && open_max < 4096 ? static_cast<int>(open_max) : 4096;
    rlim_t memory_limit = static_cast<rlim_t>(options_.memory_limit_bytes);

    int channel[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, channel) < 0) {
        throw EngineLoadError(std::string("socketpair failed: ") + std::strerror(errno));
    }
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        int saved = errno;
        close(channel[0]);
        close(channel[1]);
        throw EngineLoadError(std::string("pipe failed: ") + std::strerror(saved));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int saved = errno;
        close(channel[0]);
        close(channel[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        throw EngineLoadError(std::string("fork failed: ") + std::strerror(saved));
    }

    if (pid == 0) {
        dup2(channel[1], STDIN_FILENO);
        dup2(channel[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        for (int fd = 3; fd < max_fd; ++fd) {
            close(fd);
        }
        setpgid(0, 0);

        if (memory_limit > 0) {
            set_limit(RLIMIT_AS, memory_limit);
        }
        set_limit(RLIMIT_CORE, 0);
        set_limit(RLIMIT_FSIZE, 16 * 1024 * 1024);
        set_limit(RLIMIT_NOFILE, 64);

        execve(argv[0], argv.data(), envp.data());
        _exit(127);
    }

    close(channel[1]);
    close(err_pipe[1]);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    channel_fd_ = channel[0];
    stderr_fd_ = err_pipe[0];
    read_buffer_.clear();
    stderr_tail_.clear();
    pid_ = pid;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.startup_timeout_ms);
    std::string line;
    try {
        if (!read_line(line, deadline)) {
            stop_worker(false);
            throw EngineLoadError("Python worker did not become ready within " +
                                  std::to_string(options_.startup_timeout_ms) + "ms");
        }
    } catch (const ExecutionError&) {
        // The worker exited during bootstrap
        pid_ = -1;
        std::string detail = describe_exit(reap_child(pid));
        stop_worker(false);
        throw EngineLoadError(detail);
    }

    json ready = json::parse(line, nullptr, false);
    std::string type = ready.is_object() ? ready.value("type", std::string()) : std::string();
    if (type != "ready") {
        std::string message = type == "error" ? ready.value("message", std::string("bootstrap failed"))
                                              : "unexpected bootstrap message: " + line.substr(0, 120);
        stop_worker(false);
        throw EngineLoadError(message);
    }

    loaded_packages_ = ready.value("loadedPackages", std::vector<std::string>());
    python_version_ = ready.value("pythonVersion", std::string());

    if (ready.contains("failedPackages") && ready["failedPackages"].is_object()) {
        for (const auto& item : ready["failedPackages"].items()) {
            Logger::get_instance().log_warning(
                LogContext("bootstrap", "python"),
                "Default package " + item.key() + " unavailable: " + item.value().get<std::string>()
            );
        }
    }
}

void PythonEngine::stop_worker(bool graceful) noexcept {
    pid_t pid = pid_.exchange(-1);

    if (pid > 0) {
        if (graceful && channel_fd_ >= 0) {
            std::string line = encode_line({{"type", "terminate"}, {"id", "shutdown"}});
            (void)send(channel_fd_, line.data(), line.size(), MSG_NOSIGNAL);

            for (int i = 0; i < 50; ++i) {
                if (waitpid(pid, nullptr, WNOHANG) == pid) {
                    pid = -1;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        if (pid > 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
        }
    }

    if (channel_fd_ >= 0) {
        close(channel_fd_);
        channel_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        close(stderr_fd_);
        stderr_fd_ = -1;
    }
    read_buffer_.clear();
}

bool PythonEngine::worker_alive() {
    pid_t pid = pid_.load();
    if (pid <= 0) {
        return false;
    }
    int status = 0;
    pid_t result = waitpid(pid, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    Logger::get_instance().log_warning(LogContext("", "python"),
                                       "Python worker exited: " + describe_exit(status));
    pid_ = -1;
    stop_worker(false);
    return false;
}

void PythonEngine::ensure_worker() {
    if (!initialized_) {
        throw ExecutionError("python engine not initialized");
    }
    if (!worker_alive()) {
        Logger::get_instance().log_warning(LogContext("", "python"), "Respawning Python worker");
        try {
            spawn_worker();
        } catch (const EngineLoadError& e) {
            throw ExecutionError(std::string("could not respawn Python worker: ") + e.what());
        }
    }
}

std::string PythonEngine::describe_exit(int status) const {
    std::string detail;
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        detail = code == 127 ? "Python interpreter '" + options_.interpreter + "' could not be started"
                             : "Python worker exited with status " + std::to_string(code);
    } else if (WIFSIGNALED(status)) {
        detail = "Python worker killed by signal " + std::to_string(WTERMSIG(status));
    } else {
        detail = "Python worker stopped";
    }
    if (!stderr_tail_.empty()) {
        detail += ": " + stderr_tail_;
    }
    return detail;
}

// ============================================================================
// Channel I/O
// ============================================================================

void PythonEngine::send_message(const json& message) {
    std::string line = encode_line(message);
    size_t sent = 0;
    while (sent < line.size()) {
        ssize_t n = send(channel_fd_, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ExecutionError(std::string("could not write to Python worker: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

bool PythonEngine::read_line(std::string& line, std::chrono::steady_clock::time_point deadline) {
    char buffer[65536];

    while (true) {
        size_t newline = read_buffer_.find('\n');
        if (newline != std::string::npos) {
            line = read_buffer_.substr(0, newline);
            read_buffer_.erase(0, newline + 1);
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()
        ).count();
        if (remaining <= 0) {
            return false;
        }

        struct pollfd fds[2];
        fds[0].fd = channel_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = stderr_fd_;
        fds[1].events = POLLIN;
        int ready = poll(fds, 2, static_cast<int>(std::min<long long>(remaining, 100)));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw ExecutionError(std::string("poll failed: ") + std::strerror(errno));
        }

        if (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                stderr_tail_.append(buffer, static_cast<size_t>(n));
                if (stderr_tail_.size() > kStderrTailBytes) {
                    stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
                }
            } else if (n == 0) {
                // poll() skips negative descriptors
                close(stderr_fd_);
                stderr_fd_ = -1;
            }
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t n = read(channel_fd_, buffer, sizeof(buffer));
            if (n > 0) {
                read_buffer_.append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                throw ExecutionError("Python worker closed the channel");
            }
        }
    }
}

bool PythonEngine::await_event(const std::string& id, std::chrono::steady_clock::time_point deadline,
                               json& message) {
    std::string line;
    while (read_line(line, deadline)) {
        if (line.empty()) {
            continue;
        }
        message = decode_line(line);
        if (message.value("id", std::string()) != id) {
            continue;  // stale reply to an abandoned request
        }
        if (message.value("type", std::string()) == "progress") {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (progress_callback_) {
                progress_callback_(message.value("text", std::string()));
            }
            continue;
        }
        return true;
    }
    return false;
}

std::string PythonEngine::next_id(const char* prefix) {
    return std::string(prefix) + "-" + std::to_string(++request_counter_);
}

// ============================================================================
// ILanguageEngine
// ============================================================================

void PythonEngine::initialize(const SecurityPolicy& policy) {
    if (initialized_) {
        return;
    }
    policy_ = std::make_unique<SecurityPolicy>(policy);
    spawn_worker();
    initialized_ = true;
}

EngineOutput PythonEngine::execute(const std::string& code, const ExecutionOptions& options) {
    ensure_worker();

    auto start = std::chrono::steady_clock::now();
    std::string id = options.execution_id.empty() ? next_id("exec") : options.execution_id;
    send_message(to_json(ContextCommand::execute(id, code, options.timeout_ms)));

    auto deadline = start + std::chrono::milliseconds(options.timeout_ms + options_.watchdog_grace_ms);
    json message;
    bool answered = false;
    try {
        answered = await_event(id, deadline, message);
    } catch (const ExecutionError&) {
        int status = 0;
        pid_t pid = pid_.exchange(-1);
        if (pid > 0) {
            status = reap_child(pid);
        }
        std::string detail = describe_exit(status);
        stop_worker(false);
        throw ExecutionError(detail);
    }

    if (!answered) {
        // Stuck in native code where the asynchronous timeout cannot reach it
        stop_worker(false);
        EngineOutput output;
        output.success = false;
        output.error = "TimeoutError: Execution timed out after " + std::to_string(options.timeout_ms) + "ms";
        output.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start
        ).count();
        output.metadata["workerKilled"] = true;
        return output;
    }

    ContextEvent event = event_from_json(message);
    if (event.type == EventType::ERROR) {
        throw ExecutionError(event.error);
    }

    EngineOutput output;
    output.success = event.success;
    output.stdout_text = event.output;
    output.error = event.error;
    output.artifacts = event.artifacts;
    output.duration_ms = event.duration_ms;
    output.memory_bytes = event.memory_bytes;
    output.metadata = event.metadata;
    if (output.metadata.contains("stderr")) {
        output.stderr_text = output.metadata["stderr"].get<std::string>();
        output.metadata.erase("stderr");
    }
    return output;
}

std::vector<std::string> PythonEngine::install_dependencies(const std::vector<std::string>& dependencies) {
    ensure_worker();

    std::string id = next_id("deps");
    send_message(to_json(ContextCommand::install_dependencies(id, dependencies)));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.startup_timeout_ms);
    json message;
    if (!await_event(id, deadline, message)) {
        stop_worker(false);
        throw ExecutionError("dependency installation timed out");
    }

    ContextEvent event = event_from_json(message);
    if (event.type == EventType::ERROR) {
        throw ExecutionError(event.error);
    }
    for (const auto& name : event.installed) {
        if (std::find(loaded_packages_.begin(), loaded_packages_.end(), name) == loaded_packages_.end()) {
            loaded_packages_.push_back(name);
        }
    }
    return event.installed;
}

std::vector<std::string> PythonEngine::validate_syntax(const std::string& code) {
    ensure_worker();

    std::string id = next_id("validate");
    send_message({{"type", "validate"}, {"id", id}, {"code", code}});

    json message;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    if (!await_event(id, deadline, message)) {
        throw ExecutionError("syntax check timed out");
    }
    if (message.value("success", false)) {
        return {};
    }
    return {message.value("error", std::string("invalid syntax"))};
}

void PythonEngine::interrupt() noexcept {
    pid_t pid = pid_.load();
    if (pid > 0) {
        kill(pid, SIGKILL);
    }
}

void PythonEngine::set_progress_callback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    progress_callback_ = std::move(callback);
}

void PythonEngine::dispose() noexcept {
    stop_worker(true);
    initialized_ = false;
}

} // namespace liverun
