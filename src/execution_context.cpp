/**
 * @file execution_context.cpp
 * @brief Implementation of IsolatedExecutionContext
 */

#include "execution_context.hpp"
#include <stdexcept>

namespace liverun {

namespace {

const char* const kTerminatedMessage = "Execution context terminated";

std::future<ContextEvent> ready_event(ContextEvent event) {
    std::promise<ContextEvent> promise;
    promise.set_value(std::move(event));
    return promise.get_future();
}

} // anonymous namespace

IsolatedExecutionContext::IsolatedExecutionContext(
    std::unique_ptr<ILanguageEngine> engine,
    const SecurityPolicy& policy,
    Logger* logger
)
    : shared_(std::make_shared<Shared>()),
      policy_(policy),
      info_(engine ? engine->get_info() : EngineInfo("", "", "")),
      load_time_ms_(0.0) {

    if (!engine) {
        throw std::invalid_argument("IsolatedExecutionContext: engine cannot be null");
    }

    shared_->engine = std::move(engine);
    shared_->logger = logger ? logger : &Logger::get_instance();
}

IsolatedExecutionContext::~IsolatedExecutionContext() {
    terminate();
}

void IsolatedExecutionContext::initialize() {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->state != ContextState::UNINITIALIZED) {
            throw std::runtime_error("Context already initialized. Current state: " +
                                    state_to_string(shared_->state));
        }
        transition(*shared_, ContextState::LOADING_RUNTIME);
    }

    auto start_time = std::chrono::steady_clock::now();

    try {
        shared_->engine->initialize(policy_);
    } catch (const EngineLoadError&) {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        transition(*shared_, ContextState::FAILED);
        throw;
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        transition(*shared_, ContextState::FAILED);
        throw EngineLoadError(e.what());
    }

    load_time_ms_ = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_time).count();
    loaded_at_ = std::chrono::steady_clock::now();

    // Progress lines are attributed to the command in flight
    std::weak_ptr<Shared> weak = shared_;
    shared_->engine->set_progress_callback([weak](const std::string& text) {
        auto shared = weak.lock();
        if (!shared) {
            return;
        }
        std::string id;
        ProgressListener listener;
        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            if (!shared->current) {
                return;
            }
            id = shared->current->command.id;
            listener = shared->progress_listener;
        }
        if (listener) {
            listener(ContextEvent::progress(id, text));
        }
    });

    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->state != ContextState::LOADING_RUNTIME) {
        throw EngineLoadError("context terminated during bootstrap");
    }
    worker_ = std::thread(&IsolatedExecutionContext::worker_loop, shared_);
    transition(*shared_, ContextState::READY);
}

std::future<ContextEvent> IsolatedExecutionContext::post(const ContextCommand& command) {
    if (command.type == CommandType::TERMINATE) {
        terminate();
        return ready_event(ContextEvent::failure(command.id, kTerminatedMessage, true));
    }

    auto task = std::make_shared<Task>();
    task->kind = TaskKind::COMMAND;
    task->command = command;
    return enqueue(std::move(task));
}

std::future<ContextEvent> IsolatedExecutionContext::validate(const std::string& id,
                                                             const std::string& code) {
    auto task = std::make_shared<Task>();
    task->kind = TaskKind::VALIDATE;
    task->command.id = id;
    task->command.code = code;
    return enqueue(std::move(task));
}

std::future<ContextEvent> IsolatedExecutionContext::enqueue(std::shared_ptr<Task> task) {
    std::future<ContextEvent> future = task->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->state == ContextState::TERMINATED) {
            settle(*task, ContextEvent::failure(task->command.id, kTerminatedMessage, true));
            return future;
        }
        if (shared_->state != ContextState::READY && shared_->state != ContextState::EXECUTING) {
            settle(*task, ContextEvent::failure(task->command.id,
                "Execution context not ready. Current state: " + state_to_string(shared_->state)));
            return future;
        }
        shared_->queue.push_back(std::move(task));
    }

    shared_->cv.notify_one();
    return future;
}

void IsolatedExecutionContext::terminate() noexcept {
    std::shared_ptr<Task> current;

    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->stop) {
            return;
        }
        if (shared_->state != ContextState::FAILED) {
            transition(*shared_, ContextState::TERMINATED);
        }
        shared_->stop = true;

        for (auto& task : shared_->queue) {
            settle(*task, ContextEvent::failure(task->command.id, kTerminatedMessage, true));
        }
        shared_->queue.clear();

        current = shared_->current;
        if (current) {
            settle(*current, ContextEvent::failure(current->command.id, kTerminatedMessage, true));
        }
    }
    shared_->cv.notify_all();

    if (current) {
        shared_->engine->interrupt();
    }

    if (worker_.joinable()) {
        if (current) {
            // The call in flight may never return; the worker owns the engine from here
            worker_.detach();
        } else {
            worker_.join();
        }
    } else {
        shared_->engine->dispose();
    }
}

bool IsolatedExecutionContext::has_command(const std::string& id) const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->current && shared_->current->command.id == id) {
        return true;
    }
    for (const auto& task : shared_->queue) {
        if (task->command.id == id) {
            return true;
        }
    }
    return false;
}

bool IsolatedExecutionContext::is_running(const std::string& id) const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->current && shared_->current->command.id == id;
}

bool IsolatedExecutionContext::cancel_queued(const std::string& id) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    for (auto it = shared_->queue.begin(); it != shared_->queue.end(); ++it) {
        if ((*it)->command.id == id) {
            settle(**it, ContextEvent::failure(id, "Command cancelled before it started"));
            shared_->queue.erase(it);
            return true;
        }
    }
    return false;
}

void IsolatedExecutionContext::set_progress_listener(ProgressListener listener) {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->progress_listener = std::move(listener);
}

ContextState IsolatedExecutionContext::get_state() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->state;
}

bool IsolatedExecutionContext::is_usable() const {
    ContextState state = get_state();
    return state == ContextState::READY || state == ContextState::EXECUTING;
}

size_t IsolatedExecutionContext::pending() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->queue.size() + (shared_->current ? 1 : 0);
}

ContextStats IsolatedExecutionContext::get_stats() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->stats;
}

// ============================================================================
// Worker
// ============================================================================

void IsolatedExecutionContext::worker_loop(std::shared_ptr<Shared> shared) {
    for (;;) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(shared->mutex);
            shared->cv.wait(lock, [&shared]() {
                return shared->stop || !shared->queue.empty();
            });
            if (shared->stop) {
                break;
            }
            task = shared->queue.front();
            shared->queue.pop_front();
            shared->current = task;
            transition(*shared, ContextState::EXECUTING);
        }

        auto start_time = std::chrono::steady_clock::now();
        ContextEvent event = run_task(*shared, *task);
        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_time).count();

        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->stats.commands_processed++;
        shared->stats.busy_time_ms += elapsed_ms;
        if (event.type == EventType::ERROR || (event.type == EventType::RESULT && !event.success)) {
            shared->stats.failed_commands++;
        }
        settle(*task, std::move(event));
        shared->current.reset();
        if (shared->state == ContextState::EXECUTING) {
            transition(*shared, ContextState::READY);
        }
    }

    shared->engine->dispose();
}

ContextEvent IsolatedExecutionContext::run_task(Shared& shared, const Task& task) {
    const ContextCommand& command = task.command;
    ILanguageEngine& engine = *shared.engine;

    try {
        if (task.kind == TaskKind::VALIDATE) {
            std::vector<std::string> problems = engine.validate_syntax(command.code);
            EngineOutput output;
            output.success = problems.empty();
            for (const auto& problem : problems) {
                if (!output.error.empty()) output.error += "\n";
                output.error += problem;
            }
            output.metadata["problems"] = problems;
            return ContextEvent::result(command.id, output);
        }

        switch (command.type) {
            case CommandType::EXECUTE: {
                ExecutionOptions options;
                options.execution_id = command.id;
                options.timeout_ms = command.timeout_ms;
                return ContextEvent::result(command.id, engine.execute(command.code, options));
            }
            case CommandType::INSTALL_DEPENDENCIES:
                return ContextEvent::dependencies_installed(
                    command.id, engine.install_dependencies(command.dependencies));
            default:
                return ContextEvent::failure(command.id,
                    "Unsupported command: " + command_type_to_string(command.type));
        }
    } catch (const SandboxError& e) {
        return ContextEvent::failure(command.id, e.what());
    } catch (const std::exception& e) {
        return ContextEvent::failure(command.id, std::string("Unexpected engine error: ") + e.what());
    }
}

void IsolatedExecutionContext::transition(Shared& shared, ContextState new_state) {
    ContextState old_state = shared.state;
    shared.state = new_state;
    if (shared.logger && shared.engine) {
        shared.logger->log_state_transition(
            LogContext(shared.current ? shared.current->command.id : "",
                       shared.engine->get_info().language),
            old_state, new_state);
    }
}

void IsolatedExecutionContext::settle(Task& task, ContextEvent event) {
    if (task.settled) {
        return;
    }
    task.settled = true;
    task.promise.set_value(std::move(event));
}

} // namespace liverun
