/**
 * @file engine_loader.cpp
 * @brief Implementation of EngineLoader
 */

#include "engine_loader.hpp"
#include <algorithm>
#include <chrono>

namespace liverun {

EngineLoader::EngineLoader(const EngineFactory& factory, const SandboxConfig& config, Logger* logger)
    : factory_(factory),
      config_(config),
      policy_(config.security.build_policy()),
      logger_(logger ? logger : &Logger::get_instance()),
      cache_(config.cache.max_size_bytes, std::chrono::milliseconds(config.cache.default_ttl_ms)),
      load_failures_(0),
      shared_loads_(0),
      sweeper_stop_(false) {

    Logger* log = logger_;
    cache_.set_eviction_listener(
        [log](const std::string& key, const EngineHandle&, const std::string& reason, size_t size_bytes) {
            log->log_cache_eviction(key, reason, size_bytes);
        });
    // A context with work queued or running stays cached under budget pressure
    cache_.set_pin_predicate([](const EngineHandle& handle) {
        return handle->pending() > 0;
    });
}

EngineLoader::~EngineLoader() {
    stop_sweeper();
    wait_background_loads();
    clear();
}

EngineHandle EngineLoader::load_engine(const std::string& language) {
    return begin_load(language, false).get();
}

EngineHandle EngineLoader::load_engine(const std::string& language, std::chrono::milliseconds max_wait) {
    std::shared_future<EngineHandle> load = begin_load(language, true);
    if (load.wait_for(max_wait) == std::future_status::timeout) {
        throw EngineLoadError("Engine '" + language + "' did not load within " +
                              std::to_string(max_wait.count()) + "ms");
    }
    return load.get();
}

std::shared_future<EngineHandle> EngineLoader::begin_load(const std::string& language, bool in_background) {
    auto promise = std::make_shared<std::promise<EngineHandle>>();
    std::shared_future<EngineHandle> load = promise->get_future().share();

    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (auto hit = cache_.get(language)) {
            EngineHandle handle = *hit;
            if (handle->is_usable()) {
                promise->set_value(handle);
                return load;
            }
            // Terminated behind our back; reload
            cache_.remove_if(language, [&handle](const EngineHandle& cached) {
                return cached == handle;
            });
        }

        auto it = in_flight_.find(language);
        if (it != in_flight_.end()) {
            shared_loads_++;
            return it->second;
        }

        in_flight_[language] = load;

        if (in_background) {
            // Finished loads are reaped here; the destructor waits for the rest
            background_loads_.erase(
                std::remove_if(background_loads_.begin(), background_loads_.end(),
                               [](const std::future<void>& pending) {
                                   return pending.wait_for(std::chrono::seconds(0)) ==
                                          std::future_status::ready;
                               }),
                background_loads_.end());
            background_loads_.push_back(std::async(std::launch::async, [this, language, promise]() {
                complete_load(language, *promise);
            }));
            return load;
        }
    }

    complete_load(language, *promise);
    return load;
}

void EngineLoader::complete_load(const std::string& language, std::promise<EngineHandle>& promise) {
    EngineHandle handle;
    try {
        handle = bootstrap(language);
    } catch (const EngineLoadError&) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(language);
            load_failures_++;
        }
        promise.set_exception(std::current_exception());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.set(language, handle, std::chrono::milliseconds(config_.cache.default_ttl_ms),
                   handle->get_info().approx_footprint_bytes);
        load_counts_[language]++;
        in_flight_.erase(language);
    }
    promise.set_value(handle);
}

void EngineLoader::wait_background_loads() {
    std::vector<std::future<void>> loads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loads.swap(background_loads_);
    }
    for (auto& load : loads) {
        load.wait();
    }
}

EngineHandle EngineLoader::bootstrap(const std::string& language) {
    auto start_time = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start_time]() {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_time).count();
    };

    try {
        auto context = std::make_shared<IsolatedExecutionContext>(
            factory_.create_engine(language), policy_, logger_);
        context->initialize();
        logger_->log_engine_load(language, context->get_info(), elapsed_ms(), true);
        return context;
    } catch (const EngineLoadError& e) {
        logger_->log_engine_load(language, EngineInfo("", "", language), elapsed_ms(), false, e.what());
        throw;
    } catch (const std::exception& e) {
        logger_->log_engine_load(language, EngineInfo("", "", language), elapsed_ms(), false, e.what());
        throw EngineLoadError(e.what());
    }
}

std::map<std::string, std::string> EngineLoader::preload(const std::vector<std::string>& languages) {
    std::vector<std::pair<std::string, std::future<void>>> loads;
    for (const auto& language : languages) {
        loads.emplace_back(language, std::async(std::launch::async, [this, language]() {
            load_engine(language);
        }));
    }

    std::map<std::string, std::string> failures;
    for (auto& load : loads) {
        try {
            load.second.get();
        } catch (const std::exception& e) {
            failures[load.first] = e.what();
            logger_->log_warning(LogContext("", load.first),
                                 std::string("Preload failed: ") + e.what());
        }
    }
    return failures;
}

bool EngineLoader::invalidate(const std::string& language, const EngineHandle& handle) {
    if (!handle) {
        return cache_.remove(language);
    }
    return cache_.remove_if(language, [&handle](const EngineHandle& cached) {
        return cached == handle;
    });
}

size_t EngineLoader::sweep() {
    return cache_.sweep();
}

void EngineLoader::start_sweeper() {
    if (config_.cache.sweep_interval_ms == 0 || sweeper_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = false;
    }
    sweeper_ = std::thread(&EngineLoader::sweeper_loop, this);
}

void EngineLoader::stop_sweeper() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        sweeper_stop_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

void EngineLoader::sweeper_loop() {
    const auto interval = std::chrono::milliseconds(config_.cache.sweep_interval_ms);
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!sweeper_cv_.wait_for(lock, interval, [this]() { return sweeper_stop_; })) {
        lock.unlock();
        sweep();
        lock.lock();
    }
}

EngineHandle EngineLoader::peek(const std::string& language) {
    if (auto hit = cache_.get(language)) {
        return *hit;
    }
    return nullptr;
}

bool EngineLoader::is_loaded(const std::string& language) const {
    return cache_.contains(language);
}

std::vector<std::string> EngineLoader::loaded_languages() const {
    return cache_.keys();
}

size_t EngineLoader::load_count(const std::string& language) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = load_counts_.find(language);
    return it == load_counts_.end() ? 0 : it->second;
}

LoaderStats EngineLoader::get_stats() const {
    LoaderStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : load_counts_) {
            stats.loads += pair.second;
        }
        stats.load_failures = load_failures_;
        stats.shared_loads = shared_loads_;
    }
    stats.cached_engines = cache_.size();
    stats.cache_size_bytes = cache_.total_size_bytes();
    stats.cache = cache_.get_stats();
    return stats;
}

void EngineLoader::clear() {
    cache_.clear();
}

} // namespace liverun
