/**
 * @file engine_loader.hpp
 * @brief Lazy, de-duplicated loading of engine contexts with TTL caching
 *
 * The EngineLoader is the only component that creates and caches execution
 * contexts. A cache hit returns the hot handle; a miss bootstraps a new
 * context exactly once even when many callers ask for the same language at
 * the same time (they share one in-flight future).
 */

#ifndef LIVERUN_ENGINE_LOADER_HPP
#define LIVERUN_ENGINE_LOADER_HPP

#include "engine_factory.hpp"
#include "execution_context.hpp"
#include "logger.hpp"
#include "sandbox_config.hpp"
#include "ttl_cache.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace liverun {

/**
 * @brief Loader statistics
 */
struct LoaderStats {
    size_t loads;             ///< Successful bootstraps
    size_t load_failures;     ///< Failed bootstraps
    size_t shared_loads;      ///< Callers that joined an in-flight load
    size_t cached_engines;    ///< Entries currently cached
    size_t cache_size_bytes;  ///< Budget in use
    CacheStats cache;

    LoaderStats()
        : loads(0), load_failures(0), shared_loads(0), cached_engines(0), cache_size_bytes(0) {}
};

/**
 * @brief Engine cache and loader
 *
 * Usage Example:
 *   @code
 *   EngineFactory factory(config);
 *   EngineLoader loader(factory, config);
 *   loader.preload(config.cache.preload);
 *   loader.start_sweeper();
 *
 *   EngineHandle handle = loader.load_engine("python");
 *   @endcode
 */
class EngineLoader {
public:
    /**
     * @brief Constructor
     *
     * @param factory Engine factory (must outlive the loader)
     * @param config Sandbox configuration (cache budget, ttl, security policy)
     * @param logger Logger instance (optional, uses default if nullptr)
     */
    EngineLoader(const EngineFactory& factory, const SandboxConfig& config, Logger* logger = nullptr);

    /**
     * @brief Destructor - stops the sweeper and drops cached contexts
     */
    ~EngineLoader();

    EngineLoader(const EngineLoader&) = delete;
    EngineLoader& operator=(const EngineLoader&) = delete;

    /**
     * @brief Get a ready context for a language
     *
     * Idempotent while cached. Concurrent calls for the same language share
     * one bootstrap.
     *
     * @throws EngineLoadError If the runtime fails to bootstrap
     */
    EngineHandle load_engine(const std::string& language);

    /**
     * @brief Get a ready context, waiting at most max_wait for a bootstrap
     *
     * The bootstrap runs on a loader thread. When the wait runs out it keeps
     * going and its context is cached for later requests.
     *
     * @throws EngineLoadError If the runtime fails to bootstrap or is not
     *         ready within max_wait
     */
    EngineHandle load_engine(const std::string& language, std::chrono::milliseconds max_wait);

    /**
     * @brief Load languages ahead of the first request
     *
     * Failures are logged, never thrown.
     *
     * @return Map of language -> error message for languages that failed
     */
    std::map<std::string, std::string> preload(const std::vector<std::string>& languages);

    /**
     * @brief Drop the cached context for a language
     *
     * @param language Language id
     * @param handle When set, only drop the entry if it still holds this
     *               handle (a newer context is left alone)
     * @return True if an entry was removed
     */
    bool invalidate(const std::string& language, const EngineHandle& handle = nullptr);

    /**
     * @brief Remove expired entries now
     * @return Number of entries removed
     */
    size_t sweep();

    /**
     * @brief Start the periodic sweep (no-op if sweep_interval_ms is 0)
     */
    void start_sweeper();

    void stop_sweeper();

    /**
     * @brief Cached handle for a language without loading (nullptr if none)
     */
    EngineHandle peek(const std::string& language);

    bool is_loaded(const std::string& language) const;

    std::vector<std::string> loaded_languages() const;

    /**
     * @brief Number of successful bootstraps of a language
     */
    size_t load_count(const std::string& language) const;

    LoaderStats get_stats() const;

    void clear();

private:
    const EngineFactory& factory_;
    SandboxConfig config_;
    SecurityPolicy policy_;
    Logger* logger_;

    TtlCache<EngineHandle> cache_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_future<EngineHandle>> in_flight_;
    std::map<std::string, size_t> load_counts_;
    size_t load_failures_;
    size_t shared_loads_;

    std::vector<std::future<void>> background_loads_;

    std::thread sweeper_;
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_;

    std::shared_future<EngineHandle> begin_load(const std::string& language, bool in_background);
    void complete_load(const std::string& language, std::promise<EngineHandle>& promise);
    void wait_background_loads();
    EngineHandle bootstrap(const std::string& language);
    void sweeper_loop();
};

} // namespace liverun

#endif // LIVERUN_ENGINE_LOADER_HPP
