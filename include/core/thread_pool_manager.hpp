#pragma once

#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Bounds TBB parallelism for the analysis phase
 *
 * One tbb::global_control caps worker threads for the whole process.
 * processFiles() returns only after every task has run, which is the join
 * point between analysis and organization.
 */
class ThreadPoolManager
{
public:
    /**
     * @brief Install the parallelism limit; later calls are ignored until shutdown()
     * @param num_threads Worker count, 0 for one per hardware thread
     */
    static void initialize(size_t num_threads);

    static void shutdown();

    /**
     * @brief Replace the parallelism limit
     * @return false when not initialized or the count is outside 1..64
     */
    static bool resizeThreadPool(size_t new_num_threads);

    static size_t getCurrentThreadCount() { return thread_count_.load(); }
    static size_t getMaxAllowedThreadCount() { return MAX_THREADS; }
    static bool isInitialized() { return thread_count_.load() > 0; }

    /**
     * @brief Run task(index, path) for every entry and wait for all of them
     *
     * Tasks must only write state owned by their own index.
     */
    static void processFiles(const std::vector<std::string> &files,
                             const std::function<void(size_t, const std::string &)> &task);

    static size_t defaultThreadCount();

private:
    static constexpr size_t MAX_THREADS = 64;

    static bool inRange(size_t num_threads) { return num_threads >= 1 && num_threads <= MAX_THREADS; }
    static void installLimit(size_t num_threads);

    static std::unique_ptr<tbb::global_control> limit_;
    static std::atomic<size_t> thread_count_; // 0 while not initialized
    static std::mutex mutex_;
};
