#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>

std::unique_ptr<tbb::global_control> ThreadPoolManager::limit_;
std::atomic<size_t> ThreadPoolManager::thread_count_{0};
std::mutex ThreadPoolManager::mutex_;

size_t ThreadPoolManager::defaultThreadCount()
{
    size_t hardware = std::thread::hardware_concurrency();
    return std::min(hardware == 0 ? size_t(4) : hardware, MAX_THREADS);
}

void ThreadPoolManager::installLimit(size_t num_threads)
{
    limit_.reset();
    limit_ = std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism, num_threads);
    thread_count_.store(num_threads);
}

void ThreadPoolManager::initialize(size_t num_threads)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_count_.load() > 0)
        return;

    size_t requested = num_threads == 0 ? defaultThreadCount() : num_threads;
    if (!inRange(requested))
    {
        Logger::error("Analysis thread count " + std::to_string(requested) + " is out of range, using " +
                      std::to_string(defaultThreadCount()));
        requested = defaultThreadCount();
    }

    installLimit(requested);
    Logger::info("Analysis limited to " + std::to_string(requested) + " threads");
}

void ThreadPoolManager::shutdown()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_count_.load() == 0)
        return;

    limit_.reset();
    thread_count_.store(0);
    Logger::debug("Analysis thread limit released");
}

bool ThreadPoolManager::resizeThreadPool(size_t new_num_threads)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_count_.load() == 0)
    {
        Logger::error("Thread limit cannot be resized before initialize()");
        return false;
    }
    if (!inRange(new_num_threads))
    {
        Logger::error("Rejected thread limit of " + std::to_string(new_num_threads));
        return false;
    }
    if (new_num_threads != thread_count_.load())
    {
        Logger::info("Thread limit " + std::to_string(thread_count_.load()) + " -> " + std::to_string(new_num_threads));
        installLimit(new_num_threads);
    }
    return true;
}

void ThreadPoolManager::processFiles(const std::vector<std::string> &files,
                                     const std::function<void(size_t, const std::string &)> &task)
{
    if (files.empty())
        return;

    if (!isInitialized())
        initialize(0);

    Logger::debug("Analyzing " + std::to_string(files.size()) + " files with up to " +
                  std::to_string(getCurrentThreadCount()) + " threads");

    tbb::parallel_for(tbb::blocked_range<size_t>(0, files.size()),
                      [&files, &task](const tbb::blocked_range<size_t> &range)
                      {
                          for (size_t i = range.begin(); i != range.end(); ++i)
                              task(i, files[i]);
                      });
}
