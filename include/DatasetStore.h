#pragma once

#include "DatasetLoader.h"
#include "NetworkRecord.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>

/**
 * @brief Owns the published network snapshot.
 * @details Readers take a shared_ptr copy and keep using it for as long as they
 * like; a reload builds the next collection off to the side and publishes it
 * with one pointer swap, so no reader ever sees a half-built collection.
 */
class DatasetStore {
public:
    DatasetStore();

    NetworkSnapshot snapshot() const;

    /**
     * @brief Loads `path` and publishes the result.
     * @post On a source-level failure (unavailable/malformed) the previously
     *       published snapshot is kept; the diagnostic is returned either way.
     */
    LoadResult reload(const std::string& path);

    // Publishes an already built collection; null is treated as empty.
    void publish(NetworkSnapshot records);

    uint64_t generation() const noexcept;

private:
    mutable std::shared_mutex mutex_;
    NetworkSnapshot current_;
    uint64_t generation_ = 0;
};

/**
 * @brief Re-runs a reload task on a fixed interval until stopped.
 * @details A task that throws is logged and retried on the next tick.
 */
class PeriodicReloader {
public:
    using Task = std::function<void()>;

    PeriodicReloader(DatasetStore& store, std::string path, std::chrono::seconds interval);
    PeriodicReloader(Task task, std::chrono::seconds interval);
    ~PeriodicReloader();

    PeriodicReloader(const PeriodicReloader&) = delete;
    PeriodicReloader& operator=(const PeriodicReloader&) = delete;

    void start();
    void stop();

private:
    void run();

    Task task_;
    std::chrono::seconds interval_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread worker_;
};
