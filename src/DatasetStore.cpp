#include "DatasetStore.h"

#include <exception>
#include <iostream>
#include <memory>
#include <utility>

DatasetStore::DatasetStore() : current_(std::make_shared<const NetworkCollection>()) {}

NetworkSnapshot DatasetStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_;
}

void DatasetStore::publish(NetworkSnapshot records) {
    if (!records) {
        records = std::make_shared<const NetworkCollection>();
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    current_ = std::move(records);
    ++generation_;
}

uint64_t DatasetStore::generation() const noexcept {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return generation_;
}

LoadResult DatasetStore::reload(const std::string& path) {
    LoadResult result = DatasetLoader::loadFromFile(path);
    if (!result.ok()) {
        std::cerr << "[NetViz][Store] reload failed, keeping "
                  << snapshot()->size() << " network(s) from the previous snapshot\n";
        return result;
    }
    publish(result.records);
    std::cout << "[NetViz][Store] published generation=" << generation()
              << " networks=" << result.records->size()
              << " dropped=" << result.droppedCount << "\n";
    return result;
}

PeriodicReloader::PeriodicReloader(DatasetStore& store, std::string path, std::chrono::seconds interval)
    : PeriodicReloader([&store, path = std::move(path)] { store.reload(path); }, interval) {}

PeriodicReloader::PeriodicReloader(Task task, std::chrono::seconds interval)
    : task_(std::move(task)), interval_(interval) {}

PeriodicReloader::~PeriodicReloader() {
    stop();
}

void PeriodicReloader::start() {
    if (worker_.joinable() || !task_ || interval_.count() <= 0) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    worker_ = std::thread([this] { run(); });
}

void PeriodicReloader::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PeriodicReloader::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (wake_.wait_for(lock, interval_, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        try {
            task_();
        } catch (const std::exception& e) {
            std::cerr << "[NetViz][Store] periodic reload failed: " << e.what() << "\n";
        }
        lock.lock();
    }
}
