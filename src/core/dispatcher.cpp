#include "devmux/core/dispatcher.h"
#include "devmux/utils/logging.hpp"
#include <exception>

namespace devmux {
namespace core {

namespace {

void runTask(const CallbackDispatcher::Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        DEVMUX_LOG_ERROR("Dispatched callback threw: {}", e.what());
    } catch (...) {
        DEVMUX_LOG_ERROR("Dispatched callback threw a non-standard exception");
    }
}

} // namespace

void ImmediateDispatcher::post(Task task) {
    if (task) {
        runTask(task);
    }
}

SerialDispatcher::SerialDispatcher() {
    worker_ = std::thread([this]() { run(); });
}

SerialDispatcher::~SerialDispatcher() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    workAvailable_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SerialDispatcher::post(Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    workAvailable_.notify_one();
}

void SerialDispatcher::flush() {
    // The running task would wait on itself
    if (isWorkerThread()) {
        DEVMUX_LOG_WARN("flush() called from the dispatcher's own worker, ignoring");
        return;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return tasks_.empty() && !running_; });
}

bool SerialDispatcher::isWorkerThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialDispatcher::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        workAvailable_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) {
            // stopping_ with nothing left to drain
            break;
        }

        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        running_ = true;
        lock.unlock();

        runTask(task);
        // Release captured state before flush() can observe the queue idle
        task = nullptr;

        lock.lock();
        running_ = false;
        if (tasks_.empty()) {
            idle_.notify_all();
        }
    }
    idle_.notify_all();
}

std::shared_ptr<CallbackDispatcher> immediateDispatcher() {
    static std::shared_ptr<CallbackDispatcher> instance = std::make_shared<ImmediateDispatcher>();
    return instance;
}

} // namespace core
} // namespace devmux
