#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace devmux {
namespace core {

/**
 * @brief Execution context on which user-facing callbacks are delivered.
 *
 * Channels may complete on any thread; an aggregate posts every observer call
 * through its dispatcher so application code sees them on one context.
 */
class CallbackDispatcher {
public:
    using Task = std::function<void()>;

    virtual ~CallbackDispatcher() = default;

    virtual void post(Task task) = 0;
};

/**
 * @brief Runs every task inline on the posting thread.
 */
class ImmediateDispatcher : public CallbackDispatcher {
public:
    void post(Task task) override;
};

/**
 * @brief Runs tasks in FIFO order on a single worker thread.
 *
 * Tasks still queued at destruction are run before the worker exits.
 */
class SerialDispatcher : public CallbackDispatcher {
public:
    SerialDispatcher();
    ~SerialDispatcher() override;

    // Non-copyable
    SerialDispatcher(const SerialDispatcher&) = delete;
    SerialDispatcher& operator=(const SerialDispatcher&) = delete;

    void post(Task task) override;

    /**
     * @brief Blocks until every task posted so far has run.
     *
     * Returns immediately when called from a task running on this dispatcher.
     */
    void flush();

    /**
     * @brief True when called from the worker thread.
     */
    bool isWorkerThread() const;

private:
    void run();

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
    std::deque<Task> tasks_;
    bool running_{false};
    bool stopping_{false};
    std::thread worker_;
};

/**
 * @brief Shared ImmediateDispatcher used when no dispatcher is supplied.
 */
std::shared_ptr<CallbackDispatcher> immediateDispatcher();

} // namespace core
} // namespace devmux
