//
// Fixed-size worker pool
//

#ifndef SHARDSTREAM_TASKEXECUTOR_HPP
#define SHARDSTREAM_TASKEXECUTOR_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace shardstream {
    /**
     * @brief runs posted tasks in FIFO order on a fixed number of worker threads.
     *
     * Tasks still queued when shutdown() is called are run before the workers exit.
     * Posting after shutdown() is rejected with std::logic_error.
     * shutdown() must not be called from one of the pool's own tasks.
     */
    class TaskExecutor {
    public:
        explicit TaskExecutor(int size):
            _isRunning(true)
        {
            for (int i = 0; i < size; i++) {
                _workers.emplace_back(&TaskExecutor::workerLoop, this);
            }
        }

        ~TaskExecutor() {
            shutdown();
        }

        TaskExecutor(const TaskExecutor &) = delete;
        TaskExecutor &operator=(const TaskExecutor &) = delete;

        template <typename T>
        std::shared_ptr<std::promise<T>> post(std::function<T()> workerFn) {
            auto promise = std::make_shared<std::promise<T>>();

            {
                std::lock_guard lockGuard(_mutex);
                if (!_isRunning) {
                    throw std::logic_error("TaskExecutor: post() after shutdown()");
                }

                auto wrapperFn = [workerFn = std::move(workerFn), promise]() {
                    try {
                        if constexpr (std::is_void_v<T>) {
                            workerFn();
                            promise->set_value();
                        } else {
                            promise->set_value(workerFn());
                        }
                    } catch (...) {
                        // handed to whoever waits on the future
                        promise->set_exception(std::current_exception());
                    }
                };
                _tasks.push(wrapperFn);
            }
            _condvar.notify_one();

            return promise;
        }

        void shutdown() {
            {
                std::lock_guard lockGuard(_mutex);
                if (!_isRunning) {
                    return;
                }
                _isRunning = false;
            }
            _condvar.notify_all();

            for (auto &worker: _workers) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

    private:
        void workerLoop() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock lock(_mutex);
                    _condvar.wait(lock, [this] { return !_tasks.empty() || !_isRunning; });

                    if (!_isRunning && _tasks.empty()) {
                        return;
                    }

                    task = std::move(_tasks.front());
                    _tasks.pop();
                }
                task();
            }
        }

        bool _isRunning;

        std::queue<std::function<void()>> _tasks;
        std::vector<std::thread> _workers;
        std::mutex _mutex;
        std::condition_variable _condvar;
    };
}

#endif // SHARDSTREAM_TASKEXECUTOR_HPP
