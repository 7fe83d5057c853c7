#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace ptndle::parallel {
    template <typename Func, typename... Args>
    concept VoidCallable = std::is_invocable_r_v<void, Func, Args...>;

    /*
    Runs every pushed task on its own thread. The first exception a task throws is kept and
    rethrown by wait() once all workers have joined.
    */
    class TaskQueue {
        std::vector<std::thread> workers;
        std::exception_ptr failure;
        std::mutex failureMutex;

        void joinAll() noexcept {
            for (auto& worker : workers) {
                if (worker.joinable()) worker.join();
            }
            workers.clear();
        }

    public:
        explicit TaskQueue(std::size_t numWorkers) {
            workers.reserve(numWorkers);
        }
        TaskQueue(const TaskQueue&) = delete;
        TaskQueue& operator=(const TaskQueue&) = delete;
        ~TaskQueue() { joinAll(); }

        template <typename Func, typename... Args>
            requires VoidCallable<Func, Args...>
        void push(Func&& func, Args&&... args) {
            workers.emplace_back([this, task = std::bind_front(std::forward<Func>(func), std::forward<Args>(args)...)]() mutable {
                try {
                    task();
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failureMutex);
                    if (!failure) failure = std::current_exception();
                }
            });
        }

        // Blocks until every task finishes, then rethrows the first failure
        void wait() {
            joinAll();
            if (failure) std::rethrow_exception(std::exchange(failure, nullptr));
        }
    };
}
