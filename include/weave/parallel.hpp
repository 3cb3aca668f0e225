#pragma once

#include <weave/result.hpp>
#include <weave/log.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace weave {

// Log an exception captured on a worker thread
void log_exception(std::exception_ptr eptr) noexcept;

// Number of workers to use for a requested job count (0 = hardware threads)
size_t effective_jobs(size_t requested);

// Run fn over every element of rng on up to n_jobs threads.
// fn must not throw to signal ordinary failure; exceptions are collected,
// logged and turned into an error. Work already started is allowed to finish.
template <typename Range, typename Func>
Status parallel_run(Range&& rng, size_t n_jobs, Func&& fn) {
    std::mutex mut;

    auto       iter = std::begin(rng);
    const auto stop = std::end(rng);

    std::vector<std::exception_ptr> exceptions;

    auto run_one = [&]() {
        while (true) {
            std::unique_lock<std::mutex> lk{mut};
            if (!exceptions.empty()) {
                break;
            }
            if (iter == stop) {
                break;
            }
            auto&& item = *iter;
            ++iter;
            lk.unlock();
            try {
                fn(item);
            } catch (...) {
                lk.lock();
                exceptions.push_back(std::current_exception());
                break;
            }
        }
    };

    size_t workers = effective_jobs(n_jobs);
    if (workers <= 1) {
        run_one();
    } else {
        std::unique_lock<std::mutex> lk{mut};
        std::vector<std::thread> threads;
        std::generate_n(std::back_inserter(threads), workers,
                        [&] { return std::thread(run_one); });
        lk.unlock();
        for (auto& t : threads) {
            t.join();
        }
    }

    for (auto eptr : exceptions) {
        log_exception(eptr);
    }
    if (!exceptions.empty()) {
        return WeaveError{WeaveError::State,
            std::to_string(exceptions.size()) + " parallel task(s) failed"};
    }
    return ok_status();
}

// Queue of tasks that may enqueue further tasks while running.
// run() returns once the queue is empty and no task is in flight.
class WorkQueue {
public:
    using Task = std::function<void()>;

    explicit WorkQueue(size_t jobs);

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Safe to call from inside a running task
    void push(Task task);

    // Stop handing out queued tasks; in-flight tasks finish normally
    void cancel();

    Status run();

private:
    void worker();

    size_t jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    size_t in_flight_ = 0;
    bool cancelled_ = false;
    std::exception_ptr failure_;
};

} // namespace weave
