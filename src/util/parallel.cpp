#include <weave/parallel.hpp>

namespace weave {

static std::string exception_message(std::exception_ptr eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception in worker";
    }
}

void log_exception(std::exception_ptr eptr) noexcept {
    log::error("%s", exception_message(eptr).c_str());
}

size_t effective_jobs(size_t requested) {
    if (requested > 0) return requested;
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

WorkQueue::WorkQueue(size_t jobs)
    : jobs_(effective_jobs(jobs)) {}

void WorkQueue::push(Task task) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (cancelled_) return;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void WorkQueue::cancel() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cancelled_ = true;
        tasks_.clear();
    }
    cv_.notify_all();
}

void WorkQueue::worker() {
    std::unique_lock<std::mutex> lk(mutex_);
    while (true) {
        cv_.wait(lk, [&] {
            return !tasks_.empty() || in_flight_ == 0 || cancelled_;
        });
        if (tasks_.empty()) {
            // Nothing queued and nobody left to queue more
            if (in_flight_ == 0 || cancelled_) break;
            continue;
        }

        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        ++in_flight_;
        lk.unlock();

        try {
            task();
        } catch (...) {
            lk.lock();
            if (!failure_) failure_ = std::current_exception();
            cancelled_ = true;
            tasks_.clear();
            lk.unlock();
        }

        lk.lock();
        --in_flight_;
        cv_.notify_all();
    }
    cv_.notify_all();
}

Status WorkQueue::run() {
    if (jobs_ <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(jobs_);
        for (size_t i = 0; i < jobs_; ++i) {
            threads.emplace_back([this] { worker(); });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    if (failure_) {
        log_exception(failure_);
        return WeaveError{WeaveError::State,
            "worker task failed: " + exception_message(failure_)};
    }
    return ok_status();
}

} // namespace weave
