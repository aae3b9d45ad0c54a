#include "core/scheduler.h"
#include "core/types.h"
#include "logger.h"
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <exception>

namespace voxlink {

class ThreadScheduler::Impl {
public:
    Impl() : state_(std::make_shared<State>()) {
        worker_thread_ = std::thread(&Impl::worker_loop, state_);
    }

    ~Impl() {
        shutdown();
    }

    TimerId schedule_after(int delay_ms, std::function<void()> task) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        TimerId id = state_->next_id++;
        if (state_->shutdown) {
            return id;
        }
        Entry entry;
        entry.deadline = Clock::now() + Duration(delay_ms < 0 ? 0 : delay_ms);
        entry.task = std::move(task);
        state_->entries.emplace(id, std::move(entry));
        state_->cv.notify_one();
        return id;
    }

    void cancel(TimerId id) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->entries.erase(id);
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->shutdown) return;
            state_->shutdown = true;
            state_->entries.clear();
        }
        state_->cv.notify_all();
        if (worker_thread_.joinable()) {
            // From inside a task: the worker keeps its own reference to the state
            if (worker_thread_.get_id() == std::this_thread::get_id()) {
                worker_thread_.detach();
            } else {
                worker_thread_.join();
            }
        }
    }

private:
    struct Entry {
        TimePoint deadline;
        std::function<void()> task;
    };

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::map<TimerId, Entry> entries;
        TimerId next_id = 1;
        bool shutdown = false;
    };

    static void worker_loop(std::shared_ptr<State> state) {
        std::unique_lock<std::mutex> lock(state->mutex);
        while (!state->shutdown) {
            if (state->entries.empty()) {
                state->cv.wait(lock);
                continue;
            }

            // Earliest deadline first; ties go to the earlier id
            auto next = state->entries.begin();
            for (auto it = state->entries.begin(); it != state->entries.end(); ++it) {
                if (it->second.deadline < next->second.deadline) {
                    next = it;
                }
            }

            if (Clock::now() < next->second.deadline) {
                state->cv.wait_until(lock, next->second.deadline);
                continue;
            }

            std::function<void()> task = std::move(next->second.task);
            state->entries.erase(next);

            lock.unlock();
            try {
                task();
            } catch (const std::exception& e) {
                Logger::error(std::string("Scheduled task threw: ") + e.what());
            } catch (...) {
                Logger::error("Scheduled task threw a non-standard exception");
            }
            lock.lock();
        }
    }

    std::shared_ptr<State> state_;
    std::thread worker_thread_;
};

ThreadScheduler::ThreadScheduler() : pimpl_(std::make_unique<Impl>()) {}
ThreadScheduler::~ThreadScheduler() = default;

TimerId ThreadScheduler::schedule_after(int delay_ms, std::function<void()> task) {
    return pimpl_->schedule_after(delay_ms, std::move(task));
}

void ThreadScheduler::cancel(TimerId id) {
    pimpl_->cancel(id);
}

void ThreadScheduler::shutdown() {
    pimpl_->shutdown();
}

} // namespace voxlink
