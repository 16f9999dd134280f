#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <exception>
#include <mutex>
#include <set>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

#include "types.hpp"
#include "mpmc_queue.hpp"
#include "io_service_pool.hpp"
#include "net/connection.hpp"
#include "log/log.hpp"

namespace pasture {


/// Worker threads that run connection coroutines.
///
/// A submitted session is resumed by whichever idle worker wakes up first
/// and from then on lives on that worker: its socket io goes through the
/// worker's io_service, and the worker destroys the coroutine frame once it
/// is done.
class thread_pool
{
public:
    static constexpr std::size_t kSESSION_QUEUE_CAPACITY = 1024;
    // how long a busy worker waits for io before looking for new sessions
    static constexpr std::chrono::milliseconds kPOLL_INTERVAL{10};

    thread_pool(int n_threads, io_service_pool& ios_pool)
        : io_services_(ios_pool)
        , session_queue_(kSESSION_QUEUE_CAPACITY)
    {
        if (n_threads <= 0 || static_cast<std::size_t>(n_threads) != ios_pool.size())
            throw std::invalid_argument("thread_pool: one io_service per thread is required");
        work_threads_.reserve(n_threads);
        thread_local_coros_.resize(n_threads);
    }

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;

    ~thread_pool() noexcept {
        stop_work_thread();
        for (auto& coro_list : thread_local_coros_) {
            for (auto coro : coro_list)
                coro.destroy();
        }
        session_wrapper session{};
        while (session_queue_.try_pop(session)) {
            if (session.coro) session.coro.destroy();
        }
    }

    void submit(session_wrapper session) {
        session_queue_.emplace(session);
        // an idle worker checks the queue under this mutex before it sleeps
        { std::lock_guard<std::mutex> lk{idle_mutex_}; }
        avaliable_cv_.notify_one();
    }

    void start() {
        for (uint16_t i = 0; i < thread_local_coros_.size(); ++i) {
            work_threads_.emplace_back(
                [this, i](std::stop_token stop_token) {
                    this_thread_ = thread_meta{i};
                    start_work_thread(stop_token);
                }
            );
        }
    }

    std::size_t size() const noexcept { return thread_local_coros_.size(); }

private:
    std::set<std::coroutine_handle<>>& get_coro_list() noexcept {
        return thread_local_coros_[this_thread_.thread_id];
    }

    void resume_coroutine() {
        auto& coro_list = get_coro_list();
        auto& ios = io_services_.get_io_service(this_thread_);
        session_wrapper session{};
        while (session_queue_.try_pop(session))
        {
            if (session.coro == nullptr) [[unlikely]] continue;
            session.conn->set_io_service(&ios);
            session.coro.resume();
            if (session.coro.done())
                session.coro.destroy();
            else
                coro_list.insert(session.coro);
        }
    }

    void reap_finished() {
        auto& coro_list = get_coro_list();
        for (auto it = coro_list.begin(); it != coro_list.end(); ) {
            if (it->done()) {
                it->destroy();
                it = coro_list.erase(it);
            } else {
                ++it;
            }
        }
    }

    void start_work_thread(std::stop_token st) noexcept {
        auto& logger = log::logger();
        auto& ios = io_services_.get_io_service(this_thread_);
        auto& coro_list = get_coro_list();

        while (!st.stop_requested())
        {
            {
                std::unique_lock<std::mutex> lk{idle_mutex_};
                avaliable_cv_.wait(lk, [this, &st]() {
                    return !session_queue_.empty() || st.stop_requested();
                });
            }

            try {
                resume_coroutine();

                while (!coro_list.empty() && !st.stop_requested())
                {
                    // resume coroutines whose io is ready
                    ios.wait_io_and_resume_coroutine(kPOLL_INTERVAL);
                    reap_finished();
                    // pick up sessions submitted in the meantime
                    resume_coroutine();
                }
            } catch (const std::exception& e) {
                logger.log_error("worker {} failed to drive io: {}", this_thread_.thread_id, e.what());
            }
        }
    }

    void stop_work_thread() noexcept {
        {
            std::lock_guard<std::mutex> lk{idle_mutex_};
            for (auto& thr : work_threads_)
                thr.request_stop();
        }
        avaliable_cv_.notify_all();
        for (auto& thr : work_threads_) {
            if (thr.joinable())
                thr.join();
        }
    }

    inline static thread_local thread_meta this_thread_{0};
    io_service_pool& io_services_;
    std::vector<std::jthread> work_threads_;
    MPMCQueue<session_wrapper> session_queue_;
    std::vector<std::set<std::coroutine_handle<>>> thread_local_coros_;

    std::condition_variable avaliable_cv_;
    std::mutex idle_mutex_;
};

}
