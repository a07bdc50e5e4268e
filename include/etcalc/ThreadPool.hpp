#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace etcalc {

/*
 * Fixed set of workers draining a FIFO of scenario jobs.  Exceptions
 * thrown by a job travel through its future.  The destructor finishes
 * the queued jobs before joining.
 */
class ThreadPool {
public:
    // 0 picks the hardware concurrency (at least one worker)
    explicit ThreadPool(unsigned nthreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    std::size_t size() const noexcept { return workers_.size(); }

private:
    void work();

    std::vector<std::jthread>         workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex                        mtx_;
    std::condition_variable           cv_;
    bool                              stop_ = false;
};

template <class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
{
    using Ret = std::invoke_result_t<F, Args...>;
    auto job = std::make_shared<std::packaged_task<Ret()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Ret> res = job->get_future();
    {
        std::lock_guard lk(mtx_);
        if (stop_) throw std::logic_error("ThreadPool: enqueue after shutdown");
        jobs_.emplace([job]() { (*job)(); });
    }
    cv_.notify_one();
    return res;
}

} // namespace etcalc
