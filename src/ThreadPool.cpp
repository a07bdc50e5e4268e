#include "etcalc/ThreadPool.hpp"

#include <algorithm>

namespace etcalc {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0) nthreads = std::max(1u, std::thread::hardware_concurrency());
    workers_.reserve(nthreads);
    for (unsigned i = 0; i < nthreads; ++i)
        workers_.emplace_back([this] { work(); });
}

void ThreadPool::work()
{
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock lk(mtx_);
            cv_.wait(lk, [this] { return stop_ || !jobs_.empty(); });
            if (stop_ && jobs_.empty()) return;
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

} // namespace etcalc
