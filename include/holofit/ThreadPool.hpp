#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace holofit {

/*
 * Fixed set of worker threads used to evaluate many candidate parameter
 * vectors against one model.  Exceptions raised by a task travel back
 * through its future.
 */
class ThreadPool {
public:
    explicit ThreadPool(unsigned nthreads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&)            = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    /* f(0) … f(n-1) spread over the workers; results in index order.
       The first failing index rethrows after all tasks have finished. */
    template <class F>
    auto parallel_map(std::size_t n, F f)
        -> std::vector<std::invoke_result_t<F, std::size_t>>;

private:
    std::vector<std::jthread>         workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        mtx_;
    std::condition_variable           cv_;
    bool                              stop_ = false;
};

template <class F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>>
{
    using Ret = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<F>(f));
    std::future<Ret> res = task->get_future();
    {
        std::lock_guard lk(mtx_);
        tasks_.emplace([task]() { (*task)(); });
    }
    cv_.notify_one();
    return res;
}

template <class F>
auto ThreadPool::parallel_map(std::size_t n, F f)
    -> std::vector<std::invoke_result_t<F, std::size_t>>
{
    using Ret = std::invoke_result_t<F, std::size_t>;

    std::vector<std::future<Ret>> pending;
    pending.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        pending.push_back(submit([f, i]() { return f(i); }));

    for (auto& p : pending) p.wait();

    std::vector<Ret> out;
    out.reserve(n);
    for (auto& p : pending) out.push_back(p.get());
    return out;
}

} // namespace holofit
