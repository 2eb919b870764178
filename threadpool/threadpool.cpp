#include "threadpool/threadpool.hpp"
#include <algorithm>

size_t ThreadPool::resolve(size_t n_threads)
{
    if (n_threads != 0)
    {
        return n_threads;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

ThreadPool::ThreadPool(size_t n_threads)
    : work_guard(net::make_work_guard(pool_ctx))
    , workers(resolve(n_threads))
{
    for (auto& t : workers)
    {
        t = std::jthread([this] {pool_ctx.run();});
    }
}

ThreadPool::~ThreadPool()
{
    stop();
}

// Drains queued work before joining
void ThreadPool::stop()
{
    if (bool was_running = running.exchange(false); !was_running)
    {
        return;
    }

    work_guard.reset();

    for (auto& t : workers)
    {
        if (t.joinable())
        {
            t.join();
        }
    }
}
