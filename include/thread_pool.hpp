#ifndef SOUNDTOUCH_PROXY_THREAD_POOL_HPP
#define SOUNDTOUCH_PROXY_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace utils
{

// Fixed number of workers pulling from one queue. The number of workers is the
// upper bound of tasks running at the same time.
class thread_pool
{
public:

    thread_pool() = delete;
    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;
    thread_pool(thread_pool&&) = delete;
    thread_pool& operator=(thread_pool&&) = delete;

    explicit thread_pool(size_t num_workers)
    {
        if(num_workers == 0)
            num_workers = 1;

        m_workers.reserve(num_workers);
        for(size_t i = 0; i < num_workers; i++)
            m_workers.emplace_back([this]() { worker_loop(); });
    }

    ~thread_pool()
    {
        shutdown();
    }

    template<typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>>
    {
        using result_type = std::invoke_result_t<std::decay_t<Func>>;

        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<Func>(func));
        std::future<result_type> fut = task->get_future();

        {
            std::lock_guard<std::mutex> lock {m_mutex};
            if(m_stop)
                throw std::runtime_error {"thread_pool is stopped"};

            m_tasks.emplace([task]() { (*task)(); });
        }

        m_cond.notify_one();
        return fut;
    }

    // Queued tasks are still executed before the workers return
    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            if(m_stop)
                return;
            m_stop = true;
        }
        m_cond.notify_all();

        for(auto& worker : m_workers)
        {
            if(worker.joinable())
                worker.join();
        }
    }

    size_t size() const
    {
        return m_workers.size();
    }

private:

    void worker_loop()
    {
        while(true)
        {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock {m_mutex};
                m_cond.wait(lock, [this]() { return m_stop || !m_tasks.empty(); });

                if(m_stop && m_tasks.empty())
                    return;

                task = std::move(m_tasks.front());
                m_tasks.pop();
            }

            task();
        }
    }

    std::vector<std::thread> m_workers;

    std::queue<std::function<void()>> m_tasks;

    std::mutex m_mutex;

    std::condition_variable m_cond;

    bool m_stop = false;

};

} // utils

#endif
