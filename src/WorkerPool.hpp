#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed number of worker threads draining a FIFO task queue.
// The destructor finishes queued work before joining.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t workerCount) {
        if (workerCount == 0) {
            workerCount = 1;
        }
        m_workers.reserve(workerCount);
        for (std::size_t i = 0; i < workerCount; ++i) {
            m_workers.emplace_back([this] { workerLoop(); });
        }
    }

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wake.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F&& task) {
        using Result = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        std::future<Result> result = packaged->get_future();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("WorkerPool is shutting down");
            }
            m_tasks.emplace([packaged] { (*packaged)(); });
        }
        m_wake.notify_one();
        return result;
    }

    std::size_t workerCount() const { return m_workers.size(); }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wake.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });
                if (m_stopping && m_tasks.empty()) {
                    return;
                }
                task = std::move(m_tasks.front());
                m_tasks.pop();
            }
            task();
        }
    }

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_mutex;
    std::condition_variable m_wake;
    bool m_stopping = false;
};

#endif
