//
// Created by garrett on 2/23/25.
//

#ifndef THREAD_POOL_HPP
#define THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>


class ThreadPool {
private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    std::condition_variable m_idle_condition;
    size_t m_active{0};
    bool m_stop;
public:
    ThreadPool();
    ~ThreadPool();
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;


    void enqueue(std::function<void()> task);
    void start(size_t num_threads);

    /// @brief Block until the queue is empty and no task is running
    void wait();

    /// @brief Finish queued tasks, then join all workers
    void stop();

    size_t size() const { return m_workers.size(); }
};



#endif //THREAD_POOL_HPP
