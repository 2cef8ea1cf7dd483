#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <thread>
#include <mutex>
#include <deque>
#include <condition_variable>
#include <stop_token>
#include <vector>
#include <stdexcept>
#include <atomic>
#include <type_traits>

namespace parcp::infra {

// Фиксированный набор потоков ОС. Копировщик создаёт пул на задание
// с числом потоков = числу диапазонов, так что каждая задача получает свой поток.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t nthreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Задача с результатом; исключение из задачи уходит в future
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Блокирующее ожидание: очередь пуста и ни одна задача не выполняется
    void wait();

    [[nodiscard]] auto size() const -> std::size_t { return workers_.size(); }

private:
    void worker_loop_(std::stop_token st);

    std::vector<std::jthread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable_any idle_cv_;
    bool stop_ = false;
    std::size_t active_tasks_ = 0;
};

// =============== Реализация шаблонов ===============

template<typename F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
{
    using ReturnType = std::invoke_result_t<std::decay_t<F>>;

    // packaged_task не копируется, а std::function требует копируемости
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
    auto future = task->get_future();
    {
        std::lock_guard lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks_.emplace_back([task] { (*task)(); });
    }
    cv_.notify_one();
    return future;
}

inline ThreadPool::ThreadPool(std::size_t nthreads)
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { worker_loop_(st); });
    }
}

inline ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

inline void ThreadPool::worker_loop_(std::stop_token st) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            cv_.wait(lock, [this, &st] {
                return st.stop_requested() || stop_ || !tasks_.empty();
            });
            // Остановка только после того, как очередь выбрана до конца
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_tasks_;
        }

        task();

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

inline void ThreadPool::wait() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_ == 0;
    });
}

} // namespace parcp::infra
