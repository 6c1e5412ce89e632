// ==============================================================================
// streamgrep/worker_pool.hpp - Канал сообщений и пул рабочих потоков
// ==============================================================================
//
// Назначение:
// - Channel<T> — очередь между потоками (push / блокирующий pop / close)
// - WorkerPool — фиксированный набор потоков, выполняющих задачи из канала
//
// Рабочие потоки не разделяют изменяемое состояние: задача получает свои
// входные данные по значению и отправляет результат в канал.
//
// ==============================================================================

#ifndef STREAMGREP_WORKER_POOL_HPP
#define STREAMGREP_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace streamgrep::search {

// ============================================================================
// Channel
// ============================================================================

/// Неограниченная очередь с блокирующим извлечением
template <typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(value));
        }
        cond_.notify_one();
    }

    /// Извлечь элемент, дождавшись его появления
    /// @return nullopt если канал закрыт и пуст
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    /// Закрыть канал: ожидающие pop() возвращают оставшиеся элементы, затем nullopt
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cond_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cond_;
    std::queue<T> queue_;
    bool closed_ = false;
};

// ============================================================================
// WorkerPool
// ============================================================================

/// Пул рабочих потоков
///
/// Деструктор закрывает очередь задач и дожидается выполнения уже
/// принятых задач.
class WorkerPool {
public:
    /// @param threads Число потоков (0 трактуется как 1)
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Поставить задачу в очередь
    void submit(std::function<void()> task);

    std::size_t size() const { return threads_.size(); }

private:
    void run();

    Channel<std::function<void()>> tasks_;
    std::vector<std::thread> threads_;
};

}  // namespace streamgrep::search

#endif  // STREAMGREP_WORKER_POOL_HPP
