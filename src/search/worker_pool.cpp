// ==============================================================================
// worker_pool.cpp - Пул рабочих потоков
// ==============================================================================

#include "streamgrep/worker_pool.hpp"

namespace streamgrep::search {

WorkerPool::WorkerPool(std::size_t threads) {
    if (threads == 0) {
        threads = 1;
    }
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back(&WorkerPool::run, this);
    }
}

WorkerPool::~WorkerPool() {
    tasks_.close();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> task) {
    tasks_.push(std::move(task));
}

void WorkerPool::run() {
    while (auto task = tasks_.pop()) {
        (*task)();
    }
}

}  // namespace streamgrep::search
