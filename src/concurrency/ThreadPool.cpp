#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace cw::concurrency;
using namespace cw::log;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool requires at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop(const std::chrono::milliseconds gracefulTimeout) {
    {
        std::unique_lock lock(mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
        stopFlag.store(true);
        cv.notify_all();

        if (!drained_.wait_for(lock, gracefulTimeout, [this] { return busy_.load() == 0; }))
            Registry::chunkwise()->warn("[ThreadPool] {} task(s) still running after {}ms, waiting for them to return",
                                        busy_.load(), gracefulTimeout.count());
    }

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    if (stopFlag.load()) throw std::runtime_error("ThreadPool::submit called after stop()");
    {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
                ++busy_;
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                Registry::chunkwise()->error("[ThreadPool] {} threw: {}", task->describe(), e.what());
            }

            {
                std::scoped_lock lock(mutex);
                --busy_;
            }
            drained_.notify_all();
        }
    });
}
