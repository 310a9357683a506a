#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <vector>

namespace cw::upload {

// Opens once every expected (non-preview) sequence has signalled. Preview completions wait on it.
class CompletionBarrier {
public:
    using Listener = std::function<void()>;

    void expect(unsigned int sequenceId);

    // Marks a sequence as done (completed or skipped by the user). Idempotent.
    void signal(unsigned int sequenceId);

    // Fires on the thread that opens the barrier, or immediately when already open.
    void subscribe(Listener listener);

    [[nodiscard]] bool isOpen() const;
    [[nodiscard]] bool isAborted() const;
    [[nodiscard]] std::set<unsigned int> outstanding() const;

    // Returns false on abort or timeout.
    bool wait(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    // Wakes every waiter without opening the barrier.
    void abort();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::set<unsigned int> expected_;
    std::set<unsigned int> signalled_;
    std::vector<Listener> listeners_;
    bool aborted_ = false;

    [[nodiscard]] bool openLocked() const;
};

}
