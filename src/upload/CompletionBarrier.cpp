#include "upload/CompletionBarrier.hpp"

#include <algorithm>
#include <iterator>

using namespace cw::upload;

bool CompletionBarrier::openLocked() const {
    return std::ranges::all_of(expected_, [this](const unsigned int id) { return signalled_.contains(id); });
}

void CompletionBarrier::expect(const unsigned int sequenceId) {
    std::scoped_lock lock(mutex_);
    expected_.insert(sequenceId);
}

void CompletionBarrier::signal(const unsigned int sequenceId) {
    std::vector<Listener> fire;
    {
        std::scoped_lock lock(mutex_);
        if (!signalled_.insert(sequenceId).second) return;
        if (!openLocked()) return;
        fire.swap(listeners_);
    }
    cv_.notify_all();
    for (const auto& l : fire) l();
}

void CompletionBarrier::subscribe(Listener listener) {
    {
        std::scoped_lock lock(mutex_);
        if (!openLocked()) {
            listeners_.push_back(std::move(listener));
            return;
        }
    }
    listener();
}

bool CompletionBarrier::isOpen() const {
    std::scoped_lock lock(mutex_);
    return openLocked();
}

bool CompletionBarrier::isAborted() const {
    std::scoped_lock lock(mutex_);
    return aborted_;
}

std::set<unsigned int> CompletionBarrier::outstanding() const {
    std::scoped_lock lock(mutex_);
    std::set<unsigned int> out;
    std::ranges::set_difference(expected_, signalled_, std::inserter(out, out.end()));
    return out;
}

bool CompletionBarrier::wait(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    const auto ready = [this] { return aborted_ || openLocked(); };
    if (timeout == std::chrono::milliseconds::max()) cv_.wait(lock, ready);
    else cv_.wait_for(lock, timeout, ready);
    return !aborted_ && openLocked();
}

void CompletionBarrier::abort() {
    {
        std::scoped_lock lock(mutex_);
        aborted_ = true;
    }
    cv_.notify_all();
}
