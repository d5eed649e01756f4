#include "network/timer_registry.hpp"
#include "network/log.hpp"

#include <QTimerEvent>
#include <vector>

namespace astv::network {

TimerRegistry::TimerRegistry(QObject* parent)
    : QObject(parent)
{
}

TimerRegistry::~TimerRegistry() {
    cancelAll();
}

TimerRegistry::Handle TimerRegistry::arm(std::chrono::milliseconds deadline,
                                         std::function<void()> on_fire) {
    const Handle handle = startTimer(deadline, Qt::PreciseTimer);
    if (handle == 0) {
        qCWarning(astvLinkLog) << "TimerRegistry: failed to start timer";
        return 0;
    }

    if (current_) {
        supersede(*current_);
    }
    callbacks_.emplace(handle, std::move(on_fire));
    current_ = handle;
    return handle;
}

void TimerRegistry::supersede(Handle handle) {
    if (current_ != handle || !isPending(handle)) {
        return;
    }
    superseded_.insert(handle);
    current_.reset();
}

void TimerRegistry::cancelAll() {
    std::vector<Handle> handles;
    handles.reserve(callbacks_.size());
    for (const auto& [handle, callback] : callbacks_) {
        handles.push_back(handle);
    }

    for (const auto handle : handles) {
        killTimer(handle);
    }

    callbacks_.clear();
    superseded_.clear();
    current_.reset();
}

void TimerRegistry::timerEvent(QTimerEvent* event) {
    const Handle handle = event->timerId();
    killTimer(handle);

    auto it = callbacks_.find(handle);
    if (it == callbacks_.end()) {
        return;
    }

    // Forget the timer before running it so the callback can re-arm or cancel.
    auto callback = std::move(it->second);
    callbacks_.erase(it);
    superseded_.erase(handle);
    if (current_ == handle) {
        current_.reset();
    }

    if (callback) {
        callback();
    }
}

} // namespace astv::network
