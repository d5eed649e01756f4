#pragma once

#include <QObject>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>

namespace astv::network {

/**
 * TimerRegistry - one-shot response timeouts, keyed by Qt timer id.
 *
 * At most one timer is "current" (waiting on the latest send). Older timers
 * that have not fired yet are "superseded": they stay armed until they fire
 * or cancelAll() is called. Callbacks run on the registry's thread.
 */
class TimerRegistry : public QObject {
    Q_OBJECT

public:
    using Handle = int;

    explicit TimerRegistry(QObject* parent = nullptr);
    ~TimerRegistry() override;

    /**
     * Arm a one-shot timer. It becomes the current timer; a previous current
     * timer is superseded. Returns 0 if Qt could not start a timer.
     */
    Handle arm(std::chrono::milliseconds deadline, std::function<void()> on_fire);

    /**
     * Move the current timer into the superseded set without stopping it.
     */
    void supersede(Handle handle);

    /**
     * Stop every pending timer and forget it. Safe on an empty registry.
     */
    void cancelAll();

    [[nodiscard]] std::optional<Handle> current() const { return current_; }
    [[nodiscard]] std::size_t pendingCount() const { return callbacks_.size(); }
    [[nodiscard]] std::size_t supersededCount() const { return superseded_.size(); }
    [[nodiscard]] bool isEmpty() const { return callbacks_.empty(); }
    [[nodiscard]] bool isPending(Handle handle) const { return callbacks_.count(handle) != 0; }

protected:
    void timerEvent(QTimerEvent* event) override;

private:
    std::map<Handle, std::function<void()>> callbacks_;
    std::set<Handle> superseded_;
    std::optional<Handle> current_;
};

} // namespace astv::network
