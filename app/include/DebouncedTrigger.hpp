#ifndef DEBOUNCED_TRIGGER_HPP
#define DEBOUNCED_TRIGGER_HPP

#include <functional>
#include <memory>

class QTimer;

/**
 * @brief Trailing-edge trigger: every schedule() restarts the countdown and
 * the action runs once the events stop for the configured interval.
 *
 * An interval of 0 runs the action synchronously inside schedule(). Timed
 * firing needs a running Qt event loop; flush() runs a pending action
 * immediately without one.
 */
class DebouncedTrigger {
public:
    explicit DebouncedTrigger(std::function<void()> action, int interval_ms = 0);
    ~DebouncedTrigger();

    DebouncedTrigger(const DebouncedTrigger&) = delete;
    DebouncedTrigger& operator=(const DebouncedTrigger&) = delete;

    void schedule();
    void flush();
    void cancel();

    bool pending() const { return pending_; }
    int interval() const { return interval_ms_; }
    void set_interval(int interval_ms);

private:
    void fire();
    void ensure_timer();

    std::function<void()> action_;
    int interval_ms_;
    bool pending_{false};
    std::unique_ptr<QTimer> timer_;
};

#endif
