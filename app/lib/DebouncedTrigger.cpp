#include "DebouncedTrigger.hpp"

#include <QTimer>

#include <algorithm>

DebouncedTrigger::DebouncedTrigger(std::function<void()> action, int interval_ms)
    : action_(std::move(action)),
      interval_ms_(std::max(0, interval_ms))
{
}

DebouncedTrigger::~DebouncedTrigger() = default;

void DebouncedTrigger::ensure_timer()
{
    if (timer_) {
        return;
    }
    timer_ = std::make_unique<QTimer>();
    timer_->setSingleShot(true);
    QObject::connect(timer_.get(), &QTimer::timeout, [this]() {
        fire();
    });
}

void DebouncedTrigger::schedule()
{
    pending_ = true;
    if (interval_ms_ == 0) {
        fire();
        return;
    }
    ensure_timer();
    timer_->start(interval_ms_);
}

void DebouncedTrigger::flush()
{
    if (pending_) {
        fire();
    }
}

void DebouncedTrigger::cancel()
{
    pending_ = false;
    if (timer_) {
        timer_->stop();
    }
}

void DebouncedTrigger::set_interval(int interval_ms)
{
    interval_ms_ = std::max(0, interval_ms);
    if (pending_ && timer_ && interval_ms_ > 0) {
        timer_->start(interval_ms_);
    } else if (pending_ && interval_ms_ == 0) {
        fire();
    }
}

void DebouncedTrigger::fire()
{
    if (timer_) {
        timer_->stop();
    }
    pending_ = false;
    if (action_) {
        action_();
    }
}
