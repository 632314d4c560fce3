#include "cancellation.h"

#include <algorithm>
#include <thread>

void gdp::common::detail::cancellation_state::cancel() {
    std::vector<std::shared_ptr<cancellation_state>> to_cancel;
    {
        std::lock_guard guard(mutex);
        if (cancelled) return;
        cancelled = true;
        for (auto &child : children) {
            if (auto locked = child.lock(); locked) to_cancel.push_back(std::move(locked));
        }
        children.clear();
    }
    signal.notify_all();
    for (auto &child : to_cancel) child->cancel();
}

gdp::common::cancellation_token::cancellation_token(std::shared_ptr<detail::cancellation_state> state) : state_(std::move(state)) {

}

bool gdp::common::cancellation_token::is_cancelled() const {
    if (!state_) return false;
    std::lock_guard guard(state_->mutex);
    return state_->cancelled;
}

bool gdp::common::cancellation_token::wait_until(const std::chrono::steady_clock::time_point &deadline) const {
    if (!state_) {
        std::this_thread::sleep_until(deadline);
        return false;
    }
    std::unique_lock lock(state_->mutex);
    return state_->signal.wait_until(lock, deadline, [this] { return state_->cancelled; });
}

bool gdp::common::cancellation_token::wait_for(const std::chrono::steady_clock::duration &duration) const {
    return wait_until(std::chrono::steady_clock::now() + duration);
}

gdp::common::cancellation_source::cancellation_source() : state_(std::make_shared<detail::cancellation_state>()) {

}

gdp::common::cancellation_source::cancellation_source(std::initializer_list<cancellation_token> parents) : cancellation_source() {
    for (const auto &parent : parents) {
        if (!parent.state_) continue;
        bool parent_cancelled = false;
        {
            std::lock_guard guard(parent.state_->mutex);
            if (parent.state_->cancelled) parent_cancelled = true;
            else {
                auto &children = parent.state_->children;
                children.erase(std::remove_if(children.begin(), children.end(), [](const std::weak_ptr<detail::cancellation_state> &child) {
                    return child.expired();
                }), children.end());
                children.push_back(state_);
            }
        }
        if (parent_cancelled) state_->cancel();
    }
}

void gdp::common::cancellation_source::cancel() {
    state_->cancel();
}

bool gdp::common::cancellation_source::is_cancelled() const {
    return token().is_cancelled();
}

gdp::common::cancellation_token gdp::common::cancellation_source::token() const {
    return cancellation_token(state_);
}
