#include "core/CallbackRegistry.hpp"

namespace core {

void CallbackRegistry::set_log_handler(LogHandler handler) {
    replace(log_, std::move(handler), mutex_);
}

void CallbackRegistry::set_window_handler(WindowHandler handler) {
    replace(window_, std::move(handler), mutex_);
}

void CallbackRegistry::set_media_handler(MediaHandler handler) {
    replace(media_, std::move(handler), mutex_);
}

bool CallbackRegistry::dispatch_log(const LogEvent& event) const {
    auto handler = snapshot(log_, mutex_);
    if (!handler) return false;

    std::unique_lock<std::recursive_timed_mutex> turn(log_dispatch_mutex_, std::defer_lock);
    if (!turn.try_lock_for(kLogDispatchWait)) return false;
    (*handler)(event);
    return true;
}

bool CallbackRegistry::dispatch_window(const WindowEvent& event) const {
    auto handler = snapshot(window_, mutex_);
    if (!handler) return false;
    (*handler)(event);
    return true;
}

bool CallbackRegistry::dispatch_media(const MediaEvent& event) const {
    auto handler = snapshot(media_, mutex_);
    if (!handler) return false;
    (*handler)(event);
    return true;
}

bool CallbackRegistry::has_log_handler() const {
    return snapshot(log_, mutex_) != nullptr;
}

} // namespace core
