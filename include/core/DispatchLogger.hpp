#pragma once
#include <memory>
#include "common/Logger.hpp"
#include "core/CallbackRegistry.hpp"

namespace core {

// Engine logger: writes to the console sink and mirrors Info and above to
// the registered log callback.
class DispatchLogger : public common::ILogger {
public:
    DispatchLogger(std::shared_ptr<common::ILogger> sink,
                   std::shared_ptr<CallbackRegistry> callbacks)
        : sink_(std::move(sink)), callbacks_(std::move(callbacks)) {}

    void write(common::LogLevel level, const std::string& message) override {
        if (sink_) sink_->write(level, message);
        if (level == common::LogLevel::Debug || !callbacks_) return;
        callbacks_->dispatch_log(LogEvent{level, message});
    }

private:
    std::shared_ptr<common::ILogger> sink_;
    std::shared_ptr<CallbackRegistry> callbacks_;
};

} // namespace core
