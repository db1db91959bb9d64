#pragma once
#include <atomic>
#include <memory>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/CallbackRegistry.hpp"
#include "core/CaptureLoop.hpp"
#include "core/EventPublisher.hpp"
#include "core/PermissionGate.hpp"
#include "core/ReporterTypes.hpp"
#include "core/TransportManager.hpp"
#include "interfaces/IDesktopApi.hpp"
#include "interfaces/IMessageChannel.hpp"

namespace core {

// Collaborators shared by every engine in the process
struct EngineServices {
    std::shared_ptr<interfaces::IDesktopApi> desktop;
    std::shared_ptr<interfaces::IChannelConnector> connector;
    std::shared_ptr<PermissionGate> gate;
    std::shared_ptr<CallbackRegistry> callbacks;
    std::shared_ptr<common::ILogger> logger;
};

// ============================================================================
// ReporterEngine - one running reporter (capture loop + transport)
// ============================================================================
// Built from an immutable config snapshot. Use ReporterRegistry to enforce
// the one-instance-per-process rule.
// ============================================================================

class ReporterEngine {
public:
    // Validates the config. Fails for a disabled reporter, an empty or
    // unparsable endpoint, or missing collaborators.
    static common::Result<std::unique_ptr<ReporterEngine>> create(
        const ReporterConfig& config,
        const EngineOptions& options,
        const EngineServices& services
    );

    ~ReporterEngine();

    ReporterEngine(const ReporterEngine&) = delete;
    ReporterEngine& operator=(const ReporterEngine&) = delete;

    common::EmptyResult start();

    // Stops capture (bounded by stop_grace), then the transport.
    // Returns false if the capture worker had to be abandoned.
    bool stop();

    ReporterStatus status() const;
    bool is_running() const { return running_.load(std::memory_order_acquire); }

    const ReporterConfig& config() const { return config_; }

private:
    ReporterEngine(ReporterConfig config, EngineOptions options, EngineServices services,
                   Endpoint endpoint);

    ReporterConfig config_;
    EngineOptions options_;
    EngineServices services_;

    std::shared_ptr<common::ILogger> logger_;
    std::shared_ptr<ErrorSlot> errors_;
    std::shared_ptr<TransportManager> transport_;
    std::shared_ptr<EventPublisher> publisher_;
    std::shared_ptr<EventSampler> sampler_;
    std::unique_ptr<CaptureLoop> capture_;

    std::atomic<bool> running_{false};
};

} // namespace core
