#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/Logger.hpp"
#include "common/Result.hpp"
#include "core/CallbackRegistry.hpp"
#include "core/PermissionGate.hpp"
#include "core/ReporterEngine.hpp"
#include "core/ReporterTypes.hpp"
#include "interfaces/IConfigStore.hpp"
#include "interfaces/IDesktopApi.hpp"
#include "interfaces/IMessageChannel.hpp"

namespace core {

// ============================================================================
// ReporterRegistry - process-wide reporter slot
// ============================================================================
// Holds at most one running ReporterEngine. start/stop are serialised; status
// and is_running never wait for a stop in progress.
//
// Also owns the process-wide collaborators: the callback registry (callbacks
// may be registered before start and survive restarts), the permission gate
// (verdicts are per process) and the platform services. Services are created
// lazily from PlatformRegistry unless installed explicitly (tests, embedders).
//
// Usage:
//   auto& registry = ReporterRegistry::instance();
//   registry.callbacks()->set_window_handler(...);
//   auto handle = registry.start(config);
//   ...
//   registry.stop(handle.unwrap());
// ============================================================================

class ReporterRegistry {
public:
    using Handle = uint64_t; // 0 is never a valid handle

    struct Services {
        std::shared_ptr<interfaces::IDesktopApi> desktop;
        std::shared_ptr<interfaces::IConfigStore> config_store;
        std::shared_ptr<interfaces::IChannelConnector> connector;
        std::shared_ptr<common::ILogger> logger;
    };

    // ========== Singleton Access ==========

    static ReporterRegistry& instance();

    ReporterRegistry(const ReporterRegistry&) = delete;
    ReporterRegistry& operator=(const ReporterRegistry&) = delete;
    ReporterRegistry(ReporterRegistry&&) = delete;
    ReporterRegistry& operator=(ReporterRegistry&&) = delete;

    // ========== Services ==========

    // Replaces the collaborators (null members fall back to defaults).
    // Fails with Busy while a reporter is running. Resets permission verdicts.
    common::EmptyResult install_services(Services services);

    void set_engine_options(const EngineOptions& options);
    EngineOptions engine_options() const;

    std::shared_ptr<CallbackRegistry> callbacks() const { return callbacks_; }
    std::shared_ptr<PermissionGate> permission_gate();
    std::shared_ptr<interfaces::IConfigStore> config_store();
    std::shared_ptr<common::ILogger> logger();

    // ========== Lifecycle ==========

    // Fails when already running or when the config is invalid.
    // A configuration failure is remembered as the stopped status' last error.
    common::Result<Handle> start(const ReporterConfig& config);

    // Fails when nothing is running or the handle does not match.
    common::EmptyResult stop(Handle handle);

    ReporterStatus status() const;
    bool is_running() const { return running_.load(std::memory_order_acquire); }

private:
    ReporterRegistry();
    ~ReporterRegistry();

    // Fills missing services from the current platform. Caller holds services_mutex_.
    void ensure_services_locked();
    EngineServices engine_services();

    // Serialises start/stop
    std::mutex lifecycle_mutex_;

    // Guards the slot; held only briefly
    mutable std::mutex slot_mutex_;
    std::shared_ptr<ReporterEngine> engine_;
    Handle handle_ = 0;
    Handle next_handle_ = 1;
    std::optional<std::string> stopped_error_;
    std::atomic<bool> running_{false};

    mutable std::mutex services_mutex_;
    Services services_;
    std::shared_ptr<PermissionGate> gate_;
    EngineOptions options_;

    const std::shared_ptr<CallbackRegistry> callbacks_;
};

} // namespace core
