#include "core/ReporterRegistry.hpp"
#include "core/PlatformRegistry.hpp"
#include "net/WebSocketChannel.hpp"

namespace core {

// ============================================================================
// Singleton Instance
// ============================================================================

ReporterRegistry& ReporterRegistry::instance() {
    static ReporterRegistry instance;
    return instance;
}

ReporterRegistry::ReporterRegistry()
    : callbacks_(std::make_shared<CallbackRegistry>())
{
}

ReporterRegistry::~ReporterRegistry() {
    std::shared_ptr<ReporterEngine> engine;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        engine = std::move(engine_);
    }
    if (engine) engine->stop();
}

// ============================================================================
// Services
// ============================================================================

void ReporterRegistry::ensure_services_locked() {
    if (!services_.logger) {
        services_.logger = std::make_shared<common::ConsoleLogger>("ShikenMatrix");
    }

    if (!services_.desktop || !services_.config_store) {
        auto* platform = PlatformRegistry::instance().get_current_platform();
        if (platform) {
            if (!services_.desktop) services_.desktop = platform->create_desktop_api();
            if (!services_.config_store) services_.config_store = platform->create_config_store();
        }
    }

    if (!services_.connector) {
        services_.connector = std::make_shared<net::WebSocketConnector>();
    }

    if (!gate_) {
        gate_ = std::make_shared<PermissionGate>(services_.desktop, services_.config_store,
                                                 options_.media_probe_timeout, services_.logger);
    }
}

common::EmptyResult ReporterRegistry::install_services(Services services) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return common::EmptyResult::err(common::ErrorCode::Busy,
                                        "Cannot replace services while the reporter is running");
    }

    std::lock_guard<std::mutex> lock(services_mutex_);
    services_ = std::move(services);
    gate_.reset();
    return common::EmptyResult::success();
}

void ReporterRegistry::set_engine_options(const EngineOptions& options) {
    std::lock_guard<std::mutex> lock(services_mutex_);
    options_ = options;
    if (gate_) gate_->set_probe_timeout(options.media_probe_timeout);
}

EngineOptions ReporterRegistry::engine_options() const {
    std::lock_guard<std::mutex> lock(services_mutex_);
    return options_;
}

std::shared_ptr<PermissionGate> ReporterRegistry::permission_gate() {
    std::lock_guard<std::mutex> lock(services_mutex_);
    ensure_services_locked();
    return gate_;
}

std::shared_ptr<interfaces::IConfigStore> ReporterRegistry::config_store() {
    std::lock_guard<std::mutex> lock(services_mutex_);
    ensure_services_locked();
    return services_.config_store;
}

std::shared_ptr<common::ILogger> ReporterRegistry::logger() {
    std::lock_guard<std::mutex> lock(services_mutex_);
    ensure_services_locked();
    return services_.logger;
}

EngineServices ReporterRegistry::engine_services() {
    std::lock_guard<std::mutex> lock(services_mutex_);
    ensure_services_locked();

    EngineServices out;
    out.desktop = services_.desktop;
    out.connector = services_.connector;
    out.gate = gate_;
    out.callbacks = callbacks_;
    out.logger = services_.logger;
    return out;
}

// ============================================================================
// Lifecycle
// ============================================================================

common::Result<ReporterRegistry::Handle> ReporterRegistry::start(const ReporterConfig& config) {
    using R = common::Result<Handle>;
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (running_.load(std::memory_order_acquire)) {
        return R::err(common::ErrorCode::Busy, "Reporter is already running");
    }

    EngineServices services = engine_services();
    EngineOptions options = engine_options();

    auto record_failure = [&](const common::AppError& error) {
        if (services.logger) services.logger->error("[Reporter] Start failed: " + error.message);
        std::lock_guard<std::mutex> lock(slot_mutex_);
        stopped_error_ = error.message;
    };

    auto created = ReporterEngine::create(config, options, services);
    if (created.is_err()) {
        record_failure(created.error());
        return R::err(created.error());
    }

    std::shared_ptr<ReporterEngine> engine = created.take();
    auto started = engine->start();
    if (started.is_err()) {
        record_failure(started.error());
        return R::err(started.error());
    }

    Handle handle = 0;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        engine_ = std::move(engine);
        handle = handle_ = next_handle_++;
        stopped_error_.reset();
    }
    running_.store(true, std::memory_order_release);
    return R::ok(handle);
}

common::EmptyResult ReporterRegistry::stop(Handle handle) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::shared_ptr<ReporterEngine> engine;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        if (!engine_) {
            return common::EmptyResult::err(common::ErrorCode::InvalidArgument, "Reporter is not running");
        }
        if (handle != handle_) {
            return common::EmptyResult::err(common::ErrorCode::InvalidArgument,
                                            "Handle does not match the running reporter");
        }
        engine = engine_;
    }

    engine->stop();
    ReporterStatus last = engine->status();

    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        engine_.reset();
        handle_ = 0;
        stopped_error_ = last.last_error;
    }
    running_.store(false, std::memory_order_release);
    return common::EmptyResult::success();
}

ReporterStatus ReporterRegistry::status() const {
    std::shared_ptr<ReporterEngine> engine;
    std::optional<std::string> stopped_error;
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        engine = engine_;
        stopped_error = stopped_error_;
    }

    if (engine) return engine->status();

    ReporterStatus status;
    status.last_error = stopped_error;
    return status;
}

} // namespace core
