#include "core/ReporterEngine.hpp"
#include "core/DispatchLogger.hpp"

namespace core {

common::Result<std::unique_ptr<ReporterEngine>> ReporterEngine::create(
    const ReporterConfig& config,
    const EngineOptions& options,
    const EngineServices& services
) {
    using R = common::Result<std::unique_ptr<ReporterEngine>>;

    if (!config.enabled) {
        return R::err(common::ErrorCode::InvalidArgument, "Reporter is disabled in the configuration");
    }
    if (config.endpoint.empty()) {
        return R::err(common::ErrorCode::InvalidArgument, "No endpoint configured");
    }

    auto endpoint = parse_endpoint(config.endpoint);
    if (endpoint.is_err()) {
        return R::err(common::ErrorCode::InvalidArgument,
                      "Invalid endpoint: " + endpoint.error().message);
    }

    if (!services.desktop || !services.connector || !services.gate || !services.callbacks) {
        return R::err(common::ErrorCode::InvalidArgument, "Reporter services are not available");
    }

    return R::ok(std::unique_ptr<ReporterEngine>(
        new ReporterEngine(config, options, services, endpoint.unwrap())));
}

ReporterEngine::ReporterEngine(ReporterConfig config, EngineOptions options,
                               EngineServices services, Endpoint endpoint)
    : config_(std::move(config))
    , options_(options)
    , services_(std::move(services))
    , errors_(std::make_shared<ErrorSlot>())
{
    logger_ = std::make_shared<DispatchLogger>(
        services_.logger ? services_.logger : std::make_shared<common::NullLogger>(),
        services_.callbacks);

    transport_ = std::make_shared<TransportManager>(
        std::move(endpoint), config_.auth_token, options_,
        services_.connector, logger_, errors_);

    publisher_ = std::make_shared<EventPublisher>(transport_, logger_);

    sampler_ = std::make_shared<EventSampler>(
        config_, options_, services_.gate, services_.desktop,
        services_.callbacks, publisher_, logger_, errors_);

    capture_ = std::make_unique<CaptureLoop>(sampler_, options_.poll_interval, logger_);
}

ReporterEngine::~ReporterEngine() {
    stop();
}

common::EmptyResult ReporterEngine::start() {
    if (running_.load(std::memory_order_acquire)) {
        return common::EmptyResult::err(common::ErrorCode::Busy, "Reporter already running");
    }

    services_.gate->set_probe_timeout(options_.media_probe_timeout);

    auto transport = transport_->start();
    if (transport.is_err()) return transport;

    auto capture = capture_->start();
    if (capture.is_err()) {
        transport_->stop();
        return capture;
    }

    running_.store(true, std::memory_order_release);
    logger_->info(std::string("[Reporter] Started (desktop backend: ") +
                  services_.desktop->backend_name() + ", media reporting " +
                  (config_.enable_media_reporting ? "on" : "off") + ")");
    return common::EmptyResult::success();
}

bool ReporterEngine::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return true;
    }

    bool clean = capture_->stop(options_.stop_grace);
    transport_->stop();

    auto sent = transport_->stats();
    auto captured = sampler_->stats();
    logger_->info("[Reporter] Session summary: " + std::to_string(captured.cycles) + " cycles, " +
                  std::to_string(captured.window_events) + " window / " +
                  std::to_string(captured.media_events) + " media events, " +
                  std::to_string(sent.messages_sent) + " messages sent, " +
                  std::to_string(sent.messages_dropped) + " dropped");
    logger_->info("[Reporter] Stopped");
    return clean;
}

ReporterStatus ReporterEngine::status() const {
    ReporterStatus status;
    status.is_running = running_.load(std::memory_order_acquire);
    status.is_connected = status.is_running && transport_->is_connected();
    status.last_error = errors_->last();
    return status;
}

} // namespace core
