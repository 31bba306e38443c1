#include "drone_relay/relay_runtime.hpp"

#include "drone_relay/logging.hpp"
#include "drone_relay/version.hpp"

namespace drone_relay {

namespace {

std::unique_ptr<HardwareLink> make_hardware_link(const HardwareConfig& config, GpsSourcePtr gps_source) {
    if (gps_source == nullptr) {
        gps_source = make_gps_source(config);
    }
    return probe_hardware(config, std::move(gps_source));
}

}  // namespace

RelayRuntime::RelayRuntime(Configuration configuration, GpsSourcePtr gps_source)
    : configuration_(std::move(configuration)),
      hub_(configuration_.hub, shutdown_signal_),
      hardware_link_(make_hardware_link(configuration_.hardware, std::move(gps_source))),
      hardware_poll_task_("hardware-poll", configuration_.hardware.poll_period, [this]() { hardware_link_->poll(); }, shutdown_signal_),
      simulator_(configuration_.simulator, *hardware_link_, hub_, shutdown_signal_),
      router_(simulator_),
      logger_(get_logger()) {}

RelayRuntime::~RelayRuntime() {
    stop();
}

/**
 * @brief Launch every background loop. Hub loops start first so the first
 *        telemetry tick already has a consumer.
 */
void RelayRuntime::start() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info(
        R"({{"event":"runtime_start","version":"{}","hardware":"{}","simulated":{}}})",
        k_version,
        hardware_link_->name(),
        hardware_link_->simulated()
    );
    hub_.start();
    hardware_poll_task_.start();
    simulator_.start();
}

void RelayRuntime::stop() {
    router_.stop_accepting();
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down relay runtime");
    shutdown_signal_.request();
    simulator_.stop();
    hardware_poll_task_.stop();
    hub_.stop();
    logger_->info(R"({{"event":"runtime_stopped"}})");
    flush_logger();
}

CommandRouter& RelayRuntime::router() noexcept {
    return router_;
}

BroadcastHub& RelayRuntime::hub() noexcept {
    return hub_;
}

StateSimulator& RelayRuntime::simulator() noexcept {
    return simulator_;
}

const HardwareLink& RelayRuntime::hardware() const noexcept {
    return *hardware_link_;
}

bool RelayRuntime::running() const noexcept {
    return flag_running_.load();
}

}  // namespace drone_relay
