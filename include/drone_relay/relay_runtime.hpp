// === Relay Runtime ===========================================================
//
// Owns one relay process worth of components: broadcast hub, hardware link,
// state simulator and command router, all sharing one shutdown signal.

#pragma once

#include <atomic>
#include <memory>

#include <spdlog/logger.h>

#include "drone_relay/broadcast_hub.hpp"
#include "drone_relay/command_router.hpp"
#include "drone_relay/configuration.hpp"
#include "drone_relay/hardware_adapter.hpp"
#include "drone_relay/periodic_task.hpp"
#include "drone_relay/state_simulator.hpp"

namespace drone_relay {

/** @brief High-level owner of the background loops of the relay. */
class RelayRuntime final {
  public:
    /** @param gps_source Overrides the source built from the configuration; used by tests. */
    explicit RelayRuntime(Configuration configuration, GpsSourcePtr gps_source = nullptr);
    ~RelayRuntime();

    RelayRuntime(const RelayRuntime&) = delete;
    RelayRuntime& operator=(const RelayRuntime&) = delete;

    /** @brief Start the hardware poll, simulator tick and hub delivery loops. */
    void start();
    /** @brief Refuse new commands, raise shutdown and join every loop. Idempotent. */
    void stop();

    [[nodiscard]] CommandRouter& router() noexcept;
    [[nodiscard]] BroadcastHub& hub() noexcept;
    [[nodiscard]] StateSimulator& simulator() noexcept;
    [[nodiscard]] const HardwareLink& hardware() const noexcept;
    [[nodiscard]] bool running() const noexcept;

  private:
    Configuration configuration_;
    ShutdownSignal shutdown_signal_;
    BroadcastHub hub_;
    std::unique_ptr<HardwareLink> hardware_link_;
    PeriodicTask hardware_poll_task_;
    StateSimulator simulator_;
    CommandRouter router_;
    std::atomic<bool> flag_running_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
