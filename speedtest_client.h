#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <thread>
#include <utility>

#include "client_config.h"
#include "logger.h"
#include "offer_listener.h"
#include "transfer_orchestrator.h"
#include "transfer_result.h"

enum class ClientState : uint8_t {
    Idle,
    AwaitingOffer,
    RunningTransfers,
};

inline const char* to_string(ClientState state) {
    switch (state) {
        case ClientState::Idle:
            return "Idle";
        case ClientState::AwaitingOffer:
            return "AwaitingOffer";
        case ClientState::RunningTransfers:
            return "RunningTransfers";
    }
    return "Unknown";
}

struct ClientTimings {
    std::chrono::steady_clock::duration offer_timeout = client_config::OFFER_TIMEOUT;
    std::chrono::steady_clock::duration retry_delay   = client_config::DISCOVERY_RETRY_DELAY;
    OrchestratorTimeouts                transfers;
};

// Discovery / transfer cycle: Idle -> AwaitingOffer -> RunningTransfers -> Idle,
// repeated with the same configuration until stop() is called.
class SpeedTestClient {
public:
    using ResultHandler = TransferOrchestrator::ResultHandler;

    SpeedTestClient(ClientConfig config, ResultHandler on_result,
                    uint16_t discovery_port = DISCOVERY_PORT, ClientTimings timings = {})
        : config_(config),
          on_result_(std::move(on_result)),
          timings_(timings),
          listener_(discovery_port),
          orchestrator_(timings.transfers) {}

    void run() {
        while (running_) {
            if (!run_cycle() && running_) {
                // No offer: wait a little before listening again
                std::this_thread::sleep_for(timings_.retry_delay);
            }
        }
        set_state(ClientState::Idle);
    }

    // One discovery cycle. Returns false when no offer arrived in time.
    bool run_cycle() {
        set_state(ClientState::AwaitingOffer);
        Log::info("Client started, listening for offer requests...");

        auto server = listener_.wait_for_offer(timings_.offer_timeout);
        if (!server) {
            if (running_) {
                Log::warn("No offer received, retrying discovery");
            }
            set_state(ClientState::Idle);
            return false;
        }

        Log::info("Received offer from {} (udp port {}, tcp port {})",
                  server->address.to_string(), server->udp_port, server->tcp_port);

        set_state(ClientState::RunningTransfers);
        auto results = orchestrator_.run(*server, config_, on_result_);
        cycles_.fetch_add(1);

        Log::info("All transfers complete, listening to offer requests ({} results)",
                  results.size());
        set_state(ClientState::Idle);
        return true;
    }

    // Callable from any thread. Discovery is interrupted at once; running transfers
    // finish (each is bounded by its timeouts) before run() returns. A stopped client
    // does not listen again.
    void stop() {
        running_ = false;
        listener_.abort();
    }

    ClientState state() const {
        return state_.load();
    }

    uint64_t cycles_completed() const {
        return cycles_.load();
    }

    uint16_t discovery_port() const {
        return listener_.local_port();
    }

private:
    void set_state(ClientState state) {
        if (state_.exchange(state) != state) {
            Log::debug("Client state: {}", to_string(state));
        }
    }

    ClientConfig             config_;
    ResultHandler            on_result_;
    ClientTimings            timings_;
    OfferListener            listener_;
    TransferOrchestrator     orchestrator_;
    std::atomic<ClientState> state_{ClientState::Idle};
    std::atomic<bool>        running_{true};
    std::atomic<uint64_t>    cycles_{0};
};
