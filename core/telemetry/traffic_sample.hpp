#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "device/device_session.hpp"
#include "registry/router.hpp"

namespace routerlink {
namespace telemetry {

/**
 * @brief One traffic reading for one interface
 *
 * Counter and rate fields are passed through exactly as the device reported
 * them (numeric strings, no arithmetic). Immutable once produced.
 */
struct TrafficSample {
    registry::RouterId router_id = 0;
    std::string interface;
    std::string rx_bytes;
    std::string tx_bytes;
    std::string rx_packets;
    std::string tx_packets;
    std::string rx_bits_per_second;
    std::string tx_bits_per_second;
    std::chrono::system_clock::time_point timestamp;
};

// Builds a sample from a !re sentence of /interface/monitor-traffic
TrafficSample sample_from_sentence(registry::RouterId router_id, const std::string &interface,
                                   const device::Sentence &sentence);

// {"router_id", "interface", "rx-bytes", ..., "timestamp"}
nlohmann::json sample_to_json(const TrafficSample &sample);

// RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

}  // namespace telemetry
}  // namespace routerlink
