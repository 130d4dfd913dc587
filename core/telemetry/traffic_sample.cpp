#include "traffic_sample.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace routerlink {
namespace telemetry {

TrafficSample sample_from_sentence(registry::RouterId router_id, const std::string &interface,
                                   const device::Sentence &sentence) {
    TrafficSample sample;
    sample.router_id = router_id;
    // Device echoes the interface name as "name"; fall back to the requested one
    sample.interface = sentence.get("name");
    if (sample.interface.empty()) {
        sample.interface = interface;
    }
    sample.rx_bytes = sentence.get("rx-bytes");
    sample.tx_bytes = sentence.get("tx-bytes");
    sample.rx_packets = sentence.get("rx-packets");
    sample.tx_packets = sentence.get("tx-packets");
    sample.rx_bits_per_second = sentence.get("rx-bits-per-second");
    sample.tx_bits_per_second = sentence.get("tx-bits-per-second");
    sample.timestamp = std::chrono::system_clock::now();
    return sample;
}

nlohmann::json sample_to_json(const TrafficSample &sample) {
    return {{"router_id", sample.router_id},
            {"interface", sample.interface},
            {"rx-bytes", sample.rx_bytes},
            {"tx-bytes", sample.tx_bytes},
            {"rx-packets", sample.rx_packets},
            {"tx-packets", sample.tx_packets},
            {"rx-bits-per-second", sample.rx_bits_per_second},
            {"tx-bits-per-second", sample.tx_bits_per_second},
            {"timestamp", format_rfc3339(sample.timestamp)}};
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

}  // namespace telemetry
}  // namespace routerlink
