#include <gtest/gtest.h>

#include <chrono>

#include "mocks/fake_device.hpp"
#include "telemetry/traffic_sample.hpp"

using namespace routerlink;
using namespace routerlink::telemetry;
using routerlink::tests::make_record;

TEST(TrafficSampleTest, CountersPassThroughVerbatim) {
    auto record = make_record({{"name", "ether1"},
                               {"rx-bytes", "18446744073709551615"},
                               {"tx-bytes", "42"},
                               {"rx-packets", "7"},
                               {"tx-packets", "9"},
                               {"rx-bits-per-second", "1.5kbps"},
                               {"tx-bits-per-second", "0"}});

    auto sample = sample_from_sentence(3, "ether1", record);

    EXPECT_EQ(sample.router_id, 3);
    EXPECT_EQ(sample.interface, "ether1");
    EXPECT_EQ(sample.rx_bytes, "18446744073709551615");
    EXPECT_EQ(sample.rx_bits_per_second, "1.5kbps");
    EXPECT_EQ(sample.tx_packets, "9");
}

TEST(TrafficSampleTest, FallsBackToRequestedInterface) {
    auto sample = sample_from_sentence(1, "wlan1", make_record({{"rx-bits-per-second", "100"}}));

    EXPECT_EQ(sample.interface, "wlan1");
    EXPECT_EQ(sample.tx_bytes, "");
}

TEST(TrafficSampleTest, JsonUsesDeviceFieldNames) {
    auto sample = sample_from_sentence(2, "ether2", make_record({{"name", "ether2"}, {"rx-bytes", "10"}}));

    auto json = sample_to_json(sample);

    EXPECT_EQ(json["router_id"], 2);
    EXPECT_EQ(json["interface"], "ether2");
    EXPECT_EQ(json["rx-bytes"], "10");
    EXPECT_TRUE(json.contains("tx-bits-per-second"));
    EXPECT_TRUE(json["timestamp"].is_string());
}

TEST(TrafficSampleTest, Rfc3339HasMillisecondsAndZulu) {
    // 2024-05-01T12:00:00Z
    std::chrono::system_clock::time_point tp(std::chrono::seconds(1714564800));
    tp += std::chrono::milliseconds(250);

    EXPECT_EQ(format_rfc3339(tp), "2024-05-01T12:00:00.250Z");
}

TEST(TrafficSampleTest, Rfc3339PadsMilliseconds) {
    std::chrono::system_clock::time_point tp(std::chrono::seconds(0));
    tp += std::chrono::milliseconds(5);

    EXPECT_EQ(format_rfc3339(tp), "1970-01-01T00:00:00.005Z");
}
