/**
 * @file test_ssdp.cpp
 * @brief Unit tests for the SSDP search datagram and answer matching
 */

#include <gtest/gtest.h>
#include "ssdp_discovery.hpp"
#include "utils.hpp"

#include <socketwrapper.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>

using namespace discovery;
using namespace std::chrono_literals;

TEST(SsdpTest, SearchRequestIsByteExact) {
    const std::string expected =
        "M-SEARCH * HTTP/1.1\r\n"
        "HOST: 239.255.255.250:1900\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: 2\r\n"
        "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
        "\r\n";

    EXPECT_EQ(search_request(), expected);
}

TEST(SsdpTest, VendorAnswersAreRecognized) {
    EXPECT_TRUE(is_vendor_response(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "LOCATION: http://192.168.1.20:8091/XD/BO5EBO5E-F00D-F00D-FEED-A0F6FD123456.xml\r\n"
        "SERVER: Linux/2.6 UPnP/1.0 Bose SoundTouch/1.0\r\n"
        "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n\r\n"));
    EXPECT_TRUE(is_vendor_response("SERVER: SoundTouch\r\n"));
}

TEST(SsdpTest, OtherAnswersAreIgnored) {
    EXPECT_FALSE(is_vendor_response(
        "HTTP/1.1 200 OK\r\n"
        "SERVER: Linux UPnP/1.0 Sonos/70.3-35220 (ZPS9)\r\n"
        "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n\r\n"));
    EXPECT_FALSE(is_vendor_response(""));
    // Matching is case sensitive
    EXPECT_FALSE(is_vendor_response("server: bose"));
}

namespace {

// Answers GET /info for every host and counts the requests per host
class CountingClient : public http::client {
public:
    http::response send(const std::string& host, uint16_t, http::request,
        std::chrono::milliseconds) const override {
        {
            std::lock_guard<std::mutex> lock {mutex_};
            fetches_[host]++;
        }

        http::response res {200};
        res.set_body("<info deviceID=\"0CB2B7000002\"><name>Bedroom</name><type>SoundTouch 10</type></info>");
        return res;
    }

    int fetches(const std::string& host) const {
        std::lock_guard<std::mutex> lock {mutex_};
        auto it = fetches_.find(host);
        return (it != fetches_.end()) ? it->second : 0;
    }

    size_t hosts() const {
        std::lock_guard<std::mutex> lock {mutex_};
        return fetches_.size();
    }

private:
    mutable std::mutex mutex_;
    mutable std::map<std::string, int> fetches_;
};

const char* vendor_answer =
    "HTTP/1.1 200 OK\r\n"
    "SERVER: Linux/2.6 UPnP/1.0 Bose SoundTouch/1.0\r\n"
    "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n\r\n";

const char* other_answer =
    "HTTP/1.1 200 OK\r\n"
    "SERVER: Linux UPnP/1.0 Sonos/70.3\r\n"
    "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n\r\n";

} // namespace

// A responder on 127.0.0.1 stands in for the multicast group. Answers from
// 127.0.0.1 claim to be a speaker, answers from 127.0.0.2 come from another vendor.
class SsdpLoopbackTest : public ::testing::Test {
protected:
    static constexpr uint16_t responder_port = 28093;

    using udp_socket = net::udp_socket<net::ip_version::v4>;

    // Waits for the M-SEARCH and keeps answering until stop_ is set
    void respond(bool send_vendor_answers) {
        udp_socket responder {"127.0.0.1", responder_port};
        udp_socket other {"127.0.0.2", 0};
        ready_ = true;

        if(!utils::wait_readable(responder.get(), 2000ms))
            return;

        auto [buffer, peer] = responder.read<char>(4096);
        {
            std::lock_guard<std::mutex> lock {received_mutex_};
            received_ = std::string {buffer.data(), buffer.size()};
        }

        const std::string vendor {vendor_answer};
        const std::string other_vendor {other_answer};
        for(int round = 0; !stop_.load() && round < rounds_; round++)
        {
            other.send(peer.addr, peer.port, other_vendor);
            if(send_vendor_answers)
                responder.send(peer.addr, peer.port, vendor);
            std::this_thread::sleep_for(20ms);
        }
    }

    void start(bool send_vendor_answers) {
        responder_thread_ = std::thread([this, send_vendor_answers]() { respond(send_vendor_answers); });
        while(!ready_.load())
            std::this_thread::sleep_for(1ms);
    }

    std::string received() {
        std::lock_guard<std::mutex> lock {received_mutex_};
        return received_;
    }

    void TearDown() override {
        stop_ = true;
        if(responder_thread_.joinable())
            responder_thread_.join();
    }

    CountingClient client_;
    info_fetcher fetcher_ {client_};
    int rounds_ = 1000;

private:
    std::mutex received_mutex_;
    std::string received_;
    std::atomic<bool> ready_ {false};
    std::atomic<bool> stop_ {false};
    std::thread responder_thread_;
};

TEST_F(SsdpLoopbackTest, RepeatedAnswersFetchOncePerHost) {
    start(true);
    ssdp_prober prober {fetcher_, "127.0.0.1", responder_port};

    soundtouch::device_map devices = prober.probe(600ms);

    EXPECT_EQ(received(), search_request());
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.at("127.0.0.1").name, "Bedroom");
    EXPECT_EQ(client_.fetches("127.0.0.1"), 1);
}

TEST_F(SsdpLoopbackTest, OtherVendorsAreNeverFetched) {
    start(true);
    ssdp_prober prober {fetcher_, "127.0.0.1", responder_port};

    soundtouch::device_map devices = prober.probe(600ms);

    EXPECT_EQ(devices.count("127.0.0.2"), 0u);
    EXPECT_EQ(client_.fetches("127.0.0.2"), 0);
    EXPECT_EQ(client_.hosts(), 1u);
}

TEST_F(SsdpLoopbackTest, ContinuousAnswersDoNotExtendTheRun) {
    start(true);
    ssdp_prober prober {fetcher_, "127.0.0.1", responder_port};

    auto begin = std::chrono::steady_clock::now();
    prober.probe(500ms);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    // The responder is still sending when the run ends, allow for scheduling only
    EXPECT_LT(elapsed, 500ms + 150ms);
}

TEST_F(SsdpLoopbackTest, QuietSocketEndsRunEarly) {
    rounds_ = 3;
    start(false);
    ssdp_prober prober {fetcher_, "127.0.0.1", responder_port, 200ms};

    auto begin = std::chrono::steady_clock::now();
    soundtouch::device_map devices = prober.probe(3000ms);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_TRUE(devices.empty());
    EXPECT_EQ(client_.hosts(), 0u);
    EXPECT_LT(elapsed, 1500ms);
}
