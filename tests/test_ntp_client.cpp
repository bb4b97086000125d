/// @file test_ntp_client.cpp
/// @brief Unit tests for the SNTP packet codec and UdpNtpQuery.
///
/// The transport tests run a one-shot SNTP responder on 127.0.0.1.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "timing/clock_source.hpp"
#include "timing/ntp_client.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <thread>
#include <variant>

using namespace chronoring;
using namespace chronoring::timing;
using namespace std::chrono_literals;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    chronoring::core::Logger::init(spdlog::level::warn, "chronoring_tests.log");
    const int result = doctest::Context(argc, argv).run();
    chronoring::core::Logger::shutdown();
    return result;
}

// =================================================================
// Helpers
// =================================================================

// 2024-06-15 22:30:00 UTC
static const Instant kClientTime{std::chrono::seconds{1718490600}};

static void put_be64(ntp::Packet& packet, std::size_t offset, u64 value)
{
    for (std::size_t i = 0; i < 8; ++i)
    {
        packet[offset + 7 - i] = static_cast<u8>(value & 0xFF);
        value >>= 8;
    }
}

static u64 get_be64(const ntp::Packet& packet, std::size_t offset)
{
    u64 value = 0;
    for (std::size_t i = 0; i < 8; ++i)
    {
        value = (value << 8) | packet[offset + i];
    }
    return value;
}

/// @brief Server reply to a request sent at t1, with receive/transmit times t2/t3.
static ntp::Packet make_reply(Instant t1, Instant t2, Instant t3, u8 stratum = 2)
{
    ntp::Packet reply{};
    reply[0] = 0x24;  // LI 0, VN 4, mode 4 (server)
    reply[1] = stratum;
    put_be64(reply, 24, ntp::to_ntp_timestamp(t1));
    put_be64(reply, 32, ntp::to_ntp_timestamp(t2));
    put_be64(reply, 40, ntp::to_ntp_timestamp(t3));
    return reply;
}

static bool is_error(const NtpQueryResult& result, TimeSourceError expected)
{
    return std::holds_alternative<TimeSourceError>(result) && std::get<TimeSourceError>(result) == expected;
}

/// @brief UDP socket on 127.0.0.1 with an ephemeral port.
class LoopbackServer
{
public:
    LoopbackServer()
        : m_fd(::socket(AF_INET, SOCK_DGRAM, 0))
    {
        REQUIRE(m_fd >= 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        REQUIRE(::bind(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        socklen_t len = sizeof(addr);
        REQUIRE(::getsockname(m_fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        m_port = ntohs(addr.sin_port);
    }

    ~LoopbackServer()
    {
        if (m_worker.joinable())
        {
            m_worker.join();
        }
        ::close(m_fd);
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    [[nodiscard]] u16 port() const { return m_port; }

    /// @brief Answer one request, echoing its transmit timestamp as originate.
    void respond_once(std::chrono::microseconds server_ahead)
    {
        m_worker = std::thread([this, server_ahead] {
            pollfd pfd{};
            pfd.fd = m_fd;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 5000) <= 0)
            {
                return;
            }

            ntp::Packet request{};
            sockaddr_in peer{};
            socklen_t peer_len = sizeof(peer);
            const ssize_t n = ::recvfrom(m_fd, request.data(), request.size(), 0,
                                         reinterpret_cast<sockaddr*>(&peer), &peer_len);
            if (n != static_cast<ssize_t>(request.size()))
            {
                return;
            }

            const Instant t1 = ntp::from_ntp_timestamp(get_be64(request, 40));
            ntp::Packet reply = make_reply(t1, t1 + server_ahead, t1 + server_ahead);
            // Echo the raw transmit field so the originate check is bit-exact
            for (std::size_t i = 0; i < 8; ++i)
            {
                reply[24 + i] = request[40 + i];
            }

            ::sendto(m_fd, reply.data(), reply.size(), 0, reinterpret_cast<sockaddr*>(&peer), peer_len);
        });
    }

private:
    int m_fd;
    u16 m_port = 0;
    std::thread m_worker;
};

// =================================================================
// Timestamps
// =================================================================

TEST_CASE("Unix epoch is 2208988800 s in NTP time")
{
    CHECK(ntp::to_ntp_timestamp(Instant{}) == (ntp::kUnixToNtpSeconds << 32));
    CHECK(ntp::from_ntp_timestamp(ntp::kUnixToNtpSeconds << 32) == Instant{});
}

TEST_CASE("Timestamp conversion keeps microseconds")
{
    const Instant t = kClientTime + 123456us;
    CHECK(ntp::from_ntp_timestamp(ntp::to_ntp_timestamp(t)) == t);

    // Half a second is exactly 0x80000000 in the fraction
    CHECK((ntp::to_ntp_timestamp(kClientTime + 500ms) & 0xFFFFFFFFULL) == 0x80000000ULL);
}

TEST_CASE("Era 1 timestamps after February 2036")
{
    // 2040-01-01 00:00:00 UTC
    const Instant t{std::chrono::seconds{2208988800LL}};
    const u64 ts = ntp::to_ntp_timestamp(t);

    CHECK((ts >> 32) < 0x80000000ULL);
    CHECK(ntp::from_ntp_timestamp(ts) == t);
}

// =================================================================
// Packet codec
// =================================================================

TEST_CASE("Client request layout")
{
    const ntp::Packet request = ntp::encode_request(kClientTime);

    CHECK(request[0] == 0x1B);
    CHECK(get_be64(request, 40) == ntp::to_ntp_timestamp(kClientTime));
    for (std::size_t i = 1; i < 40; ++i)
    {
        CHECK(request[i] == 0);
    }
}

TEST_CASE("Offset and round trip from the four timestamps")
{
    // Server 2 s ahead, 40 ms each way, 10 ms processing
    const Instant t1 = kClientTime;
    const Instant t2 = t1 + 2s + 40ms;
    const Instant t3 = t2 + 10ms;
    const Instant t4 = t1 + 90ms;

    const ntp::Packet reply = make_reply(t1, t2, t3, 1);
    const NtpQueryResult result = ntp::decode_response(reply, t1, t4);

    REQUIRE(std::holds_alternative<NtpSample>(result));
    const NtpSample& sample = std::get<NtpSample>(result);
    CHECK(sample.offset == 2s);
    CHECK(sample.round_trip == 80ms);
    CHECK(sample.stratum == 1);
}

TEST_CASE("Negative offset when the local clock is ahead")
{
    const Instant t1 = kClientTime;
    const Instant t2 = t1 - 750ms + 5ms;
    const Instant t4 = t1 + 10ms;

    const NtpQueryResult result = ntp::decode_response(make_reply(t1, t2, t2), t1, t4);

    REQUIRE(std::holds_alternative<NtpSample>(result));
    CHECK(std::get<NtpSample>(result).offset == -750ms);
}

TEST_CASE("Malformed replies are rejected")
{
    const Instant t1 = kClientTime;
    const Instant t4 = t1 + 20ms;
    const ntp::Packet good = make_reply(t1, t1 + 10ms, t1 + 10ms);

    SUBCASE("short packet")
    {
        CHECK(is_error(ntp::decode_response(std::span<const u8>(good.data(), 47), t1, t4),
                       TimeSourceError::MalformedResponse));
    }
    SUBCASE("client mode")
    {
        ntp::Packet p = good;
        p[0] = 0x23;
        CHECK(is_error(ntp::decode_response(p, t1, t4), TimeSourceError::MalformedResponse));
    }
    SUBCASE("kiss-o'-death stratum 0")
    {
        ntp::Packet p = good;
        p[1] = 0;
        CHECK(is_error(ntp::decode_response(p, t1, t4), TimeSourceError::MalformedResponse));
    }
    SUBCASE("originate does not match the request")
    {
        CHECK(is_error(ntp::decode_response(good, t1 + 1ms, t4), TimeSourceError::MalformedResponse));
    }
    SUBCASE("zero transmit timestamp")
    {
        ntp::Packet p = good;
        put_be64(p, 40, 0);
        CHECK(is_error(ntp::decode_response(p, t1, t4), TimeSourceError::MalformedResponse));
    }
}

// =================================================================
// UDP transport
// =================================================================

TEST_CASE("Query against a loopback responder")
{
    LoopbackServer server;
    server.respond_once(3s);

    // A frozen clock makes t1 == t4, so the whole difference is offset
    const ManualClockSource clock(kClientTime);
    UdpNtpQuery query(server.port());

    const NtpQueryResult result = query.query("127.0.0.1", 2000ms, clock);

    REQUIRE(std::holds_alternative<NtpSample>(result));
    CHECK(std::get<NtpSample>(result).offset == 3s);
    CHECK(std::get<NtpSample>(result).round_trip == 0us);
    CHECK(std::get<NtpSample>(result).stratum == 2);
}

TEST_CASE("Silent server times out within the budget")
{
    LoopbackServer server;  // bound, never answers

    const SystemClockSource clock;
    UdpNtpQuery query(server.port());

    const auto start = std::chrono::steady_clock::now();
    const NtpQueryResult result = query.query("127.0.0.1", 200ms, clock);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(is_error(result, TimeSourceError::Timeout));
    CHECK(elapsed >= 150ms);
    CHECK(elapsed < 2s);
}

TEST_CASE("Unresolvable host")
{
    const SystemClockSource clock;
    UdpNtpQuery query;

    const NtpQueryResult result = query.query("no-such-host.invalid", 500ms, clock);
    CHECK(is_error(result, TimeSourceError::DnsResolutionFailed));
}

TEST_CASE("Lookup goes through the supplied resolver")
{
    LoopbackServer server;
    server.respond_once(-1s);

    // Every name resolves to the loopback responder
    UdpNtpQuery query(server.port(), [](const char*, const char* service, const addrinfo* hints, addrinfo** result) {
        return ::getaddrinfo("127.0.0.1", service, hints, result);
    });

    const ManualClockSource clock(kClientTime);
    const NtpQueryResult result = query.query("ntp.chronoring.test", 2000ms, clock);

    REQUIRE(std::holds_alternative<NtpSample>(result));
    CHECK(std::get<NtpSample>(result).offset == -1s);
}

TEST_CASE("Slow name lookup is bounded by the query timeout")
{
    UdpNtpQuery query(123, [](const char*, const char*, const addrinfo*, addrinfo**) {
        std::this_thread::sleep_for(1500ms);
        return EAI_AGAIN;
    });

    const SystemClockSource clock;
    const auto start = std::chrono::steady_clock::now();
    const NtpQueryResult result = query.query("slow-dns.chronoring.test", 200ms, clock);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(is_error(result, TimeSourceError::DnsResolutionFailed));
    CHECK(elapsed >= 150ms);
    CHECK(elapsed < 1000ms);
}
