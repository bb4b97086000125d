/// @file ntp_client.cpp
/// @brief SNTP packet codec and UDP transport.

#include "timing/ntp_client.hpp"
#include "core/logger.hpp"

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace chronoring::timing
{

namespace
{

constexpr i64 kMicrosPerSecond = 1'000'000;

// Byte offsets of the timestamps in a 48-byte packet
constexpr std::size_t kOriginateOffset = 24;
constexpr std::size_t kReceiveOffset   = 32;
constexpr std::size_t kTransmitOffset  = 40;

u64 read_be64(std::span<const u8> bytes, std::size_t offset)
{
    u64 value = 0;
    for (std::size_t i = 0; i < 8; ++i)
    {
        value = (value << 8) | bytes[offset + i];
    }
    return value;
}

void write_be64(ntp::Packet& packet, std::size_t offset, u64 value)
{
    for (std::size_t i = 0; i < 8; ++i)
    {
        packet[offset + 7 - i] = static_cast<u8>(value & 0xFF);
        value >>= 8;
    }
}

/// @brief Owns a socket descriptor; closes it on scope exit.
class UdpSocket
{
public:
    explicit UdpSocket(int fd) : m_fd(fd) {}
    ~UdpSocket()
    {
        if (m_fd >= 0)
        {
            ::close(m_fd);
        }
    }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    [[nodiscard]] int fd() const { return m_fd; }
    [[nodiscard]] bool valid() const { return m_fd >= 0; }

private:
    int m_fd;
};

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

/// @brief Result slot shared between a lookup thread and its caller.
struct PendingLookup
{
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    bool abandoned = false;
    int rc = EAI_FAIL;
    addrinfo* result = nullptr;
};

/// @brief Name lookup bounded by `deadline`.
///
/// The resolver runs on a detached thread. If the deadline passes first the
/// caller leaves, and the thread frees its own result when it finishes.
/// @return The resolver's return code, or std::nullopt on timeout.
std::optional<int> resolve_before(const UdpNtpQuery::Resolver& resolver,
                                  const std::string& host,
                                  const std::string& service,
                                  std::chrono::steady_clock::time_point deadline,
                                  AddrInfoPtr& out)
{
    auto pending = std::make_shared<PendingLookup>();

    std::thread([pending, resolver, host, service] {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_DGRAM;

        addrinfo* raw = nullptr;
        const int rc = resolver(host.c_str(), service.c_str(), &hints, &raw);

        std::lock_guard lock(pending->mutex);
        if (pending->abandoned)
        {
            if (rc == 0 && raw != nullptr)
            {
                ::freeaddrinfo(raw);
            }
            return;
        }
        pending->rc = rc;
        pending->result = raw;
        pending->done = true;
        pending->done_cv.notify_all();
    }).detach();

    std::unique_lock lock(pending->mutex);
    if (!pending->done_cv.wait_until(lock, deadline, [&pending] { return pending->done; }))
    {
        pending->abandoned = true;
        return std::nullopt;
    }

    out.reset(pending->rc == 0 ? pending->result : nullptr);
    return pending->rc;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Timestamp conversion
//
// NTP time is seconds since 1900-01-01 in 32.32 fixed point. Era 0
// wraps in February 2036; seconds fields below 2^31 are read as era 1.
// -----------------------------------------------------------------

namespace ntp
{

u64 to_ntp_timestamp(Instant instant)
{
    const i64 micros = instant.time_since_epoch().count();
    i64 seconds = micros / kMicrosPerSecond;
    i64 remainder = micros % kMicrosPerSecond;
    if (remainder < 0)
    {
        remainder += kMicrosPerSecond;
        --seconds;
    }

    const u64 ntp_seconds = static_cast<u64>(seconds + static_cast<i64>(kUnixToNtpSeconds)) & 0xFFFFFFFFULL;
    const u64 fraction = (static_cast<u64>(remainder) << 32) / static_cast<u64>(kMicrosPerSecond);

    return (ntp_seconds << 32) | fraction;
}

Instant from_ntp_timestamp(u64 timestamp)
{
    i64 seconds = static_cast<i64>(timestamp >> 32);
    if (seconds < 0x80000000LL)
    {
        seconds += 0x100000000LL;
    }

    const u64 fraction = timestamp & 0xFFFFFFFFULL;
    // Rounded, so a microsecond Instant survives to_ntp_timestamp() unchanged
    const i64 micros = static_cast<i64>((fraction * static_cast<u64>(kMicrosPerSecond) + 0x80000000ULL) >> 32);

    return Instant{Duration{(seconds - static_cast<i64>(kUnixToNtpSeconds)) * kMicrosPerSecond + micros}};
}

Packet encode_request(Instant t1)
{
    Packet packet{};
    packet[0] = 0x1B;  // LI = 0, VN = 3, Mode = 3 (client)
    write_be64(packet, kTransmitOffset, to_ntp_timestamp(t1));
    return packet;
}

// -----------------------------------------------------------------
// Offset and delay
//
// t1 client transmit, t2 server receive, t3 server transmit, t4 client receive
// offset = ((t2 − t1) + (t3 − t4)) / 2
// delay  = (t4 − t1) − (t3 − t2)
// -----------------------------------------------------------------

NtpQueryResult decode_response(std::span<const u8> packet, Instant t1, Instant t4)
{
    if (packet.size() < kPacketSize)
    {
        return TimeSourceError::MalformedResponse;
    }

    const u8 mode = packet[0] & 0x07;
    const u8 stratum = packet[1];
    if (mode != 4 || stratum == 0)
    {
        return TimeSourceError::MalformedResponse;
    }

    if (read_be64(packet, kOriginateOffset) != to_ntp_timestamp(t1))
    {
        return TimeSourceError::MalformedResponse;
    }

    const u64 receive = read_be64(packet, kReceiveOffset);
    const u64 transmit = read_be64(packet, kTransmitOffset);
    if (transmit == 0)
    {
        return TimeSourceError::MalformedResponse;
    }

    const Instant t2 = from_ntp_timestamp(receive);
    const Instant t3 = from_ntp_timestamp(transmit);

    return NtpSample{
        .offset     = ((t2 - t1) + (t3 - t4)) / 2,
        .round_trip = (t4 - t1) - (t3 - t2),
        .stratum    = stratum,
    };
}

} // namespace ntp

// -----------------------------------------------------------------
// UDP transport
// -----------------------------------------------------------------

UdpNtpQuery::UdpNtpQuery(u16 port, Resolver resolver)
    : m_port(port)
    , m_resolver(resolver ? std::move(resolver) : Resolver(&::getaddrinfo))
{
}

NtpQueryResult UdpNtpQuery::query(const std::string& host,
                                  std::chrono::milliseconds timeout,
                                  const ClockSource& clock)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // The lookup shares the per-attempt budget with the exchange itself
    AddrInfoPtr addresses(nullptr, &::freeaddrinfo);
    const auto rc = resolve_before(m_resolver, host, std::to_string(m_port), deadline, addresses);
    if (!rc)
    {
        CHR_CORE_WARN("NTP: resolving '{}' exceeded {} ms", host, timeout.count());
        return TimeSourceError::DnsResolutionFailed;
    }
    if (*rc != 0)
    {
        CHR_CORE_WARN("NTP: cannot resolve '{}': {}", host, ::gai_strerror(*rc));
        return TimeSourceError::DnsResolutionFailed;
    }

    for (const addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next)
    {
        UdpSocket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.valid())
        {
            continue;
        }
        if (::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen) != 0)
        {
            continue;
        }

        const Instant t1 = clock.now();
        const ntp::Packet request = ntp::encode_request(t1);
        if (::send(sock.fd(), request.data(), request.size(), 0) != static_cast<ssize_t>(request.size()))
        {
            CHR_CORE_WARN("NTP: send to '{}' failed: {}", host, std::strerror(errno));
            return TimeSourceError::SocketError;
        }

        pollfd pfd{};
        pfd.fd = sock.fd();
        pfd.events = POLLIN;

        for (;;)
        {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
            {
                return TimeSourceError::Timeout;
            }

            const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                CHR_CORE_WARN("NTP: poll on '{}' failed: {}", host, std::strerror(errno));
                return TimeSourceError::SocketError;
            }
            if (ready == 0)
            {
                return TimeSourceError::Timeout;
            }
            break;
        }

        std::array<u8, 68> response{};  // room for optional key id and digest
        const ssize_t received = ::recv(sock.fd(), response.data(), response.size(), 0);
        const Instant t4 = clock.now();
        if (received < 0)
        {
            CHR_CORE_WARN("NTP: receive from '{}' failed: {}", host, std::strerror(errno));
            return TimeSourceError::SocketError;
        }

        return ntp::decode_response(std::span<const u8>(response.data(), static_cast<std::size_t>(received)), t1, t4);
    }

    CHR_CORE_WARN("NTP: no usable address for '{}'", host);
    return TimeSourceError::SocketError;
}

} // namespace chronoring::timing
