#pragma once

/// @file ntp_client.hpp
/// @brief SNTP (RFC 4330) client: one request/response exchange per query.

#include "core/error.hpp"
#include "core/types.hpp"
#include "timing/clock_source.hpp"

#include <array>
#include <chrono>
#include <functional>
#include <span>
#include <string>
#include <variant>

struct addrinfo;

namespace chronoring::timing
{
    /// @brief Outcome of a successful exchange with one server.
    struct NtpSample
    {
        Duration offset;      ///< ((t2 − t1) + (t3 − t4)) / 2, server minus local
        Duration round_trip;  ///< (t4 − t1) − (t3 − t2)
        u8 stratum = 0;
    };

    using NtpQueryResult = std::variant<NtpSample, TimeSourceError>;

    /// @brief One request/response round trip against a named server.
    ///
    /// Implementations must return within roughly `timeout` and never throw.
    class NtpQuery
    {
    public:
        virtual ~NtpQuery() = default;

        [[nodiscard]] virtual NtpQueryResult query(const std::string& host,
                                                   std::chrono::milliseconds timeout,
                                                   const ClockSource& clock) = 0;
    };

    /// @brief Packet encoding and decoding, independent of any socket.
    namespace ntp
    {
        inline constexpr std::size_t kPacketSize = 48;
        inline constexpr u64 kUnixToNtpSeconds = 2208988800ULL;  // 1900-01-01 → 1970-01-01

        using Packet = std::array<u8, kPacketSize>;

        /// @brief 64-bit NTP timestamp (32.32 fixed point seconds since 1900).
        [[nodiscard]] u64 to_ntp_timestamp(Instant instant);
        [[nodiscard]] Instant from_ntp_timestamp(u64 timestamp);

        /// @brief Client request (LI 0, VN 3, mode 3) carrying t1 as transmit timestamp.
        [[nodiscard]] Packet encode_request(Instant t1);

        /// @brief Validates a server reply and computes offset and delay.
        ///
        /// Rejects short packets, a mode other than server (4), stratum 0
        /// (kiss-o'-death), an originate timestamp not matching the request,
        /// and a zero transmit timestamp.
        [[nodiscard]] NtpQueryResult decode_response(std::span<const u8> packet, Instant t1, Instant t4);
    }

    /// @brief NtpQuery over UDP sockets (POSIX).
    class UdpNtpQuery final : public NtpQuery
    {
    public:
        /// @brief Name lookup with the getaddrinfo() signature.
        using Resolver = std::function<int(const char* host, const char* service,
                                           const addrinfo* hints, addrinfo** result)>;

        /// @param resolver Lookup to use; getaddrinfo() when empty. It runs on a
        ///        helper thread and is abandoned once the query timeout passes.
        explicit UdpNtpQuery(u16 port = 123, Resolver resolver = {});

        [[nodiscard]] NtpQueryResult query(const std::string& host,
                                           std::chrono::milliseconds timeout,
                                           const ClockSource& clock) override;

    private:
        u16 m_port;
        Resolver m_resolver;
    };

} // namespace chronoring::timing
