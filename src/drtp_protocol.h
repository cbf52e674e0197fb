#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using Bytes = std::vector<uint8_t>;

#pragma pack(push, 1)
struct DrtpHeader {
    uint32_t seq;        // Sequence Number (network order on wire)
    uint32_t ack;        // Acknowledgment Number (network order)
    uint16_t flags;      // Bit flags (network order)
    uint16_t window;     // Advertised window (network order)
};
#pragma pack(pop)

static_assert(sizeof(DrtpHeader) == 12, "DrtpHeader must be 12 bytes");

// Flags
enum : uint16_t {
    FLG_RESERVED = 1u << 0,  // defined, never set
    FLG_FIN      = 1u << 1,
    FLG_ACK      = 1u << 2,
    FLG_SYN      = 1u << 3,
};

constexpr size_t kDrtpHeaderSize = sizeof(DrtpHeader);
constexpr size_t kDrtpMaxPayload = 1460;
constexpr size_t kDrtpMaxDatagram = kDrtpHeaderSize + kDrtpMaxPayload; // 1472, one Ethernet UDP payload

// Window advertised in SYN-ACK and ACK headers. Not used for flow control.
constexpr uint16_t kDrtpAdvertisedWindow = 64;

// Decoded packet, host byte order.
struct DrtpPacket {
    uint32_t seq = 0;
    uint32_t ack = 0;
    uint16_t flags = 0;
    uint16_t window = 0;
    Bytes payload;

    bool syn() const { return (flags & FLG_SYN) != 0; }
    bool is_ack() const { return (flags & FLG_ACK) != 0; }
    bool fin() const { return (flags & FLG_FIN) != 0; }
    bool syn_ack() const { return (flags & (FLG_SYN | FLG_ACK)) == (FLG_SYN | FLG_ACK); }
};

// Serializes header fields followed by payload. Throws std::invalid_argument if
// payload is larger than kDrtpMaxPayload.
Bytes drtp_encode(uint32_t seq, uint32_t ack, uint16_t flags, uint16_t window,
                  const uint8_t* payload, size_t len);
Bytes drtp_encode(uint32_t seq, uint32_t ack, uint16_t flags, uint16_t window,
                  const Bytes& payload = {});

// Returns std::nullopt for a malformed datagram (shorter than the header or
// longer than kDrtpMaxDatagram). No integrity check is performed.
std::optional<DrtpPacket> drtp_decode(const uint8_t* data, size_t len);
std::optional<DrtpPacket> drtp_decode(const Bytes& datagram);

// Reads the sequence number of an encoded packet without a full decode.
uint32_t drtp_peek_seq(const Bytes& datagram);

std::string drtp_flags_to_string(uint16_t flags);
