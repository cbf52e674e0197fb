#include "drtp_protocol.h"

#include <arpa/inet.h>

#include <cstring>
#include <stdexcept>

Bytes drtp_encode(uint32_t seq, uint32_t ack, uint16_t flags, uint16_t window,
                  const uint8_t* payload, size_t len) {
    if (len > kDrtpMaxPayload) {
        throw std::invalid_argument("drtp_encode: payload of " + std::to_string(len) +
                                    " bytes exceeds " + std::to_string(kDrtpMaxPayload));
    }

    DrtpHeader h{};
    h.seq = htonl(seq);
    h.ack = htonl(ack);
    h.flags = htons(flags);
    h.window = htons(window);

    Bytes out(kDrtpHeaderSize + len);
    std::memcpy(out.data(), &h, sizeof(h));
    if (len > 0) std::memcpy(out.data() + kDrtpHeaderSize, payload, len);
    return out;
}

Bytes drtp_encode(uint32_t seq, uint32_t ack, uint16_t flags, uint16_t window,
                  const Bytes& payload) {
    return drtp_encode(seq, ack, flags, window, payload.data(), payload.size());
}

std::optional<DrtpPacket> drtp_decode(const uint8_t* data, size_t len) {
    if (len < kDrtpHeaderSize || len > kDrtpMaxDatagram) return std::nullopt;

    DrtpHeader h{};
    std::memcpy(&h, data, sizeof(h));

    DrtpPacket pkt;
    pkt.seq = ntohl(h.seq);
    pkt.ack = ntohl(h.ack);
    pkt.flags = ntohs(h.flags);
    pkt.window = ntohs(h.window);
    pkt.payload.assign(data + kDrtpHeaderSize, data + len);
    return pkt;
}

std::optional<DrtpPacket> drtp_decode(const Bytes& datagram) {
    return drtp_decode(datagram.data(), datagram.size());
}

uint32_t drtp_peek_seq(const Bytes& datagram) {
    if (datagram.size() < kDrtpHeaderSize) return 0;
    uint32_t seq = 0;
    std::memcpy(&seq, datagram.data(), sizeof(seq));
    return ntohl(seq);
}

std::string drtp_flags_to_string(uint16_t flags) {
    std::string s;
    auto add = [&](uint16_t bit, const char* name) {
        if ((flags & bit) == 0) return;
        if (!s.empty()) s += "|";
        s += name;
    };
    add(FLG_SYN, "SYN");
    add(FLG_ACK, "ACK");
    add(FLG_FIN, "FIN");
    add(FLG_RESERVED, "RESERVED");
    return s.empty() ? "DATA" : s;
}

