// test_packet_codec.cpp - DRTP header encode/decode
//
// Tests:
// 1. Wire layout of the 12-byte header
// 2. Decode of header plus payload
// 3. Malformed and oversize datagrams
// 4. Flag helpers

#include "drtp_protocol.h"
#include "sim_link.h"

#include <iostream>
#include <stdexcept>

int main() {
    std::cout << "=== DRTP Packet Codec Test ===\n\n";
    Tally t;

    std::cout << "TEST 1: Wire layout\n";
    {
        Bytes b = drtp_encode(0x01020304, 0x0A0B0C0D, FLG_SYN | FLG_ACK, 64);
        const Bytes want = {0x01, 0x02, 0x03, 0x04, 0x0A, 0x0B, 0x0C, 0x0D, 0x00, 0x0C, 0x00, 0x40};
        t.check(b == want, "SYN-ACK header is big-endian seq, ack, flags, window");

        Bytes syn = drtp_encode(0, 0, FLG_SYN, 0);
        t.check(syn.size() == kDrtpHeaderSize && syn[9] == 0x08, "SYN is a bare header with flags=8");

        Bytes fin = drtp_encode(0, 0, FLG_FIN, 0);
        t.check(fin[9] == 0x02, "FIN flag is bit 1");

        Bytes data = drtp_encode(7, 1, 0, 0, make_payload(kDrtpMaxPayload));
        t.check(data.size() == kDrtpMaxDatagram, "full data packet is 1472 bytes");
        t.check(drtp_peek_seq(data) == 7, "peek_seq reads seq without decoding");
    }

    std::cout << "\nTEST 2: Decode\n";
    {
        Bytes payload = make_payload(100, 9);
        auto pkt = drtp_decode(drtp_encode(42, 1, 0, 0, payload));
        t.check(pkt.has_value(), "well-formed datagram decodes");
        if (pkt) {
            t.check(pkt->seq == 42 && pkt->ack == 1 && pkt->flags == 0 && pkt->window == 0,
                    "header fields survive");
            t.check(pkt->payload == payload, "payload is everything after byte 12");
            t.check(!pkt->syn() && !pkt->is_ack() && !pkt->fin(), "data packet carries no flags");
        }

        auto bare = drtp_decode(drtp_encode(1, 1, FLG_ACK, 0));
        t.check(bare && bare->payload.empty() && bare->is_ack(), "bare ACK has empty payload");
    }

    std::cout << "\nTEST 3: Malformed input\n";
    {
        Bytes short_dgram(kDrtpHeaderSize - 1, 0);
        t.check(!drtp_decode(short_dgram), "11-byte datagram is rejected");
        t.check(!drtp_decode(Bytes{}), "empty datagram is rejected");

        Bytes oversize(kDrtpMaxDatagram + 1, 0);
        t.check(!drtp_decode(oversize), "1473-byte datagram is rejected");

        bool threw = false;
        try {
            drtp_encode(1, 1, 0, 0, make_payload(kDrtpMaxPayload + 1));
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        t.check(threw, "encoding a 1461-byte payload throws invalid_argument");
    }

    std::cout << "\nTEST 4: Flags\n";
    {
        DrtpPacket p;
        p.flags = FLG_SYN | FLG_ACK;
        t.check(p.syn_ack() && p.syn() && p.is_ack(), "SYN|ACK reports syn_ack()");
        p.flags = FLG_SYN;
        t.check(!p.syn_ack(), "SYN alone is not syn_ack()");

        t.check(drtp_flags_to_string(0) == "DATA", "no flags prints DATA");
        t.check(drtp_flags_to_string(FLG_SYN | FLG_ACK) == "SYN|ACK", "SYN|ACK prints both");
        t.check(drtp_flags_to_string(FLG_FIN) == "FIN", "FIN prints FIN");
        t.check(drtp_flags_to_string(FLG_RESERVED) == "RESERVED", "bit 0 prints RESERVED");
    }

    return t.finish("packet codec");
}
