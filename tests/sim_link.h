// sim_link.h - deterministic in-memory link for protocol tests
//
// The client side talks to a SimLink. Every datagram it sends passes through
// the client->server pipe and is handed synchronously to the peer callback
// (usually ServerSession::on_datagram). Whatever the peer sends back through
// reply() passes the server->client pipe and is queued for the next recv().
// An empty queue answers a timed recv with Timeout at once, and a blocking
// recv with Error, so lost packets never stall a test.

#pragma once

#include "DrtpTransport.h"
#include "drtp_protocol.h"
#include "drtp_stream.h"

#include <algorithm>
#include <deque>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

class MemorySource : public ByteSource {
public:
    explicit MemorySource(Bytes d) : data(std::move(d)) {}

    bool read(size_t max_len, Bytes& out) override {
        size_t n = std::min(max_len, data.size() - pos);
        out.assign(data.begin() + pos, data.begin() + pos + n);
        pos += n;
        return true;
    }

private:
    Bytes data;
    size_t pos = 0;
};

class MemorySink : public ByteSink {
public:
    bool write(const uint8_t* d, size_t len) override {
        data.insert(data.end(), d, d + len);
        ++writes;
        return true;
    }
    using ByteSink::write;

    Bytes data;
    size_t writes = 0;
};

enum class Fate {
    Deliver,
    Drop,
    Duplicate,
    Delay,      // held back and delivered right after the next datagram
};

// index counts every datagram offered to the pipe, starting at 0.
using FateFn = std::function<Fate(const DrtpPacket& pkt, size_t index)>;

// One direction of the link.
class SimPipe {
public:
    FateFn fate;
    std::vector<DrtpPacket> offered;    // everything the sender put on the wire
    std::vector<DrtpPacket> delivered;  // what reached the other side, in order

    void push(const Bytes& d, std::deque<Bytes>& out) {
        auto pkt = drtp_decode(d);
        size_t idx = offered.size();
        if (pkt) offered.push_back(*pkt);

        Fate f = (fate && pkt) ? fate(*pkt, idx) : Fate::Deliver;
        switch (f) {
            case Fate::Drop: return;
            case Fate::Delay: held.push_back(d); return;
            case Fate::Duplicate: emit(d, out); emit(d, out); break;
            case Fate::Deliver: emit(d, out); break;
        }
        for (auto& h : held) emit(h, out);
        held.clear();
    }

private:
    void emit(const Bytes& d, std::deque<Bytes>& out) {
        auto pkt = drtp_decode(d);
        if (pkt) delivered.push_back(*pkt);
        out.push_back(d);
    }

    std::deque<Bytes> held;
};

class SimLink : public DatagramTransport {
public:
    using Peer = std::function<bool(const Bytes& datagram, DatagramTransport& reply)>;

    SimPipe to_server;
    SimPipe to_client;
    Peer peer;

    // Interleaved record of what each side actually saw: 'S' for a datagram
    // handed to the server, 'C' for one the client received.
    std::vector<std::pair<char, DrtpPacket>> trace;

    bool send(const Bytes& datagram) override {
        std::deque<Bytes> out;
        to_server.push(datagram, out);
        for (auto& d : out) {
            auto pkt = drtp_decode(d);
            if (pkt) trace.emplace_back('S', *pkt);
            if (peer && !peer(d, back)) return false;
        }
        return true;
    }

    RecvStatus recv(Bytes& out, std::optional<std::chrono::milliseconds> timeout) override {
        if (inbox.empty()) return timeout ? RecvStatus::Timeout : RecvStatus::Error;
        out = std::move(inbox.front());
        inbox.pop_front();
        auto pkt = drtp_decode(out);
        if (pkt) trace.emplace_back('C', *pkt);
        return RecvStatus::Ok;
    }

    DatagramTransport& reply() { return back; }

    // Injects a raw datagram for the client, bypassing the pipe.
    void inject(const Bytes& datagram) { inbox.push_back(datagram); }

    // Data packets the client sent, by seq, in send order.
    std::vector<uint32_t> data_seqs() const {
        std::vector<uint32_t> v;
        for (auto& p : to_server.offered) {
            if (p.flags == 0) v.push_back(p.seq);
        }
        return v;
    }

private:
    class Back : public DatagramTransport {
    public:
        explicit Back(SimLink& l) : link(l) {}
        bool send(const Bytes& datagram) override {
            link.to_client.push(datagram, link.inbox);
            return true;
        }
        RecvStatus recv(Bytes&, std::optional<std::chrono::milliseconds>) override {
            return RecvStatus::Error;
        }

    private:
        SimLink& link;
    };

    Back back{*this};
    std::deque<Bytes> inbox;
};

// Payload with a recognizable byte pattern.
inline Bytes make_payload(size_t n, uint8_t salt = 0) {
    Bytes b(n);
    for (size_t i = 0; i < n; ++i) b[i] = (uint8_t)((i * 31 + salt) & 0xFF);
    return b;
}

struct Tally {
    int pass = 0;
    int fail = 0;

    void check(bool ok, const std::string& what) {
        if (ok) {
            std::cout << "  [PASS] " << what << "\n";
            pass++;
        } else {
            std::cout << "  [FAIL] " << what << "\n";
            fail++;
        }
    }

    int finish(const char* name) const {
        std::cout << "\nRESULTS: " << pass << " passed, " << fail << " failed\n";
        if (fail == 0) {
            std::cout << "\n[SUCCESS] All " << name << " tests passed!\n";
            return 0;
        }
        std::cout << "\n[FAILURE] Some tests failed.\n";
        return 1;
    }
};
