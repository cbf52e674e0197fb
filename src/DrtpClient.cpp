#include "DrtpClient.h"

#include "drtp_handshake.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

using Clock = std::chrono::steady_clock;

ClientSession::ClientSession(const DrtpConfig& cfg) : A(cfg), tx(make_sender(cfg)) {}

bool ClientSession::open(DatagramTransport& link) {
    return client_open(conn, link);
}

bool ClientSession::transfer(DatagramTransport& link, ByteSource& src) {
    if (!conn.established()) {
        std::cerr << "transfer: connection is " << to_string(conn.state) << "\n";
        return false;
    }

    if (!tx->run(conn, link, src)) {
        std::cerr << "Transfer failed at seq=" << conn.seq << "\n";
        return false;
    }

    const auto& s = tx->stats();
    std::cerr << to_string(tx->kind()) << ": " << s.data_packets << " packets, "
              << s.transmissions << " transmissions (" << s.retransmissions
              << " retransmissions, " << s.timeouts << " timeouts)\n";
    return true;
}

bool ClientSession::close(DatagramTransport& link) {
    return client_close(conn, link, std::chrono::milliseconds(A.fin_timeout_ms), kFinRetries);
}

DrtpClient::DrtpClient(const DrtpConfig& cfg) : A(cfg) {}

bool DrtpClient::init() {
    if (!src.open(A.filename)) return false;
    if (!link.init_client(A.ip, A.port)) return false;

    std::cerr << "Client ready: reliability=" << to_string(A.strategy())
              << (A.fault != FaultMode::None ? std::string(" test=") + to_string(A.fault) : std::string())
              << ", " << A.filename << " (" << src.size() << " bytes)\n";
    return true;
}

bool DrtpClient::run() {
    ClientSession session(A);

    if (!session.open(link)) {
        std::cerr << "ConnectionError\n";
        return false;
    }

    auto start = Clock::now();
    if (!session.transfer(link, src)) {
        std::cerr << "ConnectionError\n";
        return false;
    }
    double elapsed_s = std::chrono::duration<double>(Clock::now() - start).count();
    report(elapsed_s);

    if (!session.close(link)) {
        std::cerr << "ConnectionError\n";
        return false;
    }
    link.close();
    return true;
}

void DrtpClient::report(double elapsed_s) const {
    double kb = src.size() / 1000.0;
    double throughput = elapsed_s > 0 ? kb / elapsed_s : 0.0;

    std::cout << std::string(50, '-') << "\n"
              << std::fixed << std::setprecision(2)
              << "TIME: " << elapsed_s << " second(s)\n"
              << "FILE SIZE: " << kb << " kB\n"
              << "THROUGHPUT: " << throughput << " kB per second\n";
}
