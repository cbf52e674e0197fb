#include "DrtpTransport.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>
#include <iostream>

UdpTransport::~UdpTransport() {
    close();
}

void UdpTransport::close() {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

bool UdpTransport::resolve(const std::string& ip, uint16_t port, sockaddr_in& out) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &out.sin_addr) != 1) {
        std::cerr << "Invalid IPv4 address: " << ip << "\n";
        return false;
    }
    return true;
}

bool UdpTransport::init_server(const std::string& ip, uint16_t port) {
    sockaddr_in local{};
    if (!resolve(ip, port, local)) return false;

    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) { perror("socket"); return false; }

    int yes = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
        perror("setsockopt SO_REUSEADDR");
        return false;
    }

    if (bind(fd, (sockaddr*)&local, sizeof(local)) < 0) {
        perror("bind");
        return false;
    }

    std::cerr << "Listening on " << ip << ":" << local_port() << "\n";
    return true;
}

bool UdpTransport::init_client(const std::string& ip, uint16_t port) {
    if (!resolve(ip, port, peer)) return false;

    fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) { perror("socket"); return false; }

    if (connect(fd, (sockaddr*)&peer, sizeof(peer)) < 0) {
        perror("connect");
        return false;
    }
    connected = true;
    have_peer = true;

    std::cerr << "Sending to " << ip << ":" << port << "\n";
    return true;
}

bool UdpTransport::send(const Bytes& datagram) {
    if (!have_peer) {
        std::cerr << "send: no peer address yet\n";
        return false;
    }

    ssize_t n;
    if (connected) {
        n = ::send(fd, datagram.data(), datagram.size(), 0);
    } else {
        n = sendto(fd, datagram.data(), datagram.size(), 0, (const sockaddr*)&peer, sizeof(peer));
    }
    if (n < 0) { perror("sendto"); return false; }
    if ((size_t)n != datagram.size()) {
        std::cerr << "Partial send!? sent=" << n << " expected=" << datagram.size() << "\n";
        return false;
    }
    return true;
}

RecvStatus UdpTransport::recv(Bytes& out, std::optional<std::chrono::milliseconds> timeout) {
    while (true) {
        if (timeout) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;
            int pr = ::poll(&pfd, 1, (int)timeout->count());
            if (pr == 0) return RecvStatus::Timeout;
            if (pr < 0) {
                if (errno == EINTR) continue;
                perror("poll");
                return RecvStatus::Error;
            }
        }

        // One byte of slack so an oversized datagram is seen as malformed
        // instead of being silently truncated to a valid length.
        out.resize(kDrtpMaxDatagram + 1);
        sockaddr_in from{};
        socklen_t alen = sizeof(from);
        ssize_t n = recvfrom(fd, out.data(), out.size(), 0, (sockaddr*)&from, &alen);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EWOULDBLOCK || errno == EAGAIN) return RecvStatus::Timeout;
            perror("recvfrom");
            return RecvStatus::Error;
        }
        out.resize((size_t)n);

        if (!connected) {
            // First datagram fixes the peer; strangers are ignored afterwards.
            if (!have_peer) {
                peer = from;
                have_peer = true;
            } else if (from.sin_addr.s_addr != peer.sin_addr.s_addr || from.sin_port != peer.sin_port) {
                continue;
            }
        }
        return RecvStatus::Ok;
    }
}

std::string UdpTransport::peer_string() const {
    if (!have_peer) return "-";
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf));
    return std::string(buf) + ":" + std::to_string(ntohs(peer.sin_port));
}

uint16_t UdpTransport::local_port() const {
    sockaddr_in local{};
    socklen_t alen = sizeof(local);
    if (fd < 0 || getsockname(fd, (sockaddr*)&local, &alen) < 0) {
        perror("getsockname");
        return 0;
    }
    return ntohs(local.sin_port);
}
