#include "DrtpConfig.h"

#include <arpa/inet.h>

#include <iostream>
#include <stdexcept>

const char* to_string(Role r) {
    switch (r) {
        case Role::Server: return "server";
        case Role::Client: return "client";
        default: return "none";
    }
}

const char* to_string(Reliability r) {
    switch (r) {
        case Reliability::StopAndWait: return "StopAndWait";
        case Reliability::GoBackN: return "GoBackN";
        case Reliability::SelectiveRepeat: return "SelectiveRepeat";
    }
    return "unknown";
}

const char* to_string(FaultMode f) {
    switch (f) {
        case FaultMode::SkipAck: return "skip_ack";
        case FaultMode::SkipSeq: return "skip_seq";
        default: return "none";
    }
}

std::optional<Reliability> parse_reliability(const std::string& s) {
    if (s == "StopAndWait") return Reliability::StopAndWait;
    if (s == "GoBackN") return Reliability::GoBackN;
    if (s == "SelectiveRepeat") return Reliability::SelectiveRepeat;
    return std::nullopt;
}

std::optional<FaultMode> parse_fault_mode(const std::string& s) {
    if (s == "skip_ack") return FaultMode::SkipAck;
    if (s == "skip_seq") return FaultMode::SkipSeq;
    return std::nullopt;
}

void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " (-s | -c) -r {StopAndWait,GoBackN,SelectiveRepeat} -f FILE"
              << " [-i A.B.C.D] [-p PORT] [-t {skip_ack,skip_seq}]\n"
              << "  -s, --server       receive FILE\n"
              << "  -c, --client       send FILE\n"
              << "  -i, --serverip     server address (default 127.0.0.1)\n"
              << "  -p, --port         UDP port (default 8088)\n"
              << "  -r, --reliability  ARQ strategy\n"
              << "  -f, --filename     file to send / write\n"
              << "  -t, --test         skip_ack (server) or skip_seq (client)\n";
}

bool parse_args(int argc, char** argv, DrtpConfig& a) {
    bool server = false;
    bool client = false;
    std::optional<FaultMode> fault;

    auto takes_value = [](const std::string& o) {
        return o == "-i" || o == "--serverip" || o == "-p" || o == "--port" ||
               o == "-r" || o == "--reliability" || o == "-f" || o == "--filename" ||
               o == "-t" || o == "--test";
    };

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) {
                std::cerr << "Missing value for " << s << "\n";
                usage(argv[0]);
                return false;
            }
            return true;
        };

        if (s == "-s" || s == "--server") server = true;
        else if (s == "-c" || s == "--client") client = true;
        else if ((s == "-i" || s == "--serverip") && need(1)) a.ip = argv[++i];
        else if ((s == "-p" || s == "--port") && need(1)) {
            int port = 0;
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                return false;
            }
            if (port < 1 || port > 65535) {
                std::cerr << "Port must be 1..65535\n";
                return false;
            }
            a.port = (uint16_t)port;
        }
        else if ((s == "-r" || s == "--reliability") && need(1)) {
            a.reliability = parse_reliability(argv[++i]);
            if (!a.reliability) {
                std::cerr << "Unknown reliability: " << argv[i]
                          << " (choose StopAndWait, GoBackN or SelectiveRepeat)\n";
                return false;
            }
        }
        else if ((s == "-f" || s == "--filename") && need(1)) a.filename = argv[++i];
        else if ((s == "-t" || s == "--test") && need(1)) {
            auto f = parse_fault_mode(argv[++i]);
            if (!f) {
                std::cerr << "Unknown test: " << argv[i] << " (choose skip_ack or skip_seq)\n";
                return false;
            }
            if (fault && *fault != *f) {
                std::cerr << "Use only 1 test at a time!\n";
                return false;
            }
            fault = f;
        }
        else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
        else {
            // need() has already reported a missing value
            if (!takes_value(s)) { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); }
            return false;
        }
    }

    if (server && client) {
        std::cerr << "You can only choose one mode at a time\n"
                  << "Run as EITHER a server or a client\n";
        return false;
    }
    if (server) a.role = Role::Server;
    else if (client) a.role = Role::Client;
    if (fault) a.fault = *fault;

    std::string err;
    if (!validate_config(a, err)) {
        std::cerr << err << "\n";
        return false;
    }
    return true;
}

bool validate_config(const DrtpConfig& cfg, std::string& err) {
    if (cfg.role == Role::None) {
        err = "You need to run the program as either a server or a client";
        return false;
    }
    if (!cfg.reliability) {
        err = "Missing --reliability (StopAndWait, GoBackN or SelectiveRepeat)";
        return false;
    }
    if (cfg.filename.empty()) {
        err = "Missing --filename";
        return false;
    }
    in_addr tmp{};
    if (inet_pton(AF_INET, cfg.ip.c_str(), &tmp) != 1) {
        err = "Invalid --serverip: " + cfg.ip;
        return false;
    }
    if (cfg.fault == FaultMode::SkipAck && cfg.role != Role::Server) {
        err = "skip_ack is a server-side test";
        return false;
    }
    if (cfg.fault == FaultMode::SkipSeq && cfg.role != Role::Client) {
        err = "skip_seq is a client-side test";
        return false;
    }
    if (cfg.window_size < 1) {
        err = "window size must be >= 1";
        return false;
    }
    if (cfg.data_timeout_ms <= 0 || cfg.fin_timeout_ms <= 0) {
        err = "timeouts must be positive";
        return false;
    }
    return true;
}
