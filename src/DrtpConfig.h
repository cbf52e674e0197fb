#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

enum class Role { None, Server, Client };

enum class Reliability { StopAndWait, GoBackN, SelectiveRepeat };

// Recovery test hooks. SkipAck belongs to the receiving role, SkipSeq to the
// sending role.
enum class FaultMode { None, SkipAck, SkipSeq };

const char* to_string(Role r);
const char* to_string(Reliability r);
const char* to_string(FaultMode f);

std::optional<Reliability> parse_reliability(const std::string& s);
std::optional<FaultMode> parse_fault_mode(const std::string& s);

struct DrtpConfig {
    Role role = Role::None;
    std::string ip = "127.0.0.1";                // server address (bind address on the server)
    uint16_t port = 8088;                        // UDP port
    std::optional<Reliability> reliability;      // required
    std::string filename;                        // file to send / file to write
    FaultMode fault = FaultMode::None;           // -t selector
    size_t window_size = 5;                      // GBN / SR window
    int data_timeout_ms = 500;                   // wait-for-ACK cycle
    int fin_timeout_ms = 1000;                   // teardown poll
    uint32_t skip_seq = 3;                       // packet the sender omits once under SkipSeq
    uint32_t skip_ack_at = 5;                    // expected seq at which the receiver withholds one ACK

    Reliability strategy() const { return reliability.value_or(Reliability::StopAndWait); }
};

void usage(const char* prog);

// Fills cfg from the command line. False (after printing a diagnostic) on
// unknown options, bad values or --help.
bool parse_args(int argc, char** argv, DrtpConfig& cfg);

// Rejects inconsistent configurations before any socket is opened.
bool validate_config(const DrtpConfig& cfg, std::string& err);
