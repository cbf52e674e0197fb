#include "drtp_connection.h"

const char* to_string(ConnState s) {
    switch (s) {
        case ConnState::CLOSED: return "CLOSED";
        case ConnState::SYN_SENT: return "SYN_SENT";
        case ConnState::SYN_RECEIVED: return "SYN_RECEIVED";
        case ConnState::ESTABLISHED: return "ESTABLISHED";
        case ConnState::FIN_WAIT: return "FIN_WAIT";
        case ConnState::CLOSING: return "CLOSING";
    }
    return "UNKNOWN";
}
