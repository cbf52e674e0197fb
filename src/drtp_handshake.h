#pragma once

#include "DrtpTransport.h"
#include "drtp_connection.h"
#include "drtp_protocol.h"

#include <chrono>

// --- Client side ---

// Sends SYN(seq=0, ack=0) and blocks until a SYN-ACK arrives, then answers
// with ACK(seq=1, ack=1). The SYN is sent once: a lost SYN or SYN-ACK leaves
// the client waiting. False on a transport error.
bool client_open(DrtpConnection& conn, DatagramTransport& link);

// Sends FIN and re-sends it every fin_timeout until the server's final ACK
// (ack == conn.seq + 1) is seen. After max_retries re-sends the connection is
// closed anyway with a warning. False only on a transport error.
bool client_close(DrtpConnection& conn, DatagramTransport& link,
                  std::chrono::milliseconds fin_timeout, int max_retries);

// --- Server side ---

// Replies SYN-ACK(seq=0, ack=1, window=kDrtpAdvertisedWindow). A repeated SYN
// gets the same SYN-ACK without moving the expected sequence number.
bool server_on_syn(DrtpConnection& conn, DatagramTransport& link);

// Client's handshake ACK: adopt its ack number as our sequence counter and
// enter ESTABLISHED.
void server_on_ack(DrtpConnection& conn, const DrtpPacket& pkt);

// Answers a FIN with exactly one final ACK and closes the connection.
bool server_on_fin(DrtpConnection& conn, DatagramTransport& link);

// ACK stamped with the server's sequence counter and advertised window.
Bytes server_make_ack(const DrtpConnection& conn, uint32_t ack_no);
