// test_stream.cpp - file-backed source and sink
//
// Tests:
// 1. FileSource chunking at the 1460-byte boundary
// 2. File to file transfer through client and server sessions
// 3. Empty file
// 4. Open failures

#include "DrtpClient.h"
#include "DrtpServer.h"
#include "sim_link.h"

#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

static std::string temp_path(const std::string& tag) {
    return "/tmp/drtp_test_" + std::to_string(getpid()) + "_" + tag;
}

static bool write_file(const std::string& path, const Bytes& data) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(data.data()), (std::streamsize)data.size());
    return (bool)f;
}

static Bytes read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Sends in_path to out_path over SimLink. Returns the data packets sent.
static size_t send_file(Reliability r, const std::string& in_path, const std::string& out_path, bool& ok) {
    DrtpConfig client_cfg;
    client_cfg.role = Role::Client;
    client_cfg.reliability = r;
    client_cfg.data_timeout_ms = 20;
    client_cfg.fin_timeout_ms = 20;
    DrtpConfig server_cfg = client_cfg;
    server_cfg.role = Role::Server;

    FileSource src;
    FileSink out;
    ok = src.open(in_path) && out.open(out_path);
    if (!ok) return 0;

    ServerSession server(server_cfg, out);
    ClientSession client(client_cfg);
    SimLink link;
    link.peer = [&](const Bytes& d, DatagramTransport& reply) { return server.on_datagram(d, reply); };

    ok = client.open(link) && client.transfer(link, src) && client.close(link) && server.finished();
    out.close();
    return link.data_seqs().size();
}

int main() {
    std::cout << "=== File Stream Test ===\n\n";
    Tally t;

    const std::string in_path = temp_path("in.bin");
    const std::string out_path = temp_path("out.bin");

    std::cout << "TEST 1: FileSource chunking\n";
    {
        Bytes data = make_payload(3 * kDrtpMaxPayload, 7);
        t.check(write_file(in_path, data), "wrote 4380-byte input file");

        FileSource src;
        t.check(src.open(in_path) && src.size() == data.size(), "size() reports 4380");

        Bytes chunk;
        int full = 0;
        for (int i = 0; i < 3; ++i) {
            if (src.read(kDrtpMaxPayload, chunk) && chunk.size() == kDrtpMaxPayload) ++full;
        }
        t.check(full == 3, "three full 1460-byte chunks");
        t.check(src.read(kDrtpMaxPayload, chunk) && chunk.empty(), "fourth read is empty at end of file");
        t.check(src.read(kDrtpMaxPayload, chunk) && chunk.empty(), "reads past the end stay empty");
    }

    std::cout << "\nTEST 2: File to file\n";
    for (auto r : {Reliability::StopAndWait, Reliability::GoBackN, Reliability::SelectiveRepeat}) {
        const std::string name = to_string(r);
        Bytes data = make_payload(3 * kDrtpMaxPayload, 7);
        write_file(in_path, data);

        bool ok = false;
        size_t packets = send_file(r, in_path, out_path, ok);
        t.check(ok, name + ": transfer completes");
        t.check(packets == 3, name + ": 3*1460-byte file is exactly 3 data packets");
        t.check(read_file(out_path) == data, name + ": output file is identical");
    }
    {
        Bytes data = make_payload(2 * kDrtpMaxPayload + 1, 3);
        write_file(in_path, data);
        bool ok = false;
        size_t packets = send_file(Reliability::GoBackN, in_path, out_path, ok);
        t.check(ok && packets == 3 && read_file(out_path) == data, "2921-byte file is 3 packets, last with 1 byte");
    }

    std::cout << "\nTEST 3: Empty file\n";
    {
        write_file(out_path, make_payload(50));
        t.check(write_file(in_path, Bytes{}), "wrote empty input file");

        bool ok = false;
        size_t packets = send_file(Reliability::SelectiveRepeat, in_path, out_path, ok);
        t.check(ok, "empty file transfer completes");
        t.check(packets == 0, "no data packets");
        t.check(read_file(out_path).empty(), "output file truncated to 0 bytes");
    }

    std::cout << "\nTEST 4: Open failures\n";
    {
        FileSource src;
        t.check(!src.open(temp_path("missing")), "missing input file is reported");
        FileSink sink;
        t.check(!sink.open("/nonexistent-dir/out.bin"), "unwritable output path is reported");
    }

    std::remove(in_path.c_str());
    std::remove(out_path.c_str());
    return t.finish("stream");
}
