#pragma once

#include "drtp_protocol.h"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

// Sequential byte producer. read() returns fewer than max_len bytes only at
// end of data. False on an I/O error.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual bool read(size_t max_len, Bytes& out) = 0;
};

// Sequential byte consumer, called once per in-order delivered packet.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual bool write(const uint8_t* data, size_t len) = 0;

    bool write(const Bytes& data) { return write(data.data(), data.size()); }
};

class FileSource : public ByteSource {
public:
    bool open(const std::string& path);
    bool read(size_t max_len, Bytes& out) override;

    // Size of the opened file in bytes.
    uint64_t size() const { return file_size; }

private:
    std::ifstream ifs;
    uint64_t file_size = 0;
};

class FileSink : public ByteSink {
public:
    bool open(const std::string& path);
    bool write(const uint8_t* data, size_t len) override;
    using ByteSink::write;

    void close();
    uint64_t bytes_written() const { return total; }

private:
    std::ofstream ofs;
    uint64_t total = 0;
};
