#include "drtp_stream.h"

#include <iostream>

bool FileSource::open(const std::string& path) {
    ifs.open(path, std::ios::binary | std::ios::ate);
    if (!ifs) {
        std::cerr << "Failed to open file: " << path << "\n";
        return false;
    }
    file_size = (uint64_t)ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    return true;
}

bool FileSource::read(size_t max_len, Bytes& out) {
    out.resize(max_len);
    if (max_len == 0 || ifs.eof()) {
        out.clear();
        return true;
    }

    ifs.read(reinterpret_cast<char*>(out.data()), (std::streamsize)max_len);
    std::streamsize got = ifs.gcount();
    if (ifs.bad()) {
        std::cerr << "Read error on input file\n";
        return false;
    }
    out.resize((size_t)got);
    return true;
}

bool FileSink::open(const std::string& path) {
    ofs.open(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        std::cerr << "Failed to open output file: " << path << "\n";
        return false;
    }
    return true;
}

bool FileSink::write(const uint8_t* data, size_t len) {
    if (len > 0) {
        ofs.write(reinterpret_cast<const char*>(data), (std::streamsize)len);
        if (!ofs) {
            std::cerr << "Write error on output file\n";
            return false;
        }
    }
    total += len;
    return true;
}

void FileSink::close() {
    if (ofs.is_open()) ofs.close();
}
