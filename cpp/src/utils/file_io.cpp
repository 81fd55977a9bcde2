#include "file_io.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>

namespace lyricvid {
namespace utils {

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        fprintf(stderr, "[IO] Failed to open: %s\n", path.c_str());
        return false;
    }

    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        fprintf(stderr, "[IO] Failed to read: %s\n", path.c_str());
        return false;
    }
    return true;
}

bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        fprintf(stderr, "[IO] Failed to create: %s\n", path.c_str());
        return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file.good()) {
        fprintf(stderr, "[IO] Failed to write: %s\n", path.c_str());
        return false;
    }
    return true;
}

bool read_text_file(const std::string& path, std::string& out) {
    std::vector<uint8_t> bytes;
    if (!read_file_bytes(path, bytes)) {
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

bool write_text_file(const std::string& path, const std::string& text) {
    return write_file_bytes(path, std::vector<uint8_t>(text.begin(), text.end()));
}

} // namespace utils
} // namespace lyricvid
