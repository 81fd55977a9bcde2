#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lyricvid {
namespace utils {

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out);
bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& data);

bool read_text_file(const std::string& path, std::string& out);
bool write_text_file(const std::string& path, const std::string& text);

} // namespace utils
} // namespace lyricvid
