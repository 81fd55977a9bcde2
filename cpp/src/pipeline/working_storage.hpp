#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lyricvid {
namespace pipeline {

/**
 * Encoder working storage
 *
 * A private temporary directory holding the artifacts of the job in flight
 * (frame images, audio, encoded output). Names are flat file names.
 * The directory is removed on destroy() and in the destructor.
 */
class WorkingStorage {
public:
    WorkingStorage();
    ~WorkingStorage();

    WorkingStorage(const WorkingStorage&) = delete;
    WorkingStorage& operator=(const WorkingStorage&) = delete;

    bool create(const std::string& prefix = "lyricvid");
    void destroy();

    bool is_ready() const { return !root_.empty(); }
    const std::filesystem::path& root() const { return root_; }
    std::string path_of(const std::string& name) const;

    bool write_file(const std::string& name, const std::vector<uint8_t>& data);
    bool read_file(const std::string& name, std::vector<uint8_t>& out) const;

    // Best effort. Returns false on failure, never throws.
    bool remove_file(const std::string& name);

    bool exists(const std::string& name) const;
    std::vector<std::string> list() const;

private:
    std::filesystem::path root_;
};

} // namespace pipeline
} // namespace lyricvid
