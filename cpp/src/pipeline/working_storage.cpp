/**
 * Working storage for encoder artifacts
 */

#include "working_storage.hpp"
#include "utils/file_io.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>
#include <system_error>

namespace fs = std::filesystem;

namespace lyricvid {
namespace pipeline {

namespace {
constexpr int kCreateAttempts = 16;
} // namespace

WorkingStorage::WorkingStorage() = default;

WorkingStorage::~WorkingStorage() {
    destroy();
}

bool WorkingStorage::create(const std::string& prefix) {
    if (is_ready()) {
        return true;
    }

    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        fprintf(stderr, "[Storage] No temporary directory: %s\n", ec.message().c_str());
        return false;
    }

    std::mt19937_64 rng(static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()) ^ std::random_device{}());

    for (int attempt = 0; attempt < kCreateAttempts; attempt++) {
        char suffix[32];
        snprintf(suffix, sizeof(suffix), "%016llx", static_cast<unsigned long long>(rng()));
        fs::path candidate = base / (prefix + "-" + suffix);

        if (fs::create_directory(candidate, ec)) {
            root_ = candidate;
            return true;
        }
        if (ec) {
            fprintf(stderr, "[Storage] Failed to create %s: %s\n",
                    candidate.string().c_str(), ec.message().c_str());
            return false;
        }
    }

    fprintf(stderr, "[Storage] Could not find a free working directory name\n");
    return false;
}

void WorkingStorage::destroy() {
    if (root_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(root_, ec);
    if (ec) {
        fprintf(stderr, "[Storage] Failed to remove %s: %s\n", root_.string().c_str(), ec.message().c_str());
    }
    root_.clear();
}

std::string WorkingStorage::path_of(const std::string& name) const {
    return (root_ / name).string();
}

bool WorkingStorage::write_file(const std::string& name, const std::vector<uint8_t>& data) {
    if (!is_ready()) {
        return false;
    }
    return utils::write_file_bytes(path_of(name), data);
}

bool WorkingStorage::read_file(const std::string& name, std::vector<uint8_t>& out) const {
    if (!is_ready()) {
        return false;
    }
    return utils::read_file_bytes(path_of(name), out);
}

bool WorkingStorage::remove_file(const std::string& name) {
    if (!is_ready()) {
        return false;
    }
    std::error_code ec;
    bool removed = fs::remove(root_ / name, ec);
    return removed && !ec;
}

bool WorkingStorage::exists(const std::string& name) const {
    if (!is_ready()) {
        return false;
    }
    std::error_code ec;
    return fs::exists(root_ / name, ec);
}

std::vector<std::string> WorkingStorage::list() const {
    std::vector<std::string> names;
    if (!is_ready()) {
        return names;
    }

    std::error_code ec;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace pipeline
} // namespace lyricvid
