#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace lyricvid {
namespace pipeline {

// Produces the encoded frame for a caption
using RenderFunction = std::function<bool(const std::string& caption, std::vector<uint8_t>& out)>;

/**
 * Single-entry frame cache keyed by caption text.
 *
 * Consecutive frames with the same caption reuse the last encoded frame
 * instead of compositing again.
 */
class FrameCache {
public:
    explicit FrameCache(RenderFunction render);

    // Encoded frame for caption, or nullptr if rendering failed
    const std::vector<uint8_t>* get(const std::string& caption);

    void clear();

    bool has_entry() const { return valid_; }
    const std::string& caption() const { return caption_; }
    int64_t render_count() const { return render_count_; }

private:
    RenderFunction render_;
    bool valid_;
    std::string caption_;
    std::vector<uint8_t> frame_;
    int64_t render_count_;
};

} // namespace pipeline
} // namespace lyricvid
