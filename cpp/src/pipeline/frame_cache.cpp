/**
 * Caption-keyed frame cache
 */

#include "frame_cache.hpp"

#include <utility>

namespace lyricvid {
namespace pipeline {

FrameCache::FrameCache(RenderFunction render)
    : render_(std::move(render))
    , valid_(false)
    , render_count_(0)
{
}

const std::vector<uint8_t>* FrameCache::get(const std::string& caption) {
    if (valid_ && caption == caption_) {
        return &frame_;
    }

    std::vector<uint8_t> rendered;
    render_count_++;
    if (!render_ || !render_(caption, rendered)) {
        valid_ = false;
        return nullptr;
    }

    frame_ = std::move(rendered);
    caption_ = caption;
    valid_ = true;
    return &frame_;
}

void FrameCache::clear() {
    valid_ = false;
    caption_.clear();
    frame_.clear();
}

} // namespace pipeline
} // namespace lyricvid
