#pragma once

#include "engine/Core.hpp"

#include <cstdint>

namespace kc::engine
{

// The renderer the presentation layer embeds. It reports back through the
// Core::on_player_* callbacks.
class MediaPlayer
{
  public:
    virtual ~MediaPlayer() = default;

    virtual void open(PlaybackSource const &source, std::int64_t start_ms) = 0;
    // Swaps the byte source under a running session, keeping the position.
    virtual void switch_source(PlaybackSource const &source,
                               std::int64_t position_ms) = 0;
    virtual void seek(std::int64_t position_ms) = 0;
    virtual void play() = 0;
    virtual void pause() = 0;
    virtual void stop() = 0;
};

} // namespace kc::engine
