#pragma once

/**
 * @file audio_adapter.h
 * @brief Audio I/O boundary
 *
 * Capture produces encoded PCM chunks; playback accepts agent speech in
 * arrival order. Device handling lives entirely behind this interface.
 */

#include "core/types.h"
#include "errors.h"

namespace voxlink {
namespace audio {

/**
 * @brief Abstract audio adapter
 */
class IAudioAdapter {
public:
    virtual ~IAudioAdapter() = default;

    /**
     * @brief Queue agent audio for playback (non-blocking)
     */
    virtual void enqueue_playback(const Bytes& chunk) = 0;

    /**
     * @brief Drop everything queued and silence in-flight output
     */
    virtual void flush_playback() = 0;

    /**
     * @brief Start delivering capture chunks to on_chunk (audio thread)
     */
    virtual VoidResult start_capture(AudioChunkCallback on_chunk) = 0;

    virtual void stop_capture() = 0;

    virtual bool is_capturing() const = 0;
};

} // namespace audio
} // namespace voxlink
