#pragma once

#include "audio/audio_adapter.h"
#include <string>
#include <memory>

namespace voxlink {
namespace audio {

/**
 * @brief PortAudio implementation of the audio adapter
 *
 * Opens a mono linear16 input stream at the upstream rate and a mono output
 * stream at the agent speech rate.
 *
 * Thread Safety:
 * - Capture chunks are delivered on PortAudio's input thread
 * - The playback queue is drained on PortAudio's output thread
 * - enqueue_playback() / flush_playback() are safe from any thread
 */
class AudioIO : public IAudioAdapter {
public:
    AudioIO();
    ~AudioIO() override;

    // Non-copyable
    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    /**
     * @brief Open devices and start both streams
     * @param input_device Device name, index or "default"
     * @param output_device Device name, index or "default"
     * @param input_sample_rate Capture rate in Hz (typically 16000)
     * @param output_sample_rate Playback rate in Hz (typically 24000)
     * @param chunk_ms Capture chunk duration
     * @return True if both streams are running
     */
    bool start(const std::string& input_device,
               const std::string& output_device,
               int input_sample_rate,
               int output_sample_rate,
               int chunk_ms);

    /**
     * @brief Stop all audio I/O and close streams
     */
    void stop();

    void enqueue_playback(const Bytes& chunk) override;
    void flush_playback() override;
    VoidResult start_capture(AudioChunkCallback on_chunk) override;
    void stop_capture() override;
    bool is_capturing() const override;

    /**
     * @brief True if nothing is queued for playback
     */
    bool is_playback_complete() const;

    /**
     * @brief List all available audio devices to the log
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace audio
} // namespace voxlink
