#include "audio_io.h"
#include "logger.h"
#include <portaudio.h>
#include <atomic>
#include <cstring>
#include <deque>
#include <mutex>
#include <sstream>

namespace voxlink {
namespace audio {

class AudioIO::Impl {
public:
    Impl() : input_stream_(nullptr), output_stream_(nullptr), initialized_(false),
             capturing_(false), has_odd_byte_(false), odd_byte_(0) {}

    ~Impl() {
        stop();
    }

    bool start(const std::string& input_device, const std::string& output_device,
               int input_sample_rate, int output_sample_rate, int chunk_ms) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        initialized_ = true;

        int input_idx = find_device(input_device, true);
        if (input_idx < 0) {
            Logger::error("Input device not found: " + input_device);
            stop();
            return false;
        }
        int output_idx = find_device(output_device, false);
        if (output_idx < 0) {
            Logger::error("Output device not found: " + output_device);
            stop();
            return false;
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        Logger::info("Using input device: [" + std::to_string(input_idx) + "] " + input_info->name);
        Logger::info("Using output device: [" + std::to_string(output_idx) + "] " + output_info->name);

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        unsigned long frames_per_chunk =
            static_cast<unsigned long>(input_sample_rate) * static_cast<unsigned long>(chunk_ms) / 1000;

        err = Pa_OpenStream(&input_stream_, &input_params, nullptr, input_sample_rate,
                            frames_per_chunk, paClipOff, capture_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = output_info->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&output_stream_, nullptr, &output_params, output_sample_rate,
                            paFramesPerBufferUnspecified, paClipOff, playback_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        err = Pa_StartStream(input_stream_);
        if (err != paNoError) {
            std::ostringstream err_oss;
            err_oss << "Failed to start input stream: " << Pa_GetErrorText(err)
                    << " (Error code: " << err << ")";
            Logger::error(err_oss.str());
            if (err == paUnanticipatedHostError) {
                Logger::error("This may be a microphone permissions issue.");
            }
            stop();
            return false;
        }

        err = Pa_StartStream(output_stream_);
        if (err != paNoError) {
            Logger::error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        LOG_AUDIO("Streams running: in " + std::to_string(input_sample_rate) + " Hz, out " +
                  std::to_string(output_sample_rate) + " Hz");
        return true;
    }

    void stop() {
        capturing_ = false;
        if (input_stream_) {
            Pa_StopStream(input_stream_);
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
        }
        if (output_stream_) {
            Pa_StopStream(output_stream_);
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
        }
        flush_playback();
        if (initialized_) {
            Pa_Terminate();
            initialized_ = false;
        }
    }

    void enqueue_playback(const Bytes& chunk) {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        size_t i = 0;
        if (has_odd_byte_ && !chunk.empty()) {
            playback_queue_.push_back(to_sample(odd_byte_, chunk[0]));
            has_odd_byte_ = false;
            i = 1;
        }
        for (; i + 1 < chunk.size(); i += 2) {
            playback_queue_.push_back(to_sample(chunk[i], chunk[i + 1]));
        }
        if (i < chunk.size()) {
            odd_byte_ = chunk[i];
            has_odd_byte_ = true;
        }
    }

    void flush_playback() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_queue_.clear();
        has_odd_byte_ = false;
    }

    VoidResult start_capture(AudioChunkCallback on_chunk) {
        if (!input_stream_) {
            return make_io_error("Input stream is not open");
        }
        {
            std::lock_guard<std::mutex> lock(capture_mutex_);
            on_chunk_ = std::move(on_chunk);
        }
        capturing_ = true;
        LOG_AUDIO("Capture started");
        return VoidResult();
    }

    void stop_capture() {
        capturing_ = false;
        std::lock_guard<std::mutex> lock(capture_mutex_);
        on_chunk_ = nullptr;
        LOG_AUDIO("Capture stopped");
    }

    bool is_capturing() const {
        return capturing_.load();
    }

    bool is_playback_complete() const {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        return playback_queue_.empty();
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            Logger::info(oss.str());
        }

        Pa_Terminate();
    }

private:
    static Sample to_sample(uint8_t lo, uint8_t hi) {
        return static_cast<Sample>(static_cast<uint16_t>(lo) | (static_cast<uint16_t>(hi) << 8));
    }

    int find_device(const std::string& name, bool is_input) {
        if (name == "default" || name.empty()) {
            int default_idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            return default_idx == paNoDevice ? -1 : default_idx;
        }

        int num_devices = Pa_GetDeviceCount();

        // Numeric index
        try {
            size_t consumed = 0;
            int device_idx = std::stoi(name, &consumed);
            if (consumed == name.size() && device_idx >= 0 && device_idx < num_devices) {
                return device_idx;
            }
        } catch (const std::exception&) {
            // Not a number, fall through to name matching
        }

        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info || name != info->name) continue;
            int channels = is_input ? info->maxInputChannels : info->maxOutputChannels;
            if (channels > 0) {
                return i;
            }
        }
        return -1;
    }

    static int capture_callback(const void* input, void* output,
                                unsigned long frame_count,
                                const PaStreamCallbackTimeInfo* time_info,
                                PaStreamCallbackFlags status_flags,
                                void* user_data) {
        (void)output;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        if (!input || !self->capturing_) {
            return paContinue;
        }

        const auto* bytes = static_cast<const uint8_t*>(input);
        Bytes chunk(bytes, bytes + frame_count * sizeof(Sample));

        std::lock_guard<std::mutex> lock(self->capture_mutex_);
        if (self->on_chunk_) {
            self->on_chunk_(chunk);
        }
        return paContinue;
    }

    static int playback_callback(const void* input, void* output,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo* time_info,
                                 PaStreamCallbackFlags status_flags,
                                 void* user_data) {
        (void)input;
        (void)time_info;
        (void)status_flags;
        Impl* self = static_cast<Impl*>(user_data);
        Sample* out = static_cast<Sample*>(output);

        std::lock_guard<std::mutex> lock(self->playback_mutex_);
        unsigned long available = static_cast<unsigned long>(self->playback_queue_.size());
        unsigned long n = available < frame_count ? available : frame_count;
        for (unsigned long i = 0; i < n; ++i) {
            out[i] = self->playback_queue_.front();
            self->playback_queue_.pop_front();
        }
        if (n < frame_count) {
            std::memset(out + n, 0, (frame_count - n) * sizeof(Sample));
        }
        return paContinue;
    }

    PaStream* input_stream_;
    PaStream* output_stream_;
    bool initialized_;

    std::atomic<bool> capturing_;
    std::mutex capture_mutex_;
    AudioChunkCallback on_chunk_;

    mutable std::mutex playback_mutex_;
    std::deque<Sample> playback_queue_;
    bool has_odd_byte_;
    uint8_t odd_byte_;
};

AudioIO::AudioIO() : pimpl_(std::make_unique<Impl>()) {}

AudioIO::~AudioIO() = default;

bool AudioIO::start(const std::string& input_device, const std::string& output_device,
                    int input_sample_rate, int output_sample_rate, int chunk_ms) {
    return pimpl_->start(input_device, output_device, input_sample_rate, output_sample_rate, chunk_ms);
}

void AudioIO::stop() {
    pimpl_->stop();
}

void AudioIO::enqueue_playback(const Bytes& chunk) {
    pimpl_->enqueue_playback(chunk);
}

void AudioIO::flush_playback() {
    pimpl_->flush_playback();
}

VoidResult AudioIO::start_capture(AudioChunkCallback on_chunk) {
    return pimpl_->start_capture(std::move(on_chunk));
}

void AudioIO::stop_capture() {
    pimpl_->stop_capture();
}

bool AudioIO::is_capturing() const {
    return pimpl_->is_capturing();
}

bool AudioIO::is_playback_complete() const {
    return pimpl_->is_playback_complete();
}

void AudioIO::list_devices() {
    Impl::list_devices();
}

} // namespace audio
} // namespace voxlink
