#include "interruption_coordinator.h"
#include "audio/audio_adapter.h"
#include "logger.h"
#include <atomic>
#include <mutex>

namespace voxlink {

class InterruptionCoordinator::Impl {
public:
    Impl() : adapter_(nullptr), audio_allowed_(true),
             speaking_(AgentSpeakingState::Idle), dropped_chunks_(0) {}

    void set_audio_adapter(audio::IAudioAdapter* adapter) {
        std::lock_guard<std::mutex> lock(mutex_);
        adapter_ = adapter;
    }

    void set_speaking_listener(SpeakingListener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = std::move(listener);
    }

    void interrupt_agent() {
        AgentSpeakingState prev;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            audio_allowed_ = false;
            if (adapter_) {
                adapter_->flush_playback();
            }
            prev = speaking_;
            if (speaking_ == AgentSpeakingState::Speaking) {
                speaking_ = AgentSpeakingState::Interrupted;
            }
        }
        LOG_AUDIO("Agent interrupted; playback flushed");
        notify(prev, AgentSpeakingState::Interrupted);
    }

    void allow_agent() {
        AgentSpeakingState prev;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            audio_allowed_ = true;
            prev = speaking_;
            if (speaking_ == AgentSpeakingState::Interrupted) {
                speaking_ = AgentSpeakingState::Idle;
            }
        }
        LOG_AUDIO("Agent audio allowed");
        notify(prev, AgentSpeakingState::Idle);
    }

    bool forward_chunk(const Bytes& chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!audio_allowed_) {
            ++dropped_chunks_;
            return false;
        }
        if (!adapter_) {
            return false;
        }
        adapter_->enqueue_playback(chunk);
        return true;
    }

    void on_audio_start() {
        AgentSpeakingState prev;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prev = speaking_;
            speaking_ = AgentSpeakingState::Speaking;
        }
        notify(prev, AgentSpeakingState::Speaking);
    }

    void on_audio_stop() {
        AgentSpeakingState prev;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prev = speaking_;
            if (speaking_ != AgentSpeakingState::Speaking) {
                return;
            }
            speaking_ = AgentSpeakingState::Idle;
        }
        notify(prev, AgentSpeakingState::Idle);
    }

    void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (adapter_) {
            adapter_->flush_playback();
        }
    }

    void reset() {
        AgentSpeakingState prev;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            audio_allowed_ = true;
            dropped_chunks_ = 0;
            prev = speaking_;
            speaking_ = AgentSpeakingState::Idle;
        }
        notify(prev, AgentSpeakingState::Idle);
    }

    bool is_audio_allowed() const {
        return audio_allowed_.load();
    }

    AgentSpeakingState speaking_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return speaking_;
    }

    uint64_t dropped_chunks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_chunks_;
    }

private:
    // Reports a change only when the state actually moved to target
    void notify(AgentSpeakingState prev, AgentSpeakingState target) {
        SpeakingListener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (prev == target || speaking_ != target) {
                return;
            }
            listener = listener_;
        }
        if (listener) {
            listener(prev, target);
        }
    }

    mutable std::mutex mutex_;
    audio::IAudioAdapter* adapter_;
    std::atomic<bool> audio_allowed_;
    AgentSpeakingState speaking_;
    uint64_t dropped_chunks_;
    SpeakingListener listener_;
};

InterruptionCoordinator::InterruptionCoordinator() : pimpl_(std::make_unique<Impl>()) {}
InterruptionCoordinator::~InterruptionCoordinator() = default;

void InterruptionCoordinator::set_audio_adapter(audio::IAudioAdapter* adapter) {
    pimpl_->set_audio_adapter(adapter);
}

void InterruptionCoordinator::set_speaking_listener(SpeakingListener listener) {
    pimpl_->set_speaking_listener(std::move(listener));
}

void InterruptionCoordinator::interrupt_agent() {
    pimpl_->interrupt_agent();
}

void InterruptionCoordinator::allow_agent() {
    pimpl_->allow_agent();
}

bool InterruptionCoordinator::forward_chunk(const Bytes& chunk) {
    return pimpl_->forward_chunk(chunk);
}

void InterruptionCoordinator::on_audio_start() {
    pimpl_->on_audio_start();
}

void InterruptionCoordinator::on_audio_stop() {
    pimpl_->on_audio_stop();
}

void InterruptionCoordinator::flush() {
    pimpl_->flush();
}

void InterruptionCoordinator::reset() {
    pimpl_->reset();
}

bool InterruptionCoordinator::is_audio_allowed() const {
    return pimpl_->is_audio_allowed();
}

AgentSpeakingState InterruptionCoordinator::speaking_state() const {
    return pimpl_->speaking_state();
}

uint64_t InterruptionCoordinator::dropped_chunks() const {
    return pimpl_->dropped_chunks();
}

} // namespace voxlink
