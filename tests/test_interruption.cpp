/**
 * Playback gate and agent speaking state.
 * Asserts:
 * - interrupt_agent() closes the gate and flushes before returning.
 * - A chunk arriving right after an interrupt enqueues zero bytes.
 * - allow_agent() reopens the gate without replaying dropped audio.
 * - Speaking/Interrupted/Idle transitions are reported once each.
 * - Chunks arriving on another thread never slip past an interrupt.
 *
 * Run from build dir: ./test_interruption
 */

#include "interruption_coordinator.h"
#include "test_fakes.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

using namespace voxlink;
using namespace voxlink::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

// Thread-safe adapter for the concurrent case
class CountingAdapter : public audio::IAudioAdapter {
public:
    void enqueue_playback(const Bytes& chunk) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_ += chunk.size();
        total_ += chunk.size();
    }
    void flush_playback() override {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_ = 0;
    }
    VoidResult start_capture(AudioChunkCallback) override { return VoidResult(); }
    void stop_capture() override {}
    bool is_capturing() const override { return false; }

    size_t queued() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queued_;
    }
    size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_;
    }

private:
    mutable std::mutex mutex_;
    size_t queued_ = 0;
    size_t total_ = 0;
};

} // anonymous namespace

int main() {
    // --- defaults ---
    {
        InterruptionCoordinator c;
        ASSERT(c.is_audio_allowed());
        ASSERT(c.speaking_state() == AgentSpeakingState::Idle);
        ASSERT(c.dropped_chunks() == 0);
        // No adapter: nothing is enqueued, nothing crashes
        ASSERT(!c.forward_chunk(Bytes{1, 2}));
        c.interrupt_agent();
        c.flush();
    }

    // --- interrupt then chunk: zero bytes reach playback ---
    {
        InterruptionCoordinator c;
        FakeAudioAdapter audio;
        c.set_audio_adapter(&audio);

        c.on_audio_start();
        ASSERT(c.forward_chunk(Bytes(320, 1)));
        ASSERT(c.forward_chunk(Bytes(320, 2)));
        ASSERT(audio.queued_bytes == 640);

        c.interrupt_agent();
        ASSERT(!c.is_audio_allowed());
        ASSERT(audio.flushes == 1);
        ASSERT(audio.queued_bytes == 0);
        ASSERT(c.speaking_state() == AgentSpeakingState::Interrupted);

        size_t enqueued_before = audio.enqueued_bytes();
        ASSERT(!c.forward_chunk(Bytes(320, 3)));
        ASSERT(audio.enqueued_bytes() == enqueued_before);
        ASSERT(audio.queued_bytes == 0);
        ASSERT(c.dropped_chunks() == 1);
    }

    // --- interrupt, allow, nothing new: Idle and silent ---
    {
        InterruptionCoordinator c;
        FakeAudioAdapter audio;
        c.set_audio_adapter(&audio);
        std::vector<std::pair<AgentSpeakingState, AgentSpeakingState>> reports;
        c.set_speaking_listener([&reports](AgentSpeakingState prev, AgentSpeakingState next) {
            reports.emplace_back(prev, next);
        });

        c.on_audio_start();
        c.forward_chunk(Bytes(100, 1));
        c.interrupt_agent();
        c.allow_agent();

        ASSERT(c.is_audio_allowed());
        ASSERT(c.speaking_state() == AgentSpeakingState::Idle);
        ASSERT(audio.queued_bytes == 0);
        ASSERT(audio.enqueued.size() == 1);
        ASSERT(reports.size() == 3);
        ASSERT(reports[0].second == AgentSpeakingState::Speaking);
        ASSERT(reports[1].first == AgentSpeakingState::Speaking);
        ASSERT(reports[1].second == AgentSpeakingState::Interrupted);
        ASSERT(reports[2].first == AgentSpeakingState::Interrupted);
        ASSERT(reports[2].second == AgentSpeakingState::Idle);

        // Audio resumes only with new chunks
        ASSERT(c.forward_chunk(Bytes(50, 7)));
        ASSERT(audio.queued_bytes == 50);
    }

    // --- interrupt while Idle: gate closes, state stays Idle, no report ---
    {
        InterruptionCoordinator c;
        FakeAudioAdapter audio;
        c.set_audio_adapter(&audio);
        int reports = 0;
        c.set_speaking_listener([&reports](AgentSpeakingState, AgentSpeakingState) { reports++; });

        c.interrupt_agent();
        ASSERT(!c.is_audio_allowed());
        ASSERT(c.speaking_state() == AgentSpeakingState::Idle);
        ASSERT(audio.flushes == 1);
        c.allow_agent();
        ASSERT(reports == 0);

        // Repeated interrupts keep flushing
        c.interrupt_agent();
        c.interrupt_agent();
        ASSERT(audio.flushes == 3);
    }

    // --- audio start while interrupted: speaking again but still gated ---
    {
        InterruptionCoordinator c;
        FakeAudioAdapter audio;
        c.set_audio_adapter(&audio);

        c.on_audio_start();
        c.interrupt_agent();
        c.on_audio_start();
        ASSERT(c.speaking_state() == AgentSpeakingState::Speaking);
        ASSERT(!c.forward_chunk(Bytes(10, 1)));
        ASSERT(audio.enqueued.empty());

        c.on_audio_stop();
        ASSERT(c.speaking_state() == AgentSpeakingState::Idle);
    }

    // --- reset for a new connection ---
    {
        InterruptionCoordinator c;
        FakeAudioAdapter audio;
        c.set_audio_adapter(&audio);
        c.on_audio_start();
        c.interrupt_agent();
        c.forward_chunk(Bytes(10, 1));
        ASSERT(c.dropped_chunks() == 1);

        c.reset();
        ASSERT(c.is_audio_allowed());
        ASSERT(c.speaking_state() == AgentSpeakingState::Idle);
        ASSERT(c.dropped_chunks() == 0);

        // flush() leaves the gate alone
        c.forward_chunk(Bytes(10, 1));
        c.flush();
        ASSERT(c.is_audio_allowed());
        ASSERT(audio.queued_bytes == 0);
    }

    // --- concurrent chunks never pass an interrupt ---
    {
        InterruptionCoordinator c;
        CountingAdapter audio;
        c.set_audio_adapter(&audio);
        c.on_audio_start();

        std::atomic<bool> running(true);
        std::atomic<int> accepted_after_interrupt(0);
        std::atomic<bool> interrupted(false);

        std::thread producer([&] {
            while (running) {
                bool gate_was_closed = interrupted.load();
                bool accepted = c.forward_chunk(Bytes(160, 5));
                if (gate_was_closed && accepted) {
                    accepted_after_interrupt++;
                }
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        c.interrupt_agent();
        interrupted = true;
        size_t total_at_interrupt = audio.total();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        running = false;
        producer.join();

        ASSERT(accepted_after_interrupt == 0);
        ASSERT(audio.queued() == 0);
        ASSERT(audio.total() == total_at_interrupt);
        ASSERT(c.dropped_chunks() > 0);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All interruption tests passed.\n";
    return 0;
}
