#include "audio_io.h"
#include "core/config.h"
#include "core/scheduler.h"
#include "logger.h"
#include "transport/curl_ws_transport.h"
#include "voice_client.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace voxlink {

static std::atomic<bool> g_running(true);

void signal_handler(int signal) {
    (void)signal;
    g_running = false;
}

} // namespace voxlink

int main(int argc, char* argv[]) {
    using namespace voxlink;

    Logger::initialize(LogLevel::INFO);

    // List devices if requested (check before loading config)
    if (argc > 1 && std::string(argv[1]) == "--list-devices") {
        audio::AudioIO::list_devices();
        Logger::shutdown();
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : "config/config.json";
    auto loaded = ClientConfig::load(config_path);
    if (!loaded) {
        Logger::error("Failed to load " + config_path + ": " + loaded.error().message);
        Logger::shutdown();
        return 1;
    }
    const ClientConfig& config = loaded.value();

    Logger::shutdown();
    LogLevel level = config.connection.debug ? LogLevel::DEBUG : Logger::parse_level(config.log.level);
    Logger::initialize(level, config.log.file);

    audio::AudioIO audio_io;
    if (!audio_io.start(config.devices.input_device, config.devices.output_device,
                        config.connection.audio_format.input_sample_rate,
                        config.connection.audio_format.output_sample_rate,
                        constants::audio::CHUNK_MS)) {
        Logger::error("Audio initialization failed");
        Logger::shutdown();
        return 1;
    }

    int exit_code = 0;
    {
        VoiceClient client(
            std::make_unique<transport::CurlWebSocketTransport>(config.connection.protocol.connect_timeout_ms),
            std::make_unique<ThreadScheduler>(),
            &audio_io);
        client.set_auto_start_capture(config.auto_start_capture);

        ClientCallbacks callbacks;
        callbacks.on_state_changed = [](ConnectionState prev, ConnectionState next) {
            Logger::info(std::string("Connection: ") + to_string(prev) + " -> " + to_string(next));
            if (next == ConnectionState::Errored) {
                g_running = false;
            }
        };
        callbacks.on_mode_resolved = [](Mode mode) {
            Logger::info(std::string("Mode: ") + to_string(mode));
        };
        callbacks.on_transcript = [](const TranscriptResult& result) {
            if (result.is_final && !result.text.empty()) {
                std::cout << "[transcript] " << result.text << std::endl;
            }
        };
        callbacks.on_agent_text = [](const AgentText& text) {
            std::cout << "[" << text.role << "] " << text.content << std::endl;
        };
        callbacks.on_agent_speaking_changed = [](AgentSpeakingState prev, AgentSpeakingState next) {
            Logger::debug(std::string("Agent speaking: ") + to_string(prev) + " -> " + to_string(next));
        };
        callbacks.on_vad = [&client](const VadEvent& event) {
            // Barge-in: the user talking over the agent cuts its playback
            if (event.kind == VadEventKind::SpeechStarted &&
                client.agent_speaking_state() == AgentSpeakingState::Speaking) {
                client.interrupt_agent();
            } else if (event.kind != VadEventKind::SpeechStarted && !client.is_audio_allowed()) {
                client.allow_agent();
            }
        };
        callbacks.on_error = [](const Error& error) {
            std::string text = std::string(error_type_to_string(error.type)) + ": " + error.message;
            if (!error.code.empty()) {
                text += " (" + error.code + ")";
            }
            if (error.fatal) {
                Logger::error(text);
            } else {
                Logger::warn(text);
            }
        };
        callbacks.on_function_call_request = [&client](const FunctionCallRequest& request) {
            for (const auto& call : request.functions) {
                if (!call.client_side) {
                    continue;
                }
                Logger::warn("No local handler for function " + call.name);
                VoidResult sent = client.send_function_call_response(
                    call.id, call.name, "{\"error\":\"function not available\"}");
                if (!sent) {
                    Logger::warn("FunctionCallResponse not sent: " + sent.error().message);
                }
            }
        };
        client.subscribe(std::move(callbacks));

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        VoidResult started = client.start(config.connection);
        if (!started) {
            Logger::error("Failed to start: " + started.error().message);
            exit_code = 1;
        } else {
            Logger::info("Streaming. Press Ctrl-C to stop.");
            while (g_running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            Logger::info("Shutting down...");
            if (client.state() == ConnectionState::Errored) {
                exit_code = 1;
            }
        }
        client.stop();
    }

    audio_io.stop();
    Logger::shutdown();
    return exit_code;
}
