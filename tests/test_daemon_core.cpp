#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "daemon_core.hpp"
#include "fake_engine.hpp"

#include <chrono>
#include <limits>
#include <optional>
#include <thread>
#include <vector>

using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

namespace {

struct CoreFixture {
    std::shared_ptr<FakeEngineState> engine = std::make_shared<FakeEngineState>();
    TmpModelFile model_file;
    Config config;
    SessionRegistry registry;
    ModelManager model{std::make_unique<FakeEngine>(engine), model_file.path, "en"};
    int shutdowns = 0;
    DaemonCore core{config, false, registry, model, [this] { shutdowns++; }};

    DaemonMessage send(const ClientMessage& message) {
        auto reply = core.handle_message(message);
        REQUIRE(reply.has_value());
        return *reply;
    }

    SessionId start() {
        auto reply = send(msg::StartRecording{});
        REQUIRE(std::holds_alternative<msg::RecordingStarted>(reply));
        return std::get<msg::RecordingStarted>(reply).session_id;
    }

    DaemonMessage stream(const SessionId& id, size_t samples, uint32_t rate = 16000,
                         uint16_t channels = 1) {
        return send(msg::StreamAudio{AudioChunk{
            .session_id = id,
            .data = std::vector<float>(samples, 0.2f),
            .sample_rate = rate,
            .channels = channels,
            .timestamp = std::chrono::system_clock::now(),
        }});
    }
};

std::string error_of(const DaemonMessage& reply) {
    REQUIRE(std::holds_alternative<msg::Error>(reply));
    return std::get<msg::Error>(reply).message;
}

} // namespace

TEST_CASE("DaemonCore", "[core]") {
    CoreFixture f;

    SECTION("StatusBeforeStart") {
        auto reply = f.send(msg::GetStatus{});
        REQUIRE(std::holds_alternative<msg::Status>(reply));
        const auto& status = std::get<msg::Status>(reply).status;
        REQUIRE_FALSE(status.model_loaded);
        REQUIRE(status.active_sessions.empty());
        REQUIRE(status.uptime >= 0ns);
        REQUIRE(status.audio_device == "default");
        REQUIRE(status.buffer_size == 1024);
        REQUIRE(status.vad_sensitivity == 0.5f);
        REQUIRE(f.engine->loads == 0);
    }

    SECTION("StartLoadsModelAndCreatesSession") {
        auto id = f.start();
        REQUIRE(f.registry.exists(id));
        REQUIRE(f.model.is_loaded());

        auto status = f.core.status();
        REQUIRE(status.model_loaded);
        REQUIRE(status.active_sessions == std::vector<SessionId>{id});
    }

    SECTION("StartReusesLoadedModel") {
        f.start();
        f.start();
        REQUIRE(f.engine->loads == 1);
        REQUIRE(f.registry.size() == 2);
    }

    SECTION("OneSecondRecordingCompletes") {
        auto id = f.start();

        auto ack = f.stream(id, 16000);
        REQUIRE(std::holds_alternative<msg::TranscriptionUpdate>(ack));
        const auto& update = std::get<msg::TranscriptionUpdate>(ack);
        REQUIRE(update.session_id == id);
        REQUIRE(update.partial_text.empty());
        REQUIRE_FALSE(update.is_final);

        REQUIRE(f.registry.with_buffer(id, [](const TranscriptionSession&, AudioBuffer& b) {
            REQUIRE_THAT(b.duration_seconds(), WithinAbs(1.0, 1e-6));
        }));

        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::holds_alternative<msg::TranscriptionComplete>(reply));
        const auto& session = std::get<msg::TranscriptionComplete>(reply).session;
        REQUIRE(session.id == id);
        REQUIRE(session.status.state == SessionState::Completed);
        REQUIRE(session.text == "hello world");
        REQUIRE(session.confidence == 0.9f);

        REQUIRE(f.engine->sample_counts == std::vector<size_t>{16000});
        REQUIRE(f.engine->sample_rates == std::vector<uint32_t>{16000});
        REQUIRE(f.registry.size() == 0);
    }

    SECTION("ChunksAccumulate") {
        auto id = f.start();
        for (int i = 0; i < 10; ++i) {
            REQUIRE(std::holds_alternative<msg::TranscriptionUpdate>(f.stream(id, 1600)));
        }
        f.send(msg::StopRecording{});
        REQUIRE(f.engine->sample_counts == std::vector<size_t>{16000});
    }

    SECTION("StereoIsDownmixedBeforeTranscription") {
        auto id = f.start();
        f.stream(id, 96000, 48000, 2);
        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::holds_alternative<msg::TranscriptionComplete>(reply));
        REQUIRE(f.engine->sample_counts == std::vector<size_t>{48000});
        REQUIRE(f.engine->sample_rates == std::vector<uint32_t>{48000});
    }

    SECTION("StreamToUnknownSession") {
        auto stranger = SessionId::generate();
        REQUIRE(error_of(f.stream(stranger, 160)) == "session not found");
        REQUIRE_FALSE(f.registry.exists(stranger));
        REQUIRE(f.registry.size() == 0);
    }

    SECTION("StreamRejectsInvalidFormat") {
        auto id = f.start();
        REQUIRE(error_of(f.stream(id, 160, 0, 1)) == "invalid audio format");
        REQUIRE(error_of(f.stream(id, 160, 16000, 0)) == "invalid audio format");
    }

    SECTION("StreamRejectsFormatChange") {
        auto id = f.start();
        f.stream(id, 160, 16000, 1);
        REQUIRE(error_of(f.stream(id, 160, 44100, 1)) == "audio format mismatch");
        REQUIRE(error_of(f.stream(id, 160, 16000, 2)) == "audio format mismatch");

        f.registry.with_buffer(id, [](const TranscriptionSession&, AudioBuffer& b) {
            REQUIRE(b.sample_count() == 160);
        });
    }

    SECTION("StopWithNoSessions") {
        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::holds_alternative<msg::RecordingStopped>(reply));
        REQUIRE(f.engine->transcriptions == 0);
    }

    SECTION("StopWithoutAudioDropsSession") {
        f.start();
        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::holds_alternative<msg::RecordingStopped>(reply));
        REQUIRE(f.engine->transcriptions == 0);
        REQUIRE(f.registry.size() == 0);
    }

    SECTION("StopWithSeveralSessions") {
        auto a = f.start();
        auto b = f.start();
        f.stream(a, 1600);
        f.stream(b, 3200);

        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::holds_alternative<msg::RecordingStopped>(reply));
        REQUIRE(f.engine->transcriptions == 2);
        REQUIRE(f.registry.size() == 0);
    }

    SECTION("TranscriptionFailureMarksSessionFailed") {
        f.engine->fail_transcribe = true;
        auto id = f.start();
        f.stream(id, 1600);

        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::holds_alternative<msg::TranscriptionComplete>(reply));
        const auto& session = std::get<msg::TranscriptionComplete>(reply).session;
        REQUIRE(session.status.state == SessionState::Failed);
        REQUIRE(session.status.reason.find("decoder exploded") != std::string::npos);
        REQUIRE(f.registry.size() == 0);

        // The daemon keeps serving.
        f.engine->fail_transcribe = false;
        auto next = f.start();
        f.stream(next, 1600);
        auto ok = f.send(msg::StopRecording{});
        REQUIRE(std::get<msg::TranscriptionComplete>(ok).session.status.state ==
                SessionState::Completed);
    }

    SECTION("EmptyTranscriptIsSentinel") {
        f.engine->text = "   ";
        auto id = f.start();
        f.stream(id, 1600);
        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::get<msg::TranscriptionComplete>(reply).session.text == "[No speech detected]");
    }

    SECTION("LoadFailureCreatesNoSession") {
        f.engine->fail_load = true;
        auto reply = f.send(msg::StartRecording{});
        REQUIRE(error_of(reply).find("corrupt model") != std::string::npos);
        REQUIRE(f.registry.size() == 0);
        REQUIRE_FALSE(f.model.is_loaded());

        f.engine->fail_load = false;
        f.start();
        REQUIRE(f.model.is_loaded());
    }

    SECTION("MissingModelFile") {
        Config config;
        SessionRegistry registry;
        ModelManager model(std::make_unique<FakeEngine>(f.engine),
                           "/tmp/dictation_test_no_such_model.bin", "en");
        DaemonCore core(config, false, registry, model, [] {});

        auto reply = core.handle_message(msg::StartRecording{});
        REQUIRE(reply.has_value());
        REQUIRE(error_of(*reply).find("model file not found") != std::string::npos);
        REQUIRE(registry.size() == 0);
    }

    SECTION("ClearSessionDiscardsAudio") {
        auto id = f.start();
        f.stream(id, 1600);

        REQUIRE(std::holds_alternative<msg::SessionCleared>(f.send(msg::ClearSession{})));
        REQUIRE(f.registry.size() == 0);
        REQUIRE(f.engine->transcriptions == 0);
        REQUIRE(error_of(f.stream(id, 160)) == "session not found");
    }

    SECTION("SetSensitivityClamps") {
        auto reply = f.send(msg::SetSensitivity{0.8f});
        REQUIRE(std::get<msg::Status>(reply).status.vad_sensitivity == 0.8f);

        reply = f.send(msg::SetSensitivity{4.0f});
        REQUIRE(std::get<msg::Status>(reply).status.vad_sensitivity == 1.0f);

        reply = f.send(msg::SetSensitivity{-1.0f});
        REQUIRE(std::get<msg::Status>(reply).status.vad_sensitivity == 0.0f);
    }

    SECTION("ShutdownInvokesCallbackWithoutReply") {
        auto reply = f.core.handle_message(msg::Shutdown{});
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(f.shutdowns == 1);
    }

    SECTION("BlockingClassification") {
        REQUIRE(DaemonCore::is_blocking(msg::StartRecording{}));
        REQUIRE(DaemonCore::is_blocking(msg::StopRecording{}));
        REQUIRE_FALSE(DaemonCore::is_blocking(msg::GetStatus{}));
        REQUIRE_FALSE(DaemonCore::is_blocking(msg::StreamAudio{}));
        REQUIRE_FALSE(DaemonCore::is_blocking(msg::Shutdown{}));
    }

    SECTION("IdleTickUnloadsModel") {
        f.config.model.timeout_seconds = 0;
        DaemonCore core(f.config, false, f.registry, f.model, [] {});
        REQUIRE(core.handle_message(msg::StartRecording{}).has_value());
        REQUIRE(f.model.is_loaded());

        std::this_thread::sleep_for(10ms);
        core.on_idle_tick();
        REQUIRE_FALSE(f.model.is_loaded());
    }

    SECTION("StopReloadsModelUnloadedMidRecording") {
        auto id = f.start();
        f.stream(id, 1600);
        std::this_thread::sleep_for(5ms);
        REQUIRE(f.model.unload_if_idle(1ms));

        auto reply = f.send(msg::StopRecording{});
        REQUIRE(std::get<msg::TranscriptionComplete>(reply).session.status.state ==
                SessionState::Completed);
        REQUIRE(f.engine->loads == 2);
    }

    SECTION("StatusDuringConcurrentStop") {
        f.engine->transcribe_delay = 300ms;
        auto id = f.start();
        f.stream(id, 1600);

        std::jthread stopper([&] { (void)f.core.handle_message(msg::StopRecording{}); });
        while (f.engine->concurrent == 0) std::this_thread::sleep_for(1ms);

        auto reply = f.send(msg::GetStatus{});
        REQUIRE(std::holds_alternative<msg::Status>(reply));
        REQUIRE(f.engine->concurrent == 1);
    }

    SECTION("StopDuringModelLoadKeepsNewSession") {
        f.engine->load_delay = 200ms;
        std::optional<DaemonMessage> started;
        std::jthread starter([&] { started = f.core.handle_message(msg::StartRecording{}); });
        while (f.engine->loads_started == 0) std::this_thread::sleep_for(1ms);

        REQUIRE(std::holds_alternative<msg::RecordingStopped>(f.send(msg::StopRecording{})));
        starter.join();

        REQUIRE(started.has_value());
        REQUIRE(std::holds_alternative<msg::RecordingStarted>(*started));
        auto id = std::get<msg::RecordingStarted>(*started).session_id;
        REQUIRE(f.registry.exists(id));
        REQUIRE(std::holds_alternative<msg::TranscriptionUpdate>(f.stream(id, 1600)));
    }

    SECTION("NonFiniteSensitivityRejected") {
        f.send(msg::SetSensitivity{0.3f});
        REQUIRE(error_of(f.send(msg::SetSensitivity{std::numeric_limits<float>::quiet_NaN()})) ==
                "invalid sensitivity");
        REQUIRE(error_of(f.send(msg::SetSensitivity{std::numeric_limits<float>::infinity()})) ==
                "invalid sensitivity");
        REQUIRE(f.core.status().vad_sensitivity == 0.3f);
    }

    SECTION("RemoteEngineSkipsLocalFileCheck") {
        f.engine->remote = true;
        Config config;
        SessionRegistry registry;
        ModelManager model(std::make_unique<FakeEngine>(f.engine),
                           "/srv/models/ggml-base.en.bin", "en");
        DaemonCore core(config, false, registry, model, [] {});

        auto reply = core.handle_message(msg::StartRecording{});
        REQUIRE(reply.has_value());
        REQUIRE(std::holds_alternative<msg::RecordingStarted>(*reply));
        REQUIRE(f.engine->loads == 1);
    }
}
