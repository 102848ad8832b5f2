#include <catch2/catch_test_macros.hpp>

#include "fake_engine.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/unix_socket_client.hpp"

#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <future>
#include <memory>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;

namespace {

std::string loop_socket_path() {
    return "/tmp/dictation_test_loop_" + std::to_string(getpid()) + ".sock";
}

// Daemon event loop on its own thread, backed by the fake engine.
struct LoopFixture {
    std::shared_ptr<FakeEngineState> engine = std::make_shared<FakeEngineState>();
    TmpModelFile model_file;
    Config config;
    std::unique_ptr<LinuxEventLoop> loop;
    std::jthread thread;

    explicit LoopFixture(uint32_t workers = 2) {
        config.model.path = model_file.path;
        config.ipc.socket_path = loop_socket_path();
        config.daemon.workers = workers;
    }

    ~LoopFixture() {
        if (loop) loop->request_stop();
        if (thread.joinable()) thread.join();
    }

    bool start() {
        loop = std::make_unique<LinuxEventLoop>(config, false, std::make_unique<FakeEngine>(engine));
        std::promise<bool> ready;
        auto initialized = ready.get_future();
        thread = std::jthread([this, ready = std::move(ready)]() mutable {
            bool ok = loop->init();
            ready.set_value(ok);
            if (ok) loop->run();
        });
        return initialized.get();
    }
};

AudioChunk chunk_for(const SessionId& id, size_t samples) {
    return AudioChunk{
        .session_id = id,
        .data = std::vector<float>(samples, 0.2f),
        .sample_rate = 16000,
        .channels = 1,
        .timestamp = std::chrono::system_clock::now(),
    };
}

bool connect_retry(UnixSocketClient& client, const std::string& path) {
    for (int i = 0; i < 200; ++i) {
        if (client.connect(path)) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

bool wait_until(const std::atomic<int>& value, int expected) {
    for (int i = 0; i < 400; ++i) {
        if (value.load() == expected) return true;
        std::this_thread::sleep_for(5ms);
    }
    return false;
}

int raw_connect(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

SessionId start_recording(UnixSocketClient& client) {
    auto reply = client.request(msg::StartRecording{}, 5000);
    REQUIRE(reply.has_value());
    REQUIRE(std::holds_alternative<msg::RecordingStarted>(*reply));
    return std::get<msg::RecordingStarted>(*reply).session_id;
}

void stream_second(UnixSocketClient& client, const SessionId& id) {
    auto reply = client.request(msg::StreamAudio{chunk_for(id, 16000)}, 5000);
    REQUIRE(reply.has_value());
    REQUIRE(std::holds_alternative<msg::TranscriptionUpdate>(*reply));
}

// Runs the daemon loop in a child process so it owns the signal mask and
// may exit the process. Only async-safe exits are used in the child.
pid_t fork_daemon(const std::string& socket_path, std::chrono::milliseconds transcribe_delay) {
    pid_t pid = ::fork();
    if (pid != 0) return pid;

    auto state = std::make_shared<FakeEngineState>();
    state->transcribe_delay = transcribe_delay;
    state->remote = true; // no model file to leave behind
    Config config;
    config.model.path = "/srv/models/ggml-base.en.bin";
    config.ipc.socket_path = socket_path;

    LinuxEventLoop loop(config, false, std::make_unique<FakeEngine>(state));
    if (!loop.init()) ::_exit(2);
    loop.run();
    ::_exit(0);
}

int wait_exit_code(pid_t pid) {
    int status = 0;
    for (int i = 0; i < 500; ++i) {
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        }
        std::this_thread::sleep_for(10ms);
    }
    ::kill(pid, SIGKILL);
    ::waitpid(pid, &status, 0);
    return -1;
}

} // namespace

TEST_CASE("LinuxEventLoop", "[loop]") {
    std::filesystem::remove(loop_socket_path());

    SECTION("StartStreamStop") {
        LoopFixture f;
        REQUIRE(f.start());
        REQUIRE(std::filesystem::exists(f.config.ipc.socket_path));

        UnixSocketClient client;
        REQUIRE(client.connect(f.config.ipc.socket_path));
        auto id = start_recording(client);
        stream_second(client, id);

        auto done = client.request(msg::StopRecording{}, 5000);
        REQUIRE(done.has_value());
        REQUIRE(std::holds_alternative<msg::TranscriptionComplete>(*done));
        const auto& session = std::get<msg::TranscriptionComplete>(*done).session;
        REQUIRE(session.id == id);
        REQUIRE(session.text == "hello world");
        REQUIRE(f.engine->loads == 1);
        REQUIRE(f.engine->transcriptions == 1);
    }

    SECTION("ServesOthersWhileTranscribing") {
        LoopFixture f;
        f.engine->transcribe_delay = 400ms;
        REQUIRE(f.start());

        UnixSocketClient a;
        UnixSocketClient b;
        REQUIRE(a.connect(f.config.ipc.socket_path));
        REQUIRE(b.connect(f.config.ipc.socket_path));

        auto id = start_recording(a);
        stream_second(a, id);
        REQUIRE(a.send(msg::StopRecording{}));
        REQUIRE(wait_until(f.engine->concurrent, 1));

        auto status = b.request(msg::GetStatus{}, 2000);
        REQUIRE(status.has_value());
        REQUIRE(std::holds_alternative<msg::Status>(*status));
        REQUIRE(f.engine->concurrent == 1);

        auto done = a.recv(5000);
        REQUIRE(done.has_value());
        REQUIRE(std::get<msg::TranscriptionComplete>(*done).session.id == id);
    }

    SECTION("BusyClientHangupIsDropped") {
        LoopFixture f(1);
        f.engine->transcribe_delay = 300ms;
        REQUIRE(f.start());

        UnixSocketClient a;
        REQUIRE(a.connect(f.config.ipc.socket_path));
        auto id = start_recording(a);
        stream_second(a, id);
        REQUIRE(a.send(msg::StopRecording{}));
        REQUIRE(wait_until(f.engine->concurrent, 1));
        a.close();

        // Likely reuses the descriptor the first client had.
        UnixSocketClient c;
        REQUIRE(c.connect(f.config.ipc.socket_path));
        auto status = c.request(msg::GetStatus{}, 2000);
        REQUIRE(status.has_value());
        REQUIRE(std::holds_alternative<msg::Status>(*status));

        // Queued behind the abandoned transcription on the single worker.
        auto stopped = c.request(msg::StopRecording{}, 5000);
        REQUIRE(stopped.has_value());
        REQUIRE(std::holds_alternative<msg::RecordingStopped>(*stopped));
        REQUIRE(f.engine->transcriptions == 1);

        auto stale = c.recv(100);
        REQUIRE_FALSE(stale.has_value());
        REQUIRE(stale.error().kind == wire::ErrorKind::Io);
    }

    SECTION("ProtocolErrorDropsOnlyThatClient") {
        LoopFixture f;
        REQUIRE(f.start());

        UnixSocketClient good;
        REQUIRE(good.connect(f.config.ipc.socket_path));
        int raw = raw_connect(f.config.ipc.socket_path);
        REQUIRE(raw >= 0);

        const uint8_t garbage[] = {0x04, 0x00, 0x00, 0x00, 0xA3, 'F', 'o', 'o'};
        REQUIRE(::send(raw, garbage, sizeof(garbage), MSG_NOSIGNAL) ==
                static_cast<ssize_t>(sizeof(garbage)));

        pollfd pfd{.fd = raw, .events = POLLIN, .revents = 0};
        REQUIRE(::poll(&pfd, 1, 2000) == 1);
        uint8_t byte = 0;
        REQUIRE(::recv(raw, &byte, 1, 0) == 0);
        ::close(raw);

        auto status = good.request(msg::GetStatus{}, 2000);
        REQUIRE(status.has_value());
        REQUIRE(std::holds_alternative<msg::Status>(*status));
    }

    SECTION("PipelinedRequestsAnsweredInOrder") {
        LoopFixture f;
        REQUIRE(f.start());

        UnixSocketClient client;
        REQUIRE(client.connect(f.config.ipc.socket_path));
        REQUIRE(client.send(msg::GetStatus{}));
        REQUIRE(client.send(msg::SetSensitivity{0.3f}));
        REQUIRE(client.send(msg::StopRecording{}));
        REQUIRE(client.send(msg::GetStatus{}));

        auto first = client.recv(2000);
        REQUIRE(first.has_value());
        REQUIRE(std::get<msg::Status>(*first).status.vad_sensitivity == 0.5f);

        auto second = client.recv(2000);
        REQUIRE(second.has_value());
        REQUIRE(std::get<msg::Status>(*second).status.vad_sensitivity == 0.3f);

        auto third = client.recv(2000);
        REQUIRE(third.has_value());
        REQUIRE(std::holds_alternative<msg::RecordingStopped>(*third));

        auto fourth = client.recv(2000);
        REQUIRE(fourth.has_value());
        REQUIRE(std::get<msg::Status>(*fourth).status.vad_sensitivity == 0.3f);
    }

    SECTION("SlowReaderDoesNotStallOthers") {
        LoopFixture f;
        REQUIRE(f.start());

        int slow = raw_connect(f.config.ipc.socket_path);
        REQUIRE(slow >= 0);

        // Requests until the daemon stops reading them; the replies pile up
        // unread on its side.
        auto frame = wire::encode(ClientMessage{msg::GetStatus{}});
        int sent = 0;
        for (; sent < 100000; ++sent) {
            ssize_t n = ::send(slow, frame.data(), frame.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
            if (n < 0) {
                std::this_thread::sleep_for(50ms);
                n = ::send(slow, frame.data(), frame.size(), MSG_NOSIGNAL | MSG_DONTWAIT);
                if (n < 0) break;
            }
        }
        REQUIRE(sent < 100000);

        UnixSocketClient other;
        REQUIRE(other.connect(f.config.ipc.socket_path));
        auto status = other.request(msg::GetStatus{}, 2000);
        REQUIRE(status.has_value());
        REQUIRE(std::holds_alternative<msg::Status>(*status));

        ::close(slow);
        auto again = other.request(msg::GetStatus{}, 2000);
        REQUIRE(again.has_value());
        REQUIRE(std::holds_alternative<msg::Status>(*again));
    }

    SECTION("RequestStopRemovesSocket") {
        LoopFixture f;
        REQUIRE(f.start());
        REQUIRE(std::filesystem::exists(f.config.ipc.socket_path));

        f.loop->request_stop();
        f.thread.join();
        REQUIRE_FALSE(std::filesystem::exists(f.config.ipc.socket_path));
    }

    SECTION("SignalStopsLoopAfterInFlightReply") {
        auto path = loop_socket_path();
        pid_t pid = fork_daemon(path, 400ms);
        REQUIRE(pid > 0);

        UnixSocketClient client;
        REQUIRE(connect_retry(client, path));
        auto id = start_recording(client);
        stream_second(client, id);
        REQUIRE(client.send(msg::StopRecording{}));
        std::this_thread::sleep_for(100ms);
        REQUIRE(::kill(pid, SIGTERM) == 0);

        auto done = client.recv(5000);
        REQUIRE(done.has_value());
        REQUIRE(std::holds_alternative<msg::TranscriptionComplete>(*done));
        REQUIRE(std::get<msg::TranscriptionComplete>(*done).session.text == "hello world");

        REQUIRE(wait_exit_code(pid) == 0);
        REQUIRE_FALSE(std::filesystem::exists(path));
    }

    SECTION("ShutdownRemovesSocketAndExits") {
        auto path = loop_socket_path();
        pid_t pid = fork_daemon(path, 0ms);
        REQUIRE(pid > 0);

        UnixSocketClient client;
        REQUIRE(connect_retry(client, path));
        REQUIRE(client.send(msg::Shutdown{}));

        auto reply = client.recv(2000);
        REQUIRE_FALSE(reply.has_value());
        REQUIRE(reply.error().kind == wire::ErrorKind::Closed);

        REQUIRE(wait_exit_code(pid) == 0);
        REQUIRE_FALSE(std::filesystem::exists(path));
    }
}
