#include "splitdeck/ipc/IPCServer.hpp"

#include <cassert>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using namespace sdeck;

namespace {

    bool startsWith(const std::string& s, const std::string& prefix) {
        return s.compare(0, prefix.size(), prefix) == 0;
    }

    std::string socketPath(const std::string& name) {
        return "/tmp/splitdeck-test-" + std::to_string(getpid()) + "/" + name + ".sock";
    }

    struct Fixture {
        SessionTable sessions;
        SplitLayoutEngine engine{sessions};
        DragDropCoordinator dnd{engine};
        CommandDispatcher dispatcher{engine, dnd};
        IPCServer server;

        explicit Fixture(const std::string& name)
            : server(socketPath(name), dispatcher)
        {
            engine.subscribe([this](const LayoutEvent& e) {
                server.broadcast(std::string("EVENT|") + toString(e.type) + "|" + std::to_string(e.tab));
            });
            bool started = server.start();
            assert(started);
            (void)started;
        }
    };

    class Client {
    public:
        explicit Client(const std::string& path) {
            fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
            assert(fd_ >= 0);

            sockaddr_un addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
            int rc = connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
            assert(rc == 0);
            (void)rc;

            // A stuck server fails the test instead of hanging it
            timeval tv{5, 0};
            setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }

        ~Client() { disconnect(); }

        Client(const Client&) = delete;
        Client& operator=(const Client&) = delete;

        void disconnect() {
            if (fd_ >= 0) {
                close(fd_);
                fd_ = -1;
            }
        }

        void send(const std::string& text) {
            const char* ptr = text.c_str();
            size_t remaining = text.size();
            while (remaining > 0) {
                ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
                assert(n > 0);
                ptr += n;
                remaining -= static_cast<size_t>(n);
            }
        }

        std::string readLine() {
            size_t pos;
            while ((pos = pending_.find('\n')) == std::string::npos) {
                char buffer[4096];
                ssize_t n = recv(fd_, buffer, sizeof(buffer), 0);
                assert(n > 0);
                pending_.append(buffer, static_cast<size_t>(n));
            }
            std::string line = pending_.substr(0, pos);
            pending_.erase(0, pos + 1);
            return line;
        }

        // Next reply, skipping event lines
        std::string request(const std::string& command) {
            send(command + "\n");
            std::string line = readLine();
            while (startsWith(line, "EVENT|")) {
                line = readLine();
            }
            return line;
        }

    private:
        int fd_{-1};
        std::string pending_;
    };
}

static void test_commands_over_socket() {
    Fixture f("commands");
    Client client(f.server.getSocketPath());

    std::string opened = client.request("open ssh alpha");
    assert(startsWith(opened, "OK|Tab opened|"));
    assert(f.engine.tabCount() == 1);

    assert(startsWith(client.request("frobnicate"), "ERROR|Unknown command"));

    // Multi-line output stays on one line
    std::string shown = client.request("show 1");
    assert(startsWith(shown, "OK|"));
    assert(shown.find("\\n") != std::string::npos);

    assert(client.request("quit") == "ERROR|quit is not available over IPC");
    assert(f.server.isRunning());
}

static void test_subscriber_receives_events() {
    Fixture f("events");
    Client watcher(f.server.getSocketPath());
    Client actor(f.server.getSocketPath());

    assert(startsWith(watcher.request("subscribe"), "OK|Subscribed"));
    assert(f.server.subscriberCount() == 1);

    assert(startsWith(actor.request("open ssh alpha"), "OK|"));
    assert(watcher.readLine() == "EVENT|TabCreated|1");

    assert(startsWith(watcher.request("unsubscribe"), "OK|Unsubscribed"));
    assert(f.server.subscriberCount() == 0);
}

static void test_stalled_subscriber_is_dropped() {
    Fixture f("stalled");
    Client stalled(f.server.getSocketPath());
    Client actor(f.server.getSocketPath());

    assert(startsWith(stalled.request("subscribe"), "OK|Subscribed"));
    assert(startsWith(actor.request("open ssh alpha"), "OK|"));

    // Every group command publishes an event the subscriber never reads
    const int rounds = 100;
    const int batch = 50;
    std::string commands;
    for (int i = 0; i < batch; ++i) {
        commands += "group 1 ops\n";
    }

    auto started = std::chrono::steady_clock::now();
    for (int round = 0; round < rounds; ++round) {
        actor.send(commands);
        for (int i = 0; i < batch; ++i) {
            assert(startsWith(actor.readLine(), "OK|Group set|"));
        }
    }
    auto elapsed = std::chrono::steady_clock::now() - started;

    assert(f.server.subscriberCount() == 0);
    assert(elapsed < std::chrono::seconds(30));

    // The dropped subscriber is still served as a plain client
    assert(startsWith(actor.request("tabs"), "OK|"));
}

static void test_finished_clients_are_reaped() {
    Fixture f("reaped");

    for (int i = 0; i < 3; ++i) {
        Client client(f.server.getSocketPath());
        assert(startsWith(client.request("tabs"), "OK|"));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    Client last(f.server.getSocketPath());
    assert(startsWith(last.request("tabs"), "OK|"));
    assert(f.server.workerCount() == 1);
}

int main() {
    test_commands_over_socket();
    test_subscriber_receives_events();
    test_stalled_subscriber_is_dropped();
    test_finished_clients_are_reaped();

    std::cout << "test_ipc_server: all tests passed" << std::endl;
    return 0;
}
