#pragma once

#include "splitdeck/ipc/CommandDispatcher.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sdeck {

static constexpr size_t MAX_IPC_CLIENTS = 32;

// A peer that leaves its socket full for this long is given up on
static constexpr int IPC_SEND_TIMEOUT_MS = 500;

/**
 * @brief Unix socket front end for the command dispatcher
 *
 * One request per line, one response line per request. A client that
 * sends `subscribe` additionally receives `EVENT|<type>|<tab>` lines.
 * Subscribers that stop reading are unsubscribed.
 */
class IPCServer {
public:
    IPCServer(std::string socket_path, CommandDispatcher& dispatcher);
    ~IPCServer();

    IPCServer(const IPCServer&) = delete;
    IPCServer& operator=(const IPCServer&) = delete;

    bool start();

    void stop();

    void broadcast(const std::string& message);

    bool isRunning() const { return running_.load(); }

    const std::string& getSocketPath() const { return socket_path_; }

    size_t subscriberCount();

    // Client threads not yet joined, finished or not
    size_t workerCount();

private:
    struct ClientWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::string socket_path_;
    CommandDispatcher& dispatcher_;
    int server_fd_;
    std::atomic<bool> running_;
    std::thread accept_thread_;
    std::vector<ClientWorker> workers_;
    std::vector<int> client_fds_;
    std::mutex client_mutex_;

    std::vector<int> subscribers_;
    std::mutex subscriber_mutex_;

    void acceptLoop();
    void reapWorkers();
    void handleClient(int client_fd, std::shared_ptr<std::atomic<bool>> finished);
    IPCResponse processCommand(int client_fd, const std::string& command);

    bool sendAll(int fd, const std::string& output);
};

inline IPCServer::IPCServer(std::string socket_path, CommandDispatcher& dispatcher)
    : socket_path_(std::move(socket_path))
    , dispatcher_(dispatcher)
    , server_fd_(-1)
    , running_(false)
{
}

inline IPCServer::~IPCServer() {
    stop();
}

}
