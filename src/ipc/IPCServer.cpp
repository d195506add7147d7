#include "splitdeck/ipc/IPCServer.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <iostream>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace sdeck {

namespace {

    // Keeps one response per line; multi-line data such as `show` output
    // is sent with escaped newlines
    std::string oneLine(const std::string& text) {
        std::string out;
        out.reserve(text.size());
        for (char c : text) {
            if (c == '\n') {
                out += "\\n";
            } else {
                out += c;
            }
        }
        return out;
    }
}

bool IPCServer::start() {
    if (running_.load()) {
        return true;
    }

    size_t pos = socket_path_.find_last_of('/');
    if (pos != std::string::npos && pos > 0) {
        std::string dir = socket_path_.substr(0, pos);
        if (mkdir(dir.c_str(), 0755) < 0 && errno != EEXIST) {
            std::cerr << "IPC: Failed to create " << dir << ": " << strerror(errno) << std::endl;
            return false;
        }
    }

    sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        std::cerr << "IPC: Socket path too long: " << socket_path_ << std::endl;
        return false;
    }

    unlink(socket_path_.c_str());

    server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        std::cerr << "IPC: Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "IPC: Failed to bind socket: " << strerror(errno) << std::endl;
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    chmod(socket_path_.c_str(), 0600);

    if (listen(server_fd_, 10) < 0) {
        std::cerr << "IPC: Failed to listen: " << strerror(errno) << std::endl;
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        return false;
    }

    int flags = fcntl(server_fd_, F_GETFL, 0);
    fcntl(server_fd_, F_SETFL, flags | O_NONBLOCK);

    running_.store(true);

    accept_thread_ = std::thread(&IPCServer::acceptLoop, this);

    std::cout << "IPC: Server started at " << socket_path_ << std::endl;
    return true;
}

void IPCServer::stop() {
    if (!running_.load()) {
        return;
    }

    running_.store(false);

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
    }

    unlink(socket_path_.c_str());

    // Client threads close their own descriptors once recv() fails
    std::vector<ClientWorker> workers;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        for (int fd : client_fds_) {
            shutdown(fd, SHUT_RDWR);
        }
        workers.swap(workers_);
    }

    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    std::cout << "IPC: Server stopped" << std::endl;
}

void IPCServer::broadcast(const std::string& message) {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);

    auto stalled = std::remove_if(subscribers_.begin(), subscribers_.end(), [&](int fd) {
        if (sendAll(fd, message + "\n")) {
            return false;
        }
        std::cerr << "IPC: Subscriber " << fd << " stopped reading, unsubscribing" << std::endl;
        return true;
    });
    subscribers_.erase(stalled, subscribers_.end());
}

size_t IPCServer::subscriberCount() {
    std::lock_guard<std::mutex> lock(subscriber_mutex_);
    return subscribers_.size();
}

size_t IPCServer::workerCount() {
    std::lock_guard<std::mutex> lock(client_mutex_);
    return workers_.size();
}

void IPCServer::reapWorkers() {
    std::vector<ClientWorker> done;
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        auto finished = std::stable_partition(workers_.begin(), workers_.end(),
            [](const ClientWorker& w) { return !w.finished->load(); });
        std::move(finished, workers_.end(), std::back_inserter(done));
        workers_.erase(finished, workers_.end());
    }

    for (auto& worker : done) {
        worker.thread.join();
    }
}

void IPCServer::acceptLoop() {
    while (running_.load()) {
        sockaddr_un client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_len);

        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            std::cerr << "IPC: Accept failed: " << strerror(errno) << std::endl;
            break;
        }

        int flags = fcntl(client_fd, F_GETFL, 0);
        fcntl(client_fd, F_SETFL, flags | O_NONBLOCK);

        reapWorkers();

        std::lock_guard<std::mutex> lock(client_mutex_);
        if (client_fds_.size() >= MAX_IPC_CLIENTS) {
            std::cerr << "IPC: Max clients reached (" << MAX_IPC_CLIENTS << "), rejecting connection" << std::endl;
            close(client_fd);
            continue;
        }
        client_fds_.push_back(client_fd);

        ClientWorker worker;
        worker.finished = std::make_shared<std::atomic<bool>>(false);
        worker.thread = std::thread(&IPCServer::handleClient, this, client_fd, worker.finished);
        workers_.push_back(std::move(worker));
    }
}

void IPCServer::handleClient(int client_fd, std::shared_ptr<std::atomic<bool>> finished) {
    char buffer[4096];
    std::string command_buffer;

    while (running_.load()) {
        ssize_t n = recv(client_fd, buffer, sizeof(buffer) - 1, 0);

        if (n <= 0) {
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
                continue;
            }
            break;
        }

        buffer[n] = '\0';
        command_buffer += buffer;

        size_t pos;
        while ((pos = command_buffer.find('\n')) != std::string::npos) {
            std::string command = command_buffer.substr(0, pos);
            command_buffer = command_buffer.substr(pos + 1);

            if (!command.empty() && command.back() == '\r') {
                command.pop_back();
            }
            if (!command.empty()) {
                IPCResponse response = processCommand(client_fd, command);
                std::lock_guard<std::mutex> lock(subscriber_mutex_);
                if (!sendAll(client_fd, oneLine(response.format()) + "\n")) {
                    std::cerr << "IPC: Failed to reply to client " << client_fd << std::endl;
                }
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        client_fds_.erase(
            std::remove(client_fds_.begin(), client_fds_.end(), client_fd),
            client_fds_.end()
        );
    }

    {
        std::lock_guard<std::mutex> lock(subscriber_mutex_);
        subscribers_.erase(
            std::remove(subscribers_.begin(), subscribers_.end(), client_fd),
            subscribers_.end()
        );
    }

    close(client_fd);
    finished->store(true);
}

IPCResponse IPCServer::processCommand(int client_fd, const std::string& command) {
    auto args = CommandDispatcher::parseCommand(command);

    if (!args.empty() && args[0] == "subscribe") {
        std::lock_guard<std::mutex> lock(subscriber_mutex_);
        if (std::find(subscribers_.begin(), subscribers_.end(), client_fd) == subscribers_.end()) {
            subscribers_.push_back(client_fd);
        }
        return IPCResponse::ok("Subscribed", R"({"subscribed": true})");
    }
    if (!args.empty() && args[0] == "unsubscribe") {
        std::lock_guard<std::mutex> lock(subscriber_mutex_);
        subscribers_.erase(
            std::remove(subscribers_.begin(), subscribers_.end(), client_fd),
            subscribers_.end()
        );
        return IPCResponse::ok("Unsubscribed", R"({"subscribed": false})");
    }

    // Quitting is only honoured from the controlling terminal
    if (CommandDispatcher::isQuit(command)) {
        return IPCResponse::error("quit is not available over IPC");
    }

    return dispatcher_.execute(command);
}

bool IPCServer::sendAll(int fd, const std::string& output) {
    const char* ptr = output.c_str();
    size_t remaining = output.size();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(IPC_SEND_TIMEOUT_MS);

    while (remaining > 0) {
        ssize_t sent = send(fd, ptr, remaining, MSG_NOSIGNAL);

        if (sent < 0) {
            if ((errno == EAGAIN || errno == EWOULDBLOCK) &&
                std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            return false;
        }

        if (sent == 0) {
            return false;
        }

        ptr += sent;
        remaining -= sent;
    }

    return true;
}

}
