#pragma once

#include <chrono>
#include <cstddef>
#include <queue>
#include <string>

namespace sdeck {

/**
 * @brief Notification severity levels
 */
enum class NotificationLevel {
    LevelError,
    LevelSuccess,
    LevelInfo,
    LevelWarning
};

struct Notification {
    std::string message;
    NotificationLevel level;
    std::chrono::steady_clock::time_point created_at;
    std::chrono::milliseconds duration;
    bool sent_dbus{false};
    bool persistent{false};
    bool is_config_error{false};
};

/**
 * @brief Desktop notifications over the session bus
 *
 * Messages are queued and pushed to org.freedesktop.Notifications on the
 * next update(). Without a session bus the toaster still keeps its queue
 * and only echoes to stderr.
 */
class Toaster {
public:
    Toaster(bool enabled, int timeout_ms);
    ~Toaster();

    Toaster(const Toaster&) = delete;
    Toaster& operator=(const Toaster&) = delete;
    Toaster(Toaster&&) = delete;
    Toaster& operator=(Toaster&&) = delete;

    bool initialize();

    void error(const std::string& message);

    void success(const std::string& message);

    void info(const std::string& message);

    void warning(const std::string& message);

    void configError(const std::string& message);

    void clearConfigErrors();

    void update();

    size_t pendingCount() const { return notifications_.size(); }
    size_t configErrorCount() const { return config_errors_.size(); }
    bool isConnected() const { return connection_ != nullptr; }

private:
    bool enabled_;
    std::chrono::milliseconds timeout_;

    std::queue<Notification> notifications_;
    static constexpr size_t MAX_VISIBLE_NOTIFICATIONS = 3;

    std::queue<Notification> config_errors_;
    bool has_config_errors_{false};

    // GDBusConnection*, kept opaque so gio stays out of this header
    void* connection_{nullptr};

    void notify(const std::string& message, NotificationLevel level);
    void cleanupExpired();

    bool initializeDBus();
    void sendDBusNotification(const Notification& notif);
};

}
