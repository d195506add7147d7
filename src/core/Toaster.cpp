#include "splitdeck/core/Toaster.hpp"

#include <gio/gio.h>
#include <iostream>

namespace sdeck {

namespace {

    const char* iconForLevel(NotificationLevel level) {
        switch (level) {
            case NotificationLevel::LevelError:
                return "dialog-error";
            case NotificationLevel::LevelWarning:
                return "dialog-warning";
            case NotificationLevel::LevelSuccess:
            case NotificationLevel::LevelInfo:
            default:
                return "dialog-information";
        }
    }
}

Toaster::Toaster(bool enabled, int timeout_ms)
    : enabled_(enabled), timeout_(timeout_ms) {}

Toaster::~Toaster() {
    if (connection_) {
        g_object_unref(static_cast<GDBusConnection*>(connection_));
        connection_ = nullptr;
    }
}

bool Toaster::initialize() {
    if (!enabled_) {
        return true;
    }

    if (!initializeDBus()) {
        std::cerr << "Toaster: No session bus, notifications go to stderr only" << std::endl;
    }
    return true;
}

void Toaster::error(const std::string& message) {
    notify(message, NotificationLevel::LevelError);
}

void Toaster::success(const std::string& message) {
    notify(message, NotificationLevel::LevelSuccess);
}

void Toaster::info(const std::string& message) {
    notify(message, NotificationLevel::LevelInfo);
}

void Toaster::warning(const std::string& message) {
    notify(message, NotificationLevel::LevelWarning);
}

void Toaster::notify(const std::string& message, NotificationLevel level) {
    if (level == NotificationLevel::LevelError || level == NotificationLevel::LevelWarning) {
        std::cerr << "Toaster: " << message << std::endl;
    }
    if (!enabled_) {
        return;
    }

    notifications_.push(Notification{
        message,
        level,
        std::chrono::steady_clock::now(),
        timeout_
    });

    // Oldest toasts make room for new ones
    while (notifications_.size() > MAX_VISIBLE_NOTIFICATIONS) {
        notifications_.pop();
    }
}

void Toaster::configError(const std::string& message) {
    std::cerr << "Toaster: config: " << message << std::endl;
    if (!enabled_) {
        return;
    }

    Notification notif{
        message,
        NotificationLevel::LevelError,
        std::chrono::steady_clock::now(),
        std::chrono::milliseconds(0),
        false,
        true,
        true
    };

    config_errors_.push(notif);
    has_config_errors_ = true;
}

void Toaster::clearConfigErrors() {
    while (!config_errors_.empty()) {
        config_errors_.pop();
    }
    has_config_errors_ = false;
}

void Toaster::update() {
    cleanupExpired();

    if (!connection_) {
        return;
    }

    if (has_config_errors_) {
        std::queue<Notification> temp_queue;
        while (!config_errors_.empty()) {
            auto& notif = config_errors_.front();
            if (!notif.sent_dbus) {
                sendDBusNotification(notif);
                notif.sent_dbus = true;
            }
            temp_queue.push(notif);
            config_errors_.pop();
        }
        config_errors_ = std::move(temp_queue);
    }

    std::queue<Notification> temp_queue;
    while (!notifications_.empty()) {
        auto& notif = notifications_.front();
        if (!notif.sent_dbus) {
            sendDBusNotification(notif);
            notif.sent_dbus = true;
        }
        temp_queue.push(notif);
        notifications_.pop();
    }
    notifications_ = std::move(temp_queue);
}

void Toaster::cleanupExpired() {
    auto now = std::chrono::steady_clock::now();

    std::queue<Notification> new_queue;
    while (!notifications_.empty()) {
        auto& notif = notifications_.front();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - notif.created_at);

        if (notif.persistent || elapsed < notif.duration) {
            new_queue.push(notif);
        }
        notifications_.pop();
    }
    notifications_ = std::move(new_queue);
}

bool Toaster::initializeDBus() {
    GError* error = nullptr;
    GDBusConnection* connection = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &error);

    if (!connection) {
        if (error) {
            std::cerr << "Toaster: " << error->message << std::endl;
            g_error_free(error);
        }
        return false;
    }

    connection_ = connection;
    return true;
}

void Toaster::sendDBusNotification(const Notification& notif) {
    auto* connection = static_cast<GDBusConnection*>(connection_);

    GVariantBuilder actions_builder;
    g_variant_builder_init(&actions_builder, G_VARIANT_TYPE("as"));
    GVariant* actions_variant = g_variant_builder_end(&actions_builder);

    GVariantBuilder hints_builder;
    g_variant_builder_init(&hints_builder, G_VARIANT_TYPE("a{sv}"));

    guchar urgency_byte = (notif.level == NotificationLevel::LevelError) ? 2 : 1;
    g_variant_builder_add(&hints_builder, "{sv}", "urgency",
                          g_variant_new_byte(urgency_byte));

    GVariant* hints_variant = g_variant_builder_end(&hints_builder);

    // Config errors stay until the user dismisses them
    gint32 expire = notif.persistent ? 0 : static_cast<gint32>(notif.duration.count());

    GVariant* parameters = g_variant_new(
        "(susss@as@a{sv}i)",
        "Splitdeck",
        static_cast<guint32>(0),
        iconForLevel(notif.level),
        notif.is_config_error ? "Splitdeck config" : "Splitdeck",
        notif.message.c_str(),
        actions_variant,
        hints_variant,
        expire
    );

    g_dbus_connection_call(
        connection,
        "org.freedesktop.Notifications",
        "/org/freedesktop/Notifications",
        "org.freedesktop.Notifications",
        "Notify",
        parameters,
        nullptr,
        G_DBUS_CALL_FLAGS_NONE,
        -1,
        nullptr,
        nullptr,
        nullptr
    );
}

}
