#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace sdeck {

using NodeId = std::uint64_t;
using PanelId = NodeId;
using TabId = std::uint64_t;
using SessionId = std::uint64_t;
using ColorId = int;

constexpr NodeId NoNode = 0;
constexpr PanelId NoPanel = 0;
constexpr TabId NoTab = 0;
constexpr SessionId NoSession = 0;
constexpr ColorId NoColor = -1;

namespace layout_constants {

    constexpr double DEFAULT_RATIO = 0.5;

    constexpr double DEFAULT_MIN_RATIO = 0.1;

    constexpr std::size_t DEFAULT_PALETTE_SIZE = 6;
}

/**
 * @brief Split direction for containers
 *
 * Vertical divides width (children side by side), Horizontal divides
 * height (children stacked).
 */
enum class SplitType {
    Horizontal,
    Vertical
};

inline const char* toString(SplitType type) {
    return type == SplitType::Vertical ? "vertical" : "horizontal";
}

/**
 * @brief Opaque reference to a live connection
 *
 * The layout code moves handles between panels but never looks inside the
 * session they refer to. The label is what tab titles show.
 */
struct SessionHandle {
    SessionId id{NoSession};
    std::string label;

    bool valid() const { return id != NoSession; }
};

/**
 * @brief Saved-connection description carried by a sidebar drag
 */
struct ConnectionSpec {
    std::string name;
    std::string protocol{"ssh"};
    std::string host;
    int port{0};

    std::string displayName() const {
        if (!name.empty()) return name;
        return port > 0 ? host + ":" + std::to_string(port) : host;
    }
};

enum class LayoutError {
    None,
    InvalidPath,
    UnknownPanel,
    UnknownTab,
    InvalidTarget,
    SessionInstantiationFailed,
    EvictionFailed
};

inline const char* toString(LayoutError error) {
    switch (error) {
        case LayoutError::None: return "None";
        case LayoutError::InvalidPath: return "InvalidPath";
        case LayoutError::UnknownPanel: return "UnknownPanel";
        case LayoutError::UnknownTab: return "UnknownTab";
        case LayoutError::InvalidTarget: return "InvalidTarget";
        case LayoutError::SessionInstantiationFailed: return "SessionInstantiationFailed";
        case LayoutError::EvictionFailed: return "EvictionFailed";
    }
    return "Unknown";
}

/**
 * @brief Outcome of a layout operation
 *
 * Either holds a value, or an error code with a human readable message.
 * A failed operation leaves every tree exactly as it was.
 */
template <typename T>
struct Result {
    LayoutError error{LayoutError::None};
    std::string message;
    std::optional<T> value;

    static Result ok(T v = T{}) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result fail(LayoutError e, std::string msg) {
        Result r;
        r.error = e;
        r.message = std::move(msg);
        return r;
    }

    template <typename U>
    static Result from(const Result<U>& other) {
        return fail(other.error, other.message);
    }

    bool isOk() const { return error == LayoutError::None; }
    explicit operator bool() const { return isOk(); }

    const T& operator*() const { return *value; }
    const T* operator->() const { return &*value; }
};

using Status = Result<std::monostate>;

[[noreturn]] inline void invariantFailure(const char* condition, const std::string& message,
                                          const char* file, int line) {
    std::cerr << "FATAL: invariant violated: " << message
              << " (" << condition << ") at " << file << ":" << line << std::endl;
    std::abort();
}

}

#define SDECK_INVARIANT(cond, msg) \
    do { \
        if (!(cond)) { \
            ::sdeck::invariantFailure(#cond, (msg), __FILE__, __LINE__); \
        } \
    } while (0)
