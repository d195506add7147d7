#pragma once

#include "splitdeck/layout/LayoutTypes.hpp"

#include <functional>

namespace sdeck {

enum class LayoutEventType {
    TreeChanged,
    TabCreated,
    TabDestroyed
};

inline const char* toString(LayoutEventType type) {
    switch (type) {
        case LayoutEventType::TreeChanged: return "TreeChanged";
        case LayoutEventType::TabCreated: return "TabCreated";
        case LayoutEventType::TabDestroyed: return "TabDestroyed";
    }
    return "Unknown";
}

struct LayoutEvent {
    LayoutEventType type;
    TabId tab;
};

// Listeners run after the operation committed, outside of any mutation
using LayoutListener = std::function<void(const LayoutEvent&)>;

}
