#include "splitdeck/layout/TreeSnapshot.hpp"
#include "splitdeck/layout/ColorPool.hpp"

#include <iomanip>
#include <sstream>

namespace sdeck {

std::string escapeJSON(const std::string& in) {
    std::ostringstream out;
    for (char c : in) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

namespace {

    void describeNode(const NodeSnapshot& node, int indent, std::ostringstream& out) {
        out << std::string(indent * 2, ' ');

        if (node.isPanel()) {
            out << "panel " << node.id;
            if (node.session) {
                out << " [" << node.session->id << " " << node.session->label << "]";
            } else {
                out << " (empty)";
            }
            if (node.focused) out << " *";
            out << "\n";
            return;
        }

        out << toString(node.split_type) << " split " << node.id
            << " color " << node.color;
        std::string hex = ColorPool::hex(node.color);
        if (!hex.empty()) out << " " << hex;
        out << " weights";
        for (double w : node.weights) {
            out << " " << std::fixed << std::setprecision(2) << w;
        }
        out << "\n";

        for (const auto& child : node.children) {
            describeNode(child, indent + 1, out);
        }
    }

    void nodeJSON(const NodeSnapshot& node, std::ostringstream& out) {
        if (node.isPanel()) {
            out << R"({"type": "panel", "id": )" << node.id
                << R"(, "focused": )" << (node.focused ? "true" : "false");
            if (node.session) {
                out << R"(, "state": "occupied", "session": {"id": )" << node.session->id
                    << R"(, "label": ")" << escapeJSON(node.session->label) << R"("}})";
            } else {
                out << R"(, "state": "empty"})";
            }
            return;
        }

        out << R"({"type": "split", "id": )" << node.id
            << R"(, "orientation": ")" << toString(node.split_type)
            << R"(", "color": )" << node.color
            << R"(, "weights": [)";
        for (std::size_t i = 0; i < node.weights.size(); ++i) {
            if (i > 0) out << ", ";
            out << node.weights[i];
        }
        out << R"(], "children": [)";
        for (std::size_t i = 0; i < node.children.size(); ++i) {
            if (i > 0) out << ", ";
            nodeJSON(node.children[i], out);
        }
        out << "]}";
    }
}

std::string describe(const TreeSnapshot& snapshot) {
    std::ostringstream out;
    out << "tab " << snapshot.tab << " \"" << snapshot.label << "\"";
    if (!snapshot.group.empty()) {
        out << " group " << snapshot.group << " (color " << snapshot.group_color << ")";
    }
    out << " panels " << snapshot.panel_count << "\n";

    if (snapshot.root) {
        describeNode(*snapshot.root, 1, out);
    }
    return out.str();
}

std::string toJSON(const TreeSnapshot& snapshot) {
    std::ostringstream out;
    out << R"({"tab": )" << snapshot.tab
        << R"(, "label": ")" << escapeJSON(snapshot.label)
        << R"(", "group": ")" << escapeJSON(snapshot.group)
        << R"(", "group_color": )" << snapshot.group_color
        << R"(, "focused": )" << snapshot.focused
        << R"(, "panel_count": )" << snapshot.panel_count
        << R"(, "root": )";
    if (snapshot.root) {
        nodeJSON(*snapshot.root, out);
    } else {
        out << "null";
    }
    out << "}";
    return out.str();
}

}
