#include "edge.hpp"

namespace Folio {
namespace Graph {

const char* to_string(EdgeType type) {
    switch (type) {
        case EdgeType::Forward:
            return "FORWARD";
        case EdgeType::Back:
            return "BACK";
        case EdgeType::Cross:
            return "CROSS";
    }
    return "CROSS";
}

std::optional<EdgeType> edge_type_from_string(const std::string& name) {
    if (name == "FORWARD")
        return EdgeType::Forward;
    if (name == "BACK")
        return EdgeType::Back;
    if (name == "CROSS")
        return EdgeType::Cross;
    return std::nullopt;
}

}  // namespace Graph
}  // namespace Folio
