#pragma once

/**
 * @file tree_repr.h
 * @brief Text and JSON outlines of a tree
 *
 * Works on any tree whose nodes expose `children()` as a range of
 * pointer-like handles: model nodes and backend native objects alike, so
 * the two trees can be compared directly.
 *
 * @code
 * Scene
 *     ├── Image
 *     ├── Points
 *     └── Camera
 * @endcode
 */

#include <scenex/node.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace scenex {

namespace detail {

template <typename T, typename NameFn>
void appendTree(std::ostringstream& out, const T& node, NameFn& name, const std::string& prefix) {
    const auto& children = node.children();
    size_t i = 0;
    for (const auto& child : children) {
        bool last = ++i == children.size();
        out << '\n' << prefix << (last ? "└── " : "├── ") << name(*child);
        appendTree(out, *child, name, prefix + (last ? "    " : "│   "));
    }
}

} // namespace detail

/// Box-drawing outline of the tree rooted at `root`, one node per line
template <typename T, typename NameFn>
std::string treeRepr(const T& root, NameFn name) {
    std::ostringstream out;
    out << name(root);
    detail::appendTree(out, root, name, "    ");
    return out.str();
}

/// Outline of a model tree labelled by kind
inline std::string treeRepr(const Node& root) {
    return treeRepr(root, [](const Node& n) { return std::string(n.kindName()); });
}

/// Nested {"name": ..., "children": [...]} descriptor of the tree
template <typename T, typename NameFn>
nlohmann::json treeDict(const T& root, NameFn name) {
    nlohmann::json children = nlohmann::json::array();
    for (const auto& child : root.children()) {
        children.push_back(treeDict(*child, name));
    }
    return nlohmann::json{{"name", name(root)}, {"children", std::move(children)}};
}

inline nlohmann::json treeDict(const Node& root) {
    return treeDict(root, [](const Node& n) { return std::string(n.kindName()); });
}

} // namespace scenex
