#pragma once

/**
 * @file scene.h
 * @brief Root container of a renderable subtree
 */

#include <scenex/node.h>

namespace scenex {

class Scene : public Node {
public:
    static constexpr ModelKind Kind = ModelKind::Scene;

    explicit Scene(ModelKey key) : Node(key) {}

    ModelKind kind() const override { return Kind; }
};

} // namespace scenex
