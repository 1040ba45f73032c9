#include <scenex/node.h>
#include <scenex/errors.h>
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace scenex {

namespace {

std::string describe(const Node& node) {
    std::ostringstream ss;
    ss << node.kindName();
    if (node.name()) {
        ss << " '" << *node.name() << "'";
    }
    ss << " #" << node.id();
    return ss.str();
}

} // namespace

Node::Node(ModelKey key)
    : EventedModel(key) {}

Node::~Node() {
    // Children that outlive us become roots
    for (auto& child : m_children) {
        if (child->m_parent == this) {
            child->m_parent = nullptr;
        }
    }
}

void Node::setName(std::optional<std::string> name) {
    assign(m_name, std::move(name), Field::Name);
}

void Node::setVisible(bool visible) {
    assign(m_visible, visible, Field::Visible);
}

void Node::setInteractive(bool interactive) {
    assign(m_interactive, interactive, Field::Interactive);
}

void Node::setOpacity(float opacity) {
    if (!std::isfinite(opacity) || opacity < 0.0f || opacity > 1.0f) {
        throw ValidationError("opacity must be in [0, 1], got " + std::to_string(opacity));
    }
    assign(m_opacity, opacity, Field::Opacity);
}

void Node::setOrder(int order) {
    if (order < 0) {
        throw ValidationError("order must be non-negative, got " + std::to_string(order));
    }
    assign(m_order, order, Field::Order);
}

void Node::setTransform(const Transform& transform) {
    assign(m_transform, transform, Field::Transform);
}

// =============================================================================
// Structure
// =============================================================================

NodePtr Node::parentPtr() const {
    return m_parent ? m_parent->sharedNode() : nullptr;
}

void Node::setParent(const NodePtr& parent) {
    Node* target = parent.get();
    if (target == m_parent) {
        return;
    }
    if (target == this || (target && isAncestorOf(*target))) {
        throw StructuralError("cannot parent " + describe(*this) + " to " + describe(*target) +
                              ": it would become its own ancestor");
    }

    // The old parent may hold the last strong reference
    NodePtr self = sharedNode();

    Node* old = m_parent;
    if (old) {
        old->detachChild(this);
    }
    m_parent = target;
    publish(Field::Parent, FieldValue(std::in_place_type<NodePtr>, parent));
    if (target) {
        target->attachChild(self);
    }
}

void Node::attachChild(const NodePtr& child) {
    m_children.push_back(child);
    publish(Field::Children, FieldValue(std::in_place_type<NodeList>, m_children));
}

void Node::detachChild(const Node* child) {
    auto it = std::find_if(m_children.begin(), m_children.end(),
                           [child](const NodePtr& c) { return c.get() == child; });
    if (it == m_children.end()) {
        return;
    }
    m_children.erase(it);
    publish(Field::Children, FieldValue(std::in_place_type<NodeList>, m_children));
}

void Node::addChild(const NodePtr& child) {
    if (!child) {
        throw ValidationError("cannot add a null child to " + describe(*this));
    }
    if (child->m_parent == this) {
        return;
    }
    child->setParent(sharedNode());
}

void Node::removeChild(const NodePtr& child) {
    if (!child || child->m_parent != this) {
        throw StructuralError((child ? describe(*child) : std::string("null node")) +
                              " is not a child of " + describe(*this));
    }
    child->setParent(nullptr);
}

bool Node::contains(const Node& node) const {
    return node.m_parent == this;
}

bool Node::isAncestorOf(const Node& node) const {
    for (const Node* p = node.m_parent; p; p = p->m_parent) {
        if (p == this) {
            return true;
        }
    }
    return false;
}

std::vector<const Node*> Node::ancestors() const {
    std::vector<const Node*> result;
    for (const Node* n = this; n; n = n->m_parent) {
        result.push_back(n);
    }
    return result;
}

const Node& Node::root() const {
    const Node* n = this;
    while (n->m_parent) {
        n = n->m_parent;
    }
    return *n;
}

Node& Node::root() {
    Node* n = this;
    while (n->m_parent) {
        n = n->m_parent;
    }
    return *n;
}

// =============================================================================
// Frames
// =============================================================================

NodePath Node::pathTo(const Node& other) const {
    auto mine = ancestors();
    auto theirs = other.ancestors();

    for (size_t i = 0; i < mine.size(); ++i) {
        auto it = std::find(theirs.begin(), theirs.end(), mine[i]);
        if (it == theirs.end()) {
            continue;
        }
        NodePath path;
        path.up.assign(mine.begin(), mine.begin() + static_cast<std::ptrdiff_t>(i) + 1);
        path.down.assign(theirs.begin(), it);
        std::reverse(path.down.begin(), path.down.end());
        return path;
    }
    throw StructuralError("no common ancestor between " + describe(*this) +
                          " and " + describe(other));
}

Transform Node::transformTo(const Node& other) const {
    NodePath path = pathTo(other);

    // Application order: ascend through each frame below the common
    // ancestor, then descend through the inverse of each frame
    std::vector<Transform> steps;
    for (size_t i = 0; i + 1 < path.up.size(); ++i) {
        steps.push_back(path.up[i]->transform());
    }
    for (const Node* n : path.down) {
        steps.push_back(n->transform().inverse());
    }
    std::reverse(steps.begin(), steps.end());
    return Transform::chain(steps);
}

// =============================================================================
// Fields
// =============================================================================

std::vector<Field> Node::fields() const {
    return {Field::Name, Field::Visible, Field::Interactive, Field::Opacity,
            Field::Order, Field::Transform, Field::Parent, Field::Children};
}

FieldValue Node::get(Field field) const {
    switch (field) {
        case Field::Name:        return FieldValue(std::in_place_type<std::optional<std::string>>, m_name);
        case Field::Visible:     return FieldValue(std::in_place_type<bool>, m_visible);
        case Field::Interactive: return FieldValue(std::in_place_type<bool>, m_interactive);
        case Field::Opacity:     return FieldValue(std::in_place_type<float>, m_opacity);
        case Field::Order:       return FieldValue(std::in_place_type<int>, m_order);
        case Field::Transform:   return FieldValue(std::in_place_type<Transform>, m_transform);
        case Field::Parent:      return FieldValue(std::in_place_type<NodePtr>, parentPtr());
        case Field::Children:    return FieldValue(std::in_place_type<NodeList>, m_children);
        default:
            throw ValidationError(std::string(kindName()) + " has no field '" + fieldName(field) + "'");
    }
}

// =============================================================================
// Invariants
// =============================================================================

std::vector<std::string> checkTreeInvariants(const Node& root) {
    std::vector<std::string> problems;
    std::set<const Node*> visited;

    std::vector<const Node*> stack{&root};
    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();

        if (!visited.insert(node).second) {
            problems.push_back("cycle: " + describe(*node) + " reached twice");
            continue;
        }
        if (!(node->opacity() >= 0.0f && node->opacity() <= 1.0f)) {
            problems.push_back(describe(*node) + ": opacity out of range");
        }
        if (node->order() < 0) {
            problems.push_back(describe(*node) + ": negative order");
        }

        std::set<const Node*> seen;
        for (const auto& child : node->children()) {
            if (!seen.insert(child.get()).second) {
                problems.push_back(describe(*node) + ": duplicated child " + describe(*child));
                continue;
            }
            if (child->parent() != node) {
                problems.push_back(describe(*child) + ": parent link does not point to " + describe(*node));
            }
            stack.push_back(child.get());
        }
    }
    return problems;
}

} // namespace scenex
