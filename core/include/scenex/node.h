#pragma once

/**
 * @file node.h
 * @brief Scene-graph node base class
 *
 * Nodes form a tree. A parent owns its children; the parent link is a
 * non-owning back pointer. setParent() is the single structural mutation,
 * addChild() and removeChild() are conveniences over it, and the children
 * list is read-only from outside.
 */

#include <scenex/evented_model.h>
#include <optional>
#include <string>
#include <vector>

namespace scenex {

/**
 * @brief Result of Node::pathTo()
 *
 * `up` runs from the start node to the lowest common ancestor (inclusive),
 * `down` from just below that ancestor to the target node.
 */
struct NodePath {
    std::vector<const Node*> up;
    std::vector<const Node*> down;
};

class Node : public EventedModel {
public:
    ~Node() override;

    /// @name Attributes
    /// @{

    const std::optional<std::string>& name() const { return m_name; }
    void setName(std::optional<std::string> name);

    bool visible() const { return m_visible; }
    void setVisible(bool visible);

    bool interactive() const { return m_interactive; }
    void setInteractive(bool interactive);

    float opacity() const { return m_opacity; }

    /// @throw ValidationError outside [0, 1]
    void setOpacity(float opacity);

    int order() const { return m_order; }

    /// @throw ValidationError if negative
    void setOrder(int order);

    /// Local-to-parent transform
    const Transform& transform() const { return m_transform; }
    void setTransform(const Transform& transform);

    /// @}

    /// @name Structure
    /// @{

    Node* parent() const { return m_parent; }
    NodePtr parentPtr() const;

    /**
     * @brief Move this node under `parent`, or detach it when null
     *
     * The old parent publishes `children`, then this node publishes
     * `parent`, then the new parent publishes `children`.
     *
     * @throw StructuralError if `parent` is this node or one of its descendants
     */
    void setParent(const NodePtr& parent);

    const NodeList& children() const { return m_children; }

    /// Append `child` unless it is already a child of this node
    void addChild(const NodePtr& child);

    /// @throw StructuralError if `child` is not a child of this node
    void removeChild(const NodePtr& child);

    /// True if `node` is a direct child
    bool contains(const Node& node) const;

    /// True if this node is a strict ancestor of `node`
    bool isAncestorOf(const Node& node) const;

    /// This node followed by each ancestor up to the root
    std::vector<const Node*> ancestors() const;

    const Node& root() const;
    Node& root();

    /// @}

    /// @name Frames
    /// @{

    /// @throw StructuralError if the nodes share no common ancestor
    NodePath pathTo(const Node& other) const;

    /**
     * @brief Transform mapping this node's frame into `other`'s frame
     * @throw StructuralError if the nodes share no common ancestor
     * @throw SingularTransformError if a transform on the descent cannot be inverted
     */
    Transform transformTo(const Node& other) const;

    /// @}

    NodePtr sharedNode() { return std::static_pointer_cast<Node>(shared_from_this()); }

    std::vector<Field> fields() const override;
    FieldValue get(Field field) const override;

protected:
    explicit Node(ModelKey key);

private:
    void attachChild(const NodePtr& child);
    void detachChild(const Node* child);

    std::optional<std::string> m_name;
    bool m_visible = true;
    bool m_interactive = false;
    float m_opacity = 1.0f;
    int m_order = 0;
    Transform m_transform;

    Node* m_parent = nullptr;
    NodeList m_children;
};

/// Downcast to a concrete node type, nullptr when the kind does not match
template <typename T>
std::shared_ptr<T> nodeCast(const NodePtr& node) {
    if (!node || node->kind() != T::Kind) {
        return nullptr;
    }
    return std::static_pointer_cast<T>(node);
}

/**
 * @brief Check the tree rooted at `root`
 *
 * Reports parent/child back-link mismatches, duplicated children, cycles,
 * and out-of-range opacity or order. An empty result means the tree is valid.
 */
std::vector<std::string> checkTreeInvariants(const Node& root);

} // namespace scenex
