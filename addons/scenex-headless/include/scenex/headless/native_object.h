#pragma once

/**
 * @file native_object.h
 * @brief In-memory stand-in for a renderer's scene object
 *
 * NativeObjects form their own tree, independent of the model tree, the
 * way a real renderer's objects would. Property writes are recorded as JSON
 * so tests can inspect exactly what the backend was told.
 */

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scenex::headless {

/// Axis-aligned bounding box
struct Bounds {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};

    glm::vec3 extent() const { return max - min; }

    /// Smallest box containing both
    Bounds merged(const Bounds& other) const {
        return {glm::min(min, other.min), glm::max(max, other.max)};
    }

    /// Box containing the eight transformed corners
    Bounds transformed(const glm::mat4& matrix) const;
};

class NativeObject {
public:
    explicit NativeObject(std::string type);

    /// Detaches from the parent and leaves any children parentless
    ~NativeObject();

    NativeObject(const NativeObject&) = delete;
    NativeObject& operator=(const NativeObject&) = delete;

    /// "Scene", "Camera", "Image", "Points", "View" or "Canvas"
    const std::string& type() const { return m_type; }

    /// @name Hierarchy
    /// @{

    NativeObject* parent() const { return m_parent; }
    const std::vector<NativeObject*>& children() const { return m_children; }

    /// Append `child`, detaching it from any previous parent first
    void add(NativeObject& child);
    void remove(NativeObject& child);
    void detach();

    /// Put `order` first, in that order; other children keep their relative order after it
    void reorder(const std::vector<NativeObject*>& order);

    size_t countChildren(const std::string& type) const;

    /// @}

    /// @name Properties
    /// While blocked, writes are staged and committed together on unblock().
    /// @{

    const nlohmann::json& props() const { return m_props; }

    /// Committed value, null when never set
    nlohmann::json prop(const std::string& key) const;
    bool hasProp(const std::string& key) const { return m_props.contains(key); }

    void setProp(const std::string& key, nlohmann::json value);

    void block() { ++m_blockDepth; }
    void unblock();
    bool blocked() const { return m_blockDepth > 0; }

    /// Number of times property changes were committed
    size_t commitCount() const { return m_commitCount; }

    /// @}

    /// @name Geometry
    /// @{

    const glm::mat4& matrix() const { return m_matrix; }
    void setMatrix(const glm::mat4& matrix);

    /// Local-to-world matrix through the native parent chain
    glm::mat4 worldMatrix() const;

    const std::optional<Bounds>& localBounds() const { return m_localBounds; }
    void setLocalBounds(const std::optional<Bounds>& bounds) { m_localBounds = bounds; }

    /// World-space box of this object and all its descendants
    std::optional<Bounds> worldBounds() const;

    /// @}

    void markForceUpdate() { ++m_forceUpdateCount; }
    size_t forceUpdateCount() const { return m_forceUpdateCount; }

private:
    void commit(nlohmann::json changes, std::optional<glm::mat4> matrix);

    std::string m_type;
    NativeObject* m_parent = nullptr;
    std::vector<NativeObject*> m_children;

    nlohmann::json m_props = nlohmann::json::object();
    nlohmann::json m_staged = nlohmann::json::object();
    std::optional<glm::mat4> m_stagedMatrix;
    int m_blockDepth = 0;
    size_t m_commitCount = 0;

    glm::mat4 m_matrix{1.0f};
    std::optional<Bounds> m_localBounds;
    size_t m_forceUpdateCount = 0;
};

} // namespace scenex::headless
