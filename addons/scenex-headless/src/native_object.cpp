#include <scenex/headless/native_object.h>
#include <algorithm>

namespace scenex::headless {

Bounds Bounds::transformed(const glm::mat4& matrix) const {
    Bounds out;
    bool first = true;
    for (int i = 0; i < 8; ++i) {
        glm::vec3 corner((i & 1) ? max.x : min.x,
                         (i & 2) ? max.y : min.y,
                         (i & 4) ? max.z : min.z);
        glm::vec3 p = glm::vec3(matrix * glm::vec4(corner, 1.0f));
        if (first) {
            out.min = out.max = p;
            first = false;
        } else {
            out.min = glm::min(out.min, p);
            out.max = glm::max(out.max, p);
        }
    }
    return out;
}

NativeObject::NativeObject(std::string type)
    : m_type(std::move(type)) {}

NativeObject::~NativeObject() {
    detach();
    for (NativeObject* child : m_children) {
        child->m_parent = nullptr;
    }
}

// =============================================================================
// Hierarchy
// =============================================================================

void NativeObject::add(NativeObject& child) {
    if (child.m_parent == this) {
        return;
    }
    child.detach();
    child.m_parent = this;
    m_children.push_back(&child);
}

void NativeObject::remove(NativeObject& child) {
    auto it = std::find(m_children.begin(), m_children.end(), &child);
    if (it == m_children.end()) {
        return;
    }
    m_children.erase(it);
    child.m_parent = nullptr;
}

void NativeObject::detach() {
    if (m_parent) {
        m_parent->remove(*this);
    }
}

void NativeObject::reorder(const std::vector<NativeObject*>& order) {
    std::vector<NativeObject*> result;
    for (NativeObject* n : order) {
        if (n->m_parent == this && std::find(result.begin(), result.end(), n) == result.end()) {
            result.push_back(n);
        }
    }
    for (NativeObject* n : m_children) {
        if (std::find(result.begin(), result.end(), n) == result.end()) {
            result.push_back(n);
        }
    }
    m_children = std::move(result);
}

size_t NativeObject::countChildren(const std::string& type) const {
    return static_cast<size_t>(std::count_if(m_children.begin(), m_children.end(),
                                             [&](const NativeObject* c) { return c->m_type == type; }));
}

// =============================================================================
// Properties
// =============================================================================

nlohmann::json NativeObject::prop(const std::string& key) const {
    auto it = m_props.find(key);
    return it == m_props.end() ? nlohmann::json() : *it;
}

void NativeObject::setProp(const std::string& key, nlohmann::json value) {
    if (blocked()) {
        m_staged[key] = std::move(value);
        return;
    }
    nlohmann::json changes = nlohmann::json::object();
    changes[key] = std::move(value);
    commit(std::move(changes), std::nullopt);
}

void NativeObject::setMatrix(const glm::mat4& matrix) {
    if (blocked()) {
        m_stagedMatrix = matrix;
        return;
    }
    commit(nlohmann::json::object(), matrix);
}

void NativeObject::unblock() {
    if (m_blockDepth == 0 || --m_blockDepth > 0) {
        return;
    }
    if (m_staged.empty() && !m_stagedMatrix) {
        return;
    }
    nlohmann::json staged = std::move(m_staged);
    m_staged = nlohmann::json::object();
    auto matrix = m_stagedMatrix;
    m_stagedMatrix.reset();
    commit(std::move(staged), matrix);
}

void NativeObject::commit(nlohmann::json changes, std::optional<glm::mat4> matrix) {
    for (auto it = changes.begin(); it != changes.end(); ++it) {
        m_props[it.key()] = it.value();
    }
    if (matrix) {
        m_matrix = *matrix;
    }
    ++m_commitCount;
}

// =============================================================================
// Geometry
// =============================================================================

glm::mat4 NativeObject::worldMatrix() const {
    glm::mat4 world = m_matrix;
    for (const NativeObject* p = m_parent; p; p = p->m_parent) {
        world = p->m_matrix * world;
    }
    return world;
}

std::optional<Bounds> NativeObject::worldBounds() const {
    std::optional<Bounds> result;
    if (m_localBounds) {
        result = m_localBounds->transformed(worldMatrix());
    }
    for (const NativeObject* child : m_children) {
        if (auto childBounds = child->worldBounds()) {
            result = result ? result->merged(*childBounds) : *childBounds;
        }
    }
    return result;
}

} // namespace scenex::headless
