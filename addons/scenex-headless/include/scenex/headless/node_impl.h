#pragma once

/**
 * @file node_impl.h
 * @brief Node capabilities shared by every headless node adaptor
 */

#include <scenex/headless/native_object.h>
#include <scenex/adaptor_registry.h>
#include <scenex/errors.h>
#include <scenex/node.h>
#include <algorithm>
#include <memory>

namespace scenex::headless {

/// Native object behind an adaptor of this backend
/// @throw std::bad_any_cast if the adaptor belongs to another backend
inline NativeObject& nativeOf(const Adaptor& adaptor) {
    return *std::any_cast<NativeObject*>(adaptor.native());
}

/**
 * @brief Implements NodeAdaptor on top of one NativeObject
 *
 * @tparam Contract NodeAdaptor or one of its refinements
 */
template <typename Contract>
class NodeImpl : public Contract {
public:
    NodeImpl(const Node& model, AdaptorRegistry& registry, const char* type)
        : Contract(model, registry)
        , m_native(std::make_unique<NativeObject>(type)) {}

    std::any native() const override { return m_native.get(); }
    NativeObject& object() const { return *m_native; }

    void setVisible(bool visible) override { m_native->setProp("visible", visible); }

    void setName(const std::optional<std::string>& name) override {
        m_native->setProp("name", name ? nlohmann::json(*name) : nlohmann::json());
    }

    void setParent(const NodePtr& parent) override {
        if (!parent) {
            m_native->detach();
            return;
        }
        // A parent without an adaptor attaches us when it syncs its children
        if (Adaptor* adaptor = this->registry().findAdaptor(parent->id())) {
            nativeOf(*adaptor).add(*m_native);
        }
    }

    void setChildren(const NodeList& children) override {
        std::vector<NativeObject*> order;
        for (const auto& child : children) {
            NativeObject& native = nativeOf(this->registry().getAdaptor(child));
            m_native->add(native);
            order.push_back(&native);
        }
        auto current = m_native->children();
        for (NativeObject* existing : current) {
            if (std::find(order.begin(), order.end(), existing) == order.end()) {
                m_native->remove(*existing);
            }
        }
        m_native->reorder(order);
    }

    void setInteractive(bool interactive) override {
        if (interactive) {
            throw UnsupportedCapabilityError("picking is not available in the headless backend");
        }
        m_native->setProp("interactive", false);
    }

    void setOpacity(float opacity) override { m_native->setProp("opacity", opacity); }
    void setOrder(int order) override { m_native->setProp("order", order); }
    void setTransform(const Transform& transform) override { m_native->setMatrix(transform.matrix()); }

    void addNode(const NodePtr& node) override {
        m_native->add(nativeOf(this->registry().getAdaptor(node)));
    }

    void blockUpdates() override { m_native->block(); }
    void unblockUpdates() override { m_native->unblock(); }
    void forceUpdate() override { m_native->markForceUpdate(); }

private:
    std::unique_ptr<NativeObject> m_native;
};

} // namespace scenex::headless
