#pragma once

/**
 * @file backend.h
 * @brief Table of adaptor factories making up one rendering backend
 *
 * A backend registers exactly one adaptor class per model kind it supports:
 *
 * @code
 * auto backend = std::make_shared<scenex::Backend>("headless");
 * backend->registerAdaptor<scenex::Image, ImageAdaptor>();
 * @endcode
 *
 * Registration is checked at compile time: the adaptor must derive from the
 * contract for the model type and implement all of it.
 */

#include <scenex/adaptor.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace scenex {

class Backend {
public:
    using Factory = std::function<std::unique_ptr<Adaptor>(EventedModel&, AdaptorRegistry&)>;

    explicit Backend(std::string name) : m_name(std::move(name)) {}

    const std::string& name() const { return m_name; }

    /// Register `AdaptorT` as the adaptor class for models of type `ModelT`
    template <typename ModelT, typename AdaptorT>
    void registerAdaptor() {
        using Contract = typename AdaptorContract<ModelT>::type;
        static_assert(std::is_base_of<Contract, AdaptorT>::value,
                      "adaptor does not implement the capability contract for this model type");
        static_assert(!std::is_abstract<AdaptorT>::value,
                      "adaptor leaves part of its capability contract unimplemented");
        static_assert(std::is_constructible<AdaptorT, ModelT&, AdaptorRegistry&>::value,
                      "adaptor must be constructible from (ModelT&, AdaptorRegistry&)");

        m_factories[ModelT::Kind] = [](EventedModel& model, AdaptorRegistry& registry) -> std::unique_ptr<Adaptor> {
            return std::make_unique<AdaptorT>(static_cast<ModelT&>(model), registry);
        };
    }

    bool supports(ModelKind kind) const { return m_factories.count(kind) > 0; }

    std::vector<ModelKind> supportedKinds() const;

    /**
     * @brief Construct the adaptor registered for the model's kind
     * @throw UnsupportedCapabilityError if no adaptor is registered for it
     */
    std::unique_ptr<Adaptor> createAdaptor(EventedModel& model, AdaptorRegistry& registry) const;

private:
    std::string m_name;
    std::map<ModelKind, Factory> m_factories;
};

} // namespace scenex
