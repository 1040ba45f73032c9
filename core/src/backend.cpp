#include <scenex/backend.h>
#include <scenex/errors.h>

namespace scenex {

std::vector<ModelKind> Backend::supportedKinds() const {
    std::vector<ModelKind> kinds;
    for (const auto& [kind, factory] : m_factories) {
        kinds.push_back(kind);
    }
    return kinds;
}

std::unique_ptr<Adaptor> Backend::createAdaptor(EventedModel& model, AdaptorRegistry& registry) const {
    auto it = m_factories.find(model.kind());
    if (it == m_factories.end()) {
        throw UnsupportedCapabilityError("backend '" + m_name + "' has no adaptor for " +
                                         model.kindName() + " objects");
    }
    return it->second(model, registry);
}

} // namespace scenex
