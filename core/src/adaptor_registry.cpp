#include <scenex/adaptor_registry.h>
#include <scenex/canvas.h>
#include <scenex/node.h>
#include <scenex/view.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace scenex {

namespace {

bool envFlag(const char* name) {
    const char* value = std::getenv(name);
    return value && (std::string(value) == "1" || std::string(value) == "true");
}

std::string label(const EventedModel& model) {
    return std::string(model.kindName()) + " #" + std::to_string(model.id());
}

} // namespace

RegistryOptions RegistryOptions::fromEnvironment() {
    RegistryOptions options;
    if (envFlag("SCENEX_DEBUG_SYNC")) {
        options.debug = true;
    }
    if (envFlag("SCENEX_QUIET")) {
        options.logUnsupported = false;
        options.logFailures = false;
    }
    return options;
}

AdaptorRegistry::AdaptorRegistry(std::shared_ptr<const Backend> backend, RegistryOptions options)
    : m_backend(std::move(backend))
    , m_options(options) {
    if (!m_backend) {
        throw ValidationError("AdaptorRegistry requires a backend");
    }
    if (m_options.debug) {
        std::cout << "[AdaptorRegistry Debug] Using backend '" << m_backend->name() << "'" << std::endl;
    }
}

AdaptorRegistry::~AdaptorRegistry() {
    for (auto& [id, entry] : m_entries) {
        entry.model->disconnect(entry.connection);
    }
    // Adaptors may reach their parents' natives while tearing down
    while (!m_order.empty()) {
        ModelId id = m_order.back();
        m_order.pop_back();
        m_entries.erase(id);
    }
}

// =============================================================================
// Lookup
// =============================================================================

Adaptor& AdaptorRegistry::getAdaptor(const ModelPtr& model, bool create) {
    if (!model) {
        throw ValidationError("cannot get an adaptor for a null model");
    }
    auto it = m_entries.find(model->id());
    if (it != m_entries.end()) {
        return *it->second.adaptor;
    }
    if (!create) {
        throw AdaptorNotFoundError("no adaptor for " + label(*model) + " and create=false");
    }

    Entry entry;
    entry.model = model;
    entry.adaptor = m_backend->createAdaptor(*model, *this);

    // Stored before the initial sync so re-entrant lookups find it
    auto inserted = m_entries.emplace(model->id(), std::move(entry)).first;
    m_order.push_back(model->id());
    if (m_options.debug) {
        std::cout << "[AdaptorRegistry Debug] Created adaptor for " << label(*model) << std::endl;
    }

    Adaptor& adaptor = *inserted->second.adaptor;
    initialize(inserted->second);
    return adaptor;
}

Adaptor* AdaptorRegistry::findAdaptor(ModelId id) const {
    auto it = m_entries.find(id);
    return it == m_entries.end() ? nullptr : it->second.adaptor.get();
}

std::vector<Adaptor*> AdaptorRegistry::all() const {
    std::vector<Adaptor*> result;
    result.reserve(m_order.size());
    for (ModelId id : m_order) {
        result.push_back(m_entries.at(id).adaptor.get());
    }
    return result;
}

// =============================================================================
// Initialization and events
// =============================================================================

void AdaptorRegistry::initialize(Entry& entry) {
    ModelPtr model = entry.model;

    SyncReport report = syncAdaptor(*entry.adaptor, *model);
    m_lastReport = report;
    publishReport(report);

    ModelId id = model->id();
    entry.connection = model->connect([this, id](const ModelEvent& event) {
        handleEvent(id, event);
    });

    materialize(*model);
}

void AdaptorRegistry::materialize(const EventedModel& model) {
    switch (model.kind()) {
        case ModelKind::Canvas:
            for (const auto& view : static_cast<const Canvas&>(model).views()) {
                ensureAdaptor(view);
            }
            break;
        case ModelKind::View:
            ensureAdaptor(static_cast<const View&>(model).scene());
            break;
        default:
            for (const auto& child : static_cast<const Node&>(model).children()) {
                ensureAdaptor(child);
            }
            break;
    }
}

void AdaptorRegistry::materializeField(const ModelEvent& event) {
    switch (event.field) {
        case Field::Children:
            if (auto* children = std::get_if<NodeList>(&event.value)) {
                for (const auto& child : *children) ensureAdaptor(child);
            }
            break;
        case Field::Views:
            if (auto* views = std::get_if<ViewList>(&event.value)) {
                for (const auto& view : *views) ensureAdaptor(view);
            }
            break;
        case Field::Scene:
            if (auto* scene = std::get_if<ScenePtr>(&event.value)) {
                ensureAdaptor(*scene);
            }
            break;
        default:
            break;
    }
}

void AdaptorRegistry::ensureAdaptor(const ModelPtr& model) {
    if (!model || contains(*model)) {
        return;
    }
    try {
        getAdaptor(model);
    } catch (const UnsupportedCapabilityError& e) {
        if (m_options.logUnsupported) {
            std::cerr << "[AdaptorRegistry Warning] " << label(*model) << " not materialized: "
                      << e.what() << std::endl;
        }
    } catch (const std::exception& e) {
        if (m_options.logFailures) {
            std::cerr << "[AdaptorRegistry Warning] Failed to create adaptor for " << label(*model)
                      << ": " << e.what() << std::endl;
        }
    }
}

void AdaptorRegistry::handleEvent(ModelId id, const ModelEvent& event) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return;
    }
    ModelPtr model = it->second.model;
    Adaptor& adaptor = *it->second.adaptor;

    SyncReport report(id, model->kind());
    if (event.type == ModelEvent::Type::BatchFlushed) {
        SetterResult result;
        result.field = model->fields().back();
        try {
            adaptor.forceUpdate();
        } catch (const std::exception& e) {
            result.status = SetterStatus::Failed;
            result.reason = std::string("forceUpdate: ") + e.what();
        }
        if (m_options.debug) {
            std::cout << "[AdaptorRegistry Debug] " << label(*model) << " batch flushed" << std::endl;
        }
        if (result.status != SetterStatus::Applied) {
            report.add(result);
            publishReport(report);
        }
        return;
    }

    // Dependents first, so the adaptor can resolve their natives
    materializeField(event);

    SetterResult result = dispatch(adaptor, event.field, event.value);
    if (m_options.debug) {
        std::cout << "[AdaptorRegistry Debug] " << label(*model) << "." << event.name()
                  << " -> " << setterStatusName(result.status) << std::endl;
    }
    if (result.status != SetterStatus::Applied) {
        report.add(result);
        publishReport(report);
    }
}

void AdaptorRegistry::publishReport(const SyncReport& report) {
    bool unsupported = report.count(SetterStatus::Unsupported) > 0;
    bool failed = report.count(SetterStatus::Failed) > 0;
    if ((unsupported && m_options.logUnsupported) || (failed && m_options.logFailures)) {
        std::cerr << "[AdaptorRegistry Warning] " << report.summary() << std::endl;
    } else if (m_options.debug) {
        std::cout << "[AdaptorRegistry Debug] " << report.summary() << std::endl;
    }
    if (m_reportHandler) {
        m_reportHandler(report);
    }
}

// =============================================================================
// Eviction
// =============================================================================

void AdaptorRegistry::destroyEntry(ModelId id) {
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return;
    }
    it->second.model->disconnect(it->second.connection);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), id), m_order.end());

    // Destroy the adaptor before the model reference it relies on
    Entry entry = std::move(it->second);
    m_entries.erase(it);
    entry.adaptor.reset();
}

bool AdaptorRegistry::evict(const EventedModel& model) {
    if (!contains(model)) {
        return false;
    }
    if (m_options.debug) {
        std::cout << "[AdaptorRegistry Debug] Evicting " << label(model) << std::endl;
    }
    destroyEntry(model.id());
    return true;
}

size_t AdaptorRegistry::evictSubtree(const Node& node) {
    size_t count = 0;
    for (const auto& child : node.children()) {
        count += evictSubtree(*child);
    }
    if (evict(node)) {
        ++count;
    }
    return count;
}

size_t AdaptorRegistry::collectGarbage() {
    size_t total = 0;
    bool changed = true;
    while (changed) {
        changed = false;
        // Newest first so dependents go before what they depend on
        std::vector<ModelId> order(m_order.rbegin(), m_order.rend());
        for (ModelId id : order) {
            auto it = m_entries.find(id);
            if (it == m_entries.end() || it->second.model.use_count() != 1) {
                continue;
            }
            destroyEntry(id);
            ++total;
            changed = true;
        }
    }
    if (m_options.debug && total > 0) {
        std::cout << "[AdaptorRegistry Debug] Collected " << total << " adaptor(s)" << std::endl;
    }
    return total;
}

// =============================================================================
// Canvas helpers
// =============================================================================

Array AdaptorRegistry::render(const CanvasPtr& canvas) {
    return getAdaptorAs<CanvasAdaptor>(canvas).render();
}

Array AdaptorRegistry::render(const ViewPtr& view) {
    return render(view->canvas());
}

void AdaptorRegistry::close(const CanvasPtr& canvas) {
    getAdaptorAs<CanvasAdaptor>(canvas).close();
}

} // namespace scenex
