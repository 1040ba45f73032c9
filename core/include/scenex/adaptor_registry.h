#pragma once

/**
 * @file adaptor_registry.h
 * @brief Cache of model-to-adaptor bindings and the event pump between them
 *
 * The registry owns one adaptor per model object, keyed by ModelId. Asking
 * for an adaptor that does not exist yet creates it, pushes every field of
 * the model into it, subscribes it to the model's change events, and then
 * materializes its structural dependents (canvas views, view scene, node
 * children) so the whole backend subtree exists when getAdaptor() returns.
 *
 * Nothing is ever evicted implicitly. Call evict(), evictSubtree() or
 * collectGarbage() to release adaptors of models that are no longer used.
 */

#include <scenex/backend.h>
#include <scenex/dispatch.h>
#include <scenex/errors.h>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace scenex {

/**
 * @brief Runtime switches for the synchronization engine
 */
struct RegistryOptions {
    bool debug = false;          ///< Trace every dispatched event to stdout
    bool logUnsupported = true;  ///< Warn when a backend cannot honor a value
    bool logFailures = true;     ///< Warn when a backend setter throws

    /**
     * @brief Defaults adjusted by the environment
     *
     * SCENEX_DEBUG_SYNC=1|true enables debug; SCENEX_QUIET=1|true disables
     * both warning categories.
     */
    static RegistryOptions fromEnvironment();
};

class AdaptorRegistry {
public:
    using ReportHandler = std::function<void(const SyncReport&)>;

    explicit AdaptorRegistry(std::shared_ptr<const Backend> backend,
                             RegistryOptions options = RegistryOptions::fromEnvironment());

    /// Disconnects from every model and destroys adaptors newest first
    ~AdaptorRegistry();

    AdaptorRegistry(const AdaptorRegistry&) = delete;
    AdaptorRegistry& operator=(const AdaptorRegistry&) = delete;

    const Backend& backend() const { return *m_backend; }
    const RegistryOptions& options() const { return m_options; }
    void setOptions(const RegistryOptions& options) { m_options = options; }

    /// @name Lookup
    /// @{

    /**
     * @brief Adaptor for `model`, created on first request
     * @throw AdaptorNotFoundError if `create` is false and none exists
     * @throw UnsupportedCapabilityError if the backend has no adaptor for the model's kind
     */
    Adaptor& getAdaptor(const ModelPtr& model, bool create = true);

    /// getAdaptor() cast to a contract type
    template <typename AdaptorT>
    AdaptorT& getAdaptorAs(const ModelPtr& model, bool create = true) {
        auto* typed = dynamic_cast<AdaptorT*>(&getAdaptor(model, create));
        if (!typed) {
            throw UnsupportedCapabilityError(std::string("adaptor for ") + model->kindName() +
                                             " does not implement the requested contract");
        }
        return *typed;
    }

    /// Existing adaptor, nullptr when the model has none
    Adaptor* findAdaptor(ModelId id) const;

    bool contains(ModelId id) const { return m_entries.count(id) > 0; }
    bool contains(const EventedModel& model) const { return contains(model.id()); }

    size_t size() const { return m_entries.size(); }

    /// Every adaptor, in creation order
    std::vector<Adaptor*> all() const;

    /// Native handle of the model's adaptor (created if needed)
    std::any native(const ModelPtr& model) { return getAdaptor(model).native(); }

    /// @}

    /// @name Eviction
    /// @{

    /// Disconnect and destroy the adaptor of `model`; false if it had none
    bool evict(const EventedModel& model);

    /// Evict `node` and every descendant, deepest first
    size_t evictSubtree(const Node& node);

    /**
     * @brief Evict adaptors whose model is referenced only by this registry
     *
     * Repeats until nothing more can be released, since releasing a model
     * can release its children or its scene.
     *
     * @return Number of adaptors evicted
     */
    size_t collectGarbage();

    /// @}

    /// @name Reporting
    /// @{

    /// Called with the report of every initial sync and every non-applied event
    void setReportHandler(ReportHandler handler) { m_reportHandler = std::move(handler); }

    /// Report of the most recent initial synchronization
    const SyncReport& lastReport() const { return m_lastReport; }

    /// @}

    /// @name Canvas helpers
    /// @{

    Array render(const CanvasPtr& canvas);

    /// Render the canvas of `view`, creating one when the view has none
    Array render(const ViewPtr& view);

    void close(const CanvasPtr& canvas);

    /// @}

private:
    struct Entry {
        ModelPtr model;
        std::unique_ptr<Adaptor> adaptor;
        EventedModel::Connection connection = 0;
    };

    void initialize(Entry& entry);
    void handleEvent(ModelId id, const ModelEvent& event);
    void materialize(const EventedModel& model);
    void materializeField(const ModelEvent& event);
    void ensureAdaptor(const ModelPtr& model);
    void publishReport(const SyncReport& report);
    void destroyEntry(ModelId id);

    std::shared_ptr<const Backend> m_backend;
    RegistryOptions m_options;
    std::unordered_map<ModelId, Entry> m_entries;
    std::vector<ModelId> m_order;
    ReportHandler m_reportHandler;
    SyncReport m_lastReport;
};

} // namespace scenex
