#pragma once

/**
 * @file dispatch.h
 * @brief Routing of field values onto adaptor setters
 *
 * Each model kind has a static table mapping Field to a typed call on the
 * adaptor contract. Dispatching never throws: every call runs inside an
 * error boundary and its outcome is returned as a SetterResult.
 */

#include <scenex/adaptor.h>
#include <string>
#include <vector>

namespace scenex {

enum class SetterStatus : uint8_t {
    Applied,      ///< The backend accepted the value
    Unsupported,  ///< The backend cannot express the value or has no setter for the field
    Failed        ///< The setter threw
};

const char* setterStatusName(SetterStatus status);

struct SetterResult {
    Field field = Field::Name;
    SetterStatus status = SetterStatus::Applied;
    std::string reason;
};

/**
 * @brief Outcome of one synchronization batch
 */
class SyncReport {
public:
    SyncReport() = default;
    SyncReport(ModelId model, ModelKind kind) : m_model(model), m_kind(kind) {}

    ModelId model() const { return m_model; }
    ModelKind kind() const { return m_kind; }

    void add(SetterResult result) { m_results.push_back(std::move(result)); }

    /// Append every result of `other`
    void merge(const SyncReport& other);

    const std::vector<SetterResult>& results() const { return m_results; }
    size_t count(SetterStatus status) const;

    /// No setter failed (unsupported values are tolerated)
    bool ok() const { return count(SetterStatus::Failed) == 0; }

    /// Every setter applied its value
    bool clean() const { return count(SetterStatus::Applied) == m_results.size(); }

    /// "Image #4: 9 applied, 1 unsupported (gamma: ...), 0 failed"
    std::string summary() const;

    /// @throw BackendSyncError listing every failed field
    void throwIfFailed() const;

private:
    ModelId m_model = 0;
    ModelKind m_kind = ModelKind::Scene;
    std::vector<SetterResult> m_results;
};

/// True if `kind` has a binding for `field`
bool hasBinding(ModelKind kind, Field field);

/**
 * @brief Apply one field value to an adaptor
 *
 * UnsupportedCapabilityError becomes SetterStatus::Unsupported, any other
 * exception SetterStatus::Failed with its message as the reason.
 */
SetterResult dispatch(Adaptor& adaptor, Field field, const FieldValue& value);

/**
 * @brief Push every field of `model` into `adaptor`
 *
 * Runs blockUpdates(), one dispatch per field in model order,
 * unblockUpdates(), then forceUpdate(). Failures in the batching calls are
 * recorded in the report as well.
 */
SyncReport syncAdaptor(Adaptor& adaptor, const EventedModel& model);

} // namespace scenex
