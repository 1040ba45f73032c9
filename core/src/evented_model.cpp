#include <scenex/evented_model.h>
#include <algorithm>
#include <atomic>

namespace scenex {

namespace {
std::atomic<ModelId> s_nextId{1};
}

EventedModel::EventedModel(ModelKey)
    : m_id(s_nextId.fetch_add(1)) {}

bool EventedModel::hasField(Field field) const {
    auto list = fields();
    return std::find(list.begin(), list.end(), field) != list.end();
}

EventedModel::Connection EventedModel::connect(Callback callback) {
    auto slot = std::make_shared<Slot>();
    slot->id = m_nextConnection++;
    slot->callback = std::move(callback);
    m_slots.push_back(slot);
    return slot->id;
}

bool EventedModel::disconnect(Connection connection) {
    auto it = std::find_if(m_slots.begin(), m_slots.end(),
                           [connection](const std::shared_ptr<Slot>& s) { return s->id == connection; });
    if (it == m_slots.end()) {
        return false;
    }
    (*it)->connected = false;
    m_slots.erase(it);
    return true;
}

size_t EventedModel::subscriberCount() const {
    return m_slots.size();
}

void EventedModel::publish(Field field, FieldValue value) {
    if (m_batchDepth > 0) {
        m_batchDirty = true;
    }
    ModelEvent event;
    event.type = ModelEvent::Type::FieldChanged;
    event.field = field;
    event.value = std::move(value);
    deliver(event);
}

void EventedModel::deliver(const ModelEvent& event) {
    // Snapshot so callbacks may connect or disconnect while we iterate
    auto slots = m_slots;
    for (const auto& slot : slots) {
        if (slot->connected) {
            slot->callback(event);
        }
    }
}

void EventedModel::endBatch() {
    if (--m_batchDepth > 0 || !m_batchDirty) {
        return;
    }
    m_batchDirty = false;
    ModelEvent event;
    event.type = ModelEvent::Type::BatchFlushed;
    deliver(event);
}

// =============================================================================
// BatchGuard
// =============================================================================

EventedModel::BatchGuard::BatchGuard(EventedModel& model)
    : m_model(&model) {
    ++m_model->m_batchDepth;
}

EventedModel::BatchGuard::BatchGuard(BatchGuard&& other) noexcept
    : m_model(other.m_model) {
    other.m_model = nullptr;
}

EventedModel::BatchGuard::~BatchGuard() {
    if (m_model) {
        m_model->endBatch();
    }
}

} // namespace scenex
