#pragma once

/**
 * @file evented_model.h
 * @brief Observable base class for every model object
 *
 * An EventedModel validates each field assignment, stores the new value and
 * publishes a ModelEvent to its subscribers in registration order. Assigning
 * a value equal to the current one publishes nothing.
 *
 * Model objects are always heap allocated and shared. They are created with
 * scenex::make<T>(), which is the only code able to produce the ModelKey
 * their constructors require:
 *
 * @code
 * auto scene = scenex::make<scenex::Scene>();
 * auto image = scenex::make<scenex::Image>();
 * scene->addChild(image);
 * @endcode
 */

#include <scenex/field.h>
#include <scenex/types.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace scenex {

/// Process-unique identity of a model object, never reused
using ModelId = uint64_t;

class EventedModel;
using ModelPtr = std::shared_ptr<EventedModel>;

template <typename T, typename... Args>
std::shared_ptr<T> make(Args&&... args);

/**
 * @brief Construction passkey for model objects
 *
 * Only scenex::make<T>() can create one, so constructors that take a
 * ModelKey cannot be called directly.
 */
class ModelKey {
    ModelKey() {}

    template <typename T, typename... Args>
    friend std::shared_ptr<T> make(Args&&... args);
};

class EventedModel : public std::enable_shared_from_this<EventedModel> {
public:
    using Callback = std::function<void(const ModelEvent&)>;
    using Connection = uint64_t;

    virtual ~EventedModel() = default;

    EventedModel(const EventedModel&) = delete;
    EventedModel& operator=(const EventedModel&) = delete;

    ModelId id() const { return m_id; }

    /// Concrete kind of this object
    virtual ModelKind kind() const = 0;

    /// "Scene", "Camera", ...
    const char* kindName() const { return modelKindName(kind()); }

    /// Synchronizable fields, in the order backends receive them
    virtual std::vector<Field> fields() const = 0;

    /**
     * @brief Current value of a field
     * @throw ValidationError if the field does not belong to this kind
     */
    virtual FieldValue get(Field field) const = 0;

    bool hasField(Field field) const;

    /// @name Subscriptions
    /// @{

    /**
     * @brief Register a callback for change notifications
     * @return Handle used to disconnect the callback
     */
    Connection connect(Callback callback);

    /**
     * @brief Remove a callback
     *
     * Safe to call from inside a callback. A removed callback is not called
     * again, even by a notification that is currently being delivered.
     *
     * @return false if the connection was unknown or already removed
     */
    bool disconnect(Connection connection);

    size_t subscriberCount() const;

    /// @}

    /**
     * @brief Scoped batch of field assignments
     *
     * Assignments inside a batch publish their events as usual. When the
     * outermost guard is destroyed and at least one field changed, a single
     * BatchFlushed event follows.
     */
    class BatchGuard {
    public:
        explicit BatchGuard(EventedModel& model);
        ~BatchGuard();

        BatchGuard(BatchGuard&& other) noexcept;
        BatchGuard(const BatchGuard&) = delete;
        BatchGuard& operator=(const BatchGuard&) = delete;
        BatchGuard& operator=(BatchGuard&&) = delete;

    private:
        EventedModel* m_model;
    };

    BatchGuard batch() { return BatchGuard(*this); }
    bool inBatch() const { return m_batchDepth > 0; }

protected:
    explicit EventedModel(ModelKey key);

    /// Post-construction hook, runs once shared_from_this() is available
    virtual void initialize() {}

    /**
     * @brief Store a new value and notify subscribers
     * @return false when the value was equal and nothing was published
     */
    template <typename T>
    bool assign(T& member, T value, Field field) {
        if (member == value) {
            return false;
        }
        member = std::move(value);
        publish(field, FieldValue(std::in_place_type<T>, member));
        return true;
    }

    /// Publish a FieldChanged event for `field`
    void publish(Field field, FieldValue value);

private:
    template <typename T, typename... Args>
    friend std::shared_ptr<T> make(Args&&... args);

    struct Slot {
        Connection id;
        Callback callback;
        bool connected = true;
    };

    void deliver(const ModelEvent& event);
    void endBatch();

    ModelId m_id;
    std::vector<std::shared_ptr<Slot>> m_slots;
    Connection m_nextConnection = 1;
    int m_batchDepth = 0;
    bool m_batchDirty = false;
};

/**
 * @brief Create a model object
 *
 * Abstract types (Node) are rejected at compile time.
 */
template <typename T, typename... Args>
std::shared_ptr<T> make(Args&&... args) {
    static_assert(std::is_base_of<EventedModel, T>::value,
                  "scenex::make<T>: T must derive from EventedModel");
    static_assert(!std::is_abstract<T>::value,
                  "scenex::make<T>: abstract model types cannot be instantiated");
    auto object = std::make_shared<T>(ModelKey{}, std::forward<Args>(args)...);
    static_cast<EventedModel&>(*object).initialize();
    return object;
}

/// Downcast a model pointer, nullptr when the kind does not match
template <typename T>
std::shared_ptr<T> modelCast(const ModelPtr& model) {
    if (!model || model->kind() != T::Kind) {
        return nullptr;
    }
    return std::static_pointer_cast<T>(model);
}

} // namespace scenex
