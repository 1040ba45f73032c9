#pragma once

/**
 * @file canvas.h
 * @brief Top-level drawing surface holding an ordered list of views
 *
 * A canvas owns the views added to it, except the view that created it
 * through View::canvas(): that view owns the canvas instead and the canvas
 * only observes it.
 */

#include <scenex/view.h>

namespace scenex {

class Canvas : public EventedModel {
public:
    static constexpr ModelKind Kind = ModelKind::Canvas;

    explicit Canvas(ModelKey key) : EventedModel(key) {}

    ModelKind kind() const override { return Kind; }

    int width() const { return m_width; }
    /// @throw ValidationError unless positive
    void setWidth(int width);

    int height() const { return m_height; }
    /// @throw ValidationError unless positive
    void setHeight(int height);

    const std::string& title() const { return m_title; }
    void setTitle(std::string title);

    const std::optional<Color>& backgroundColor() const { return m_backgroundColor; }
    void setBackgroundColor(const std::optional<Color>& color);

    bool visible() const { return m_visible; }
    void show() { assign(m_visible, true, Field::Visible); }
    void hide() { assign(m_visible, false, Field::Visible); }

    /// @name Views
    /// @{

    /// Registered views that are still alive, in registration order
    ViewList views() const;

    /**
     * @brief Register a view
     *
     * Adding a view that is already registered does nothing. A view that
     * belongs to another canvas is removed from it first.
     */
    void addView(const ViewPtr& view);

    /// @return false if the view was not registered here
    bool removeView(const ViewPtr& view);

    /// @}

    CanvasPtr sharedCanvas() { return std::static_pointer_cast<Canvas>(shared_from_this()); }

    std::vector<Field> fields() const override;
    FieldValue get(Field field) const override;

private:
    friend class View;

    struct ViewSlot {
        std::weak_ptr<View> view;
        ViewPtr owned;  ///< null for the view that owns this canvas
    };

    void insertView(const ViewPtr& view, bool owning);
    std::vector<ViewSlot>::iterator findSlot(const ViewPtr& view);

    int m_width = 500;
    int m_height = 500;
    std::string m_title = "SceneX";
    std::optional<Color> m_backgroundColor;
    bool m_visible = false;
    std::vector<ViewSlot> m_views;
};

} // namespace scenex
