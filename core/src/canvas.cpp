#include <scenex/canvas.h>
#include <scenex/errors.h>
#include <algorithm>

namespace scenex {

void Canvas::setWidth(int width) {
    if (width <= 0) {
        throw ValidationError("canvas width must be positive, got " + std::to_string(width));
    }
    assign(m_width, width, Field::Width);
}

void Canvas::setHeight(int height) {
    if (height <= 0) {
        throw ValidationError("canvas height must be positive, got " + std::to_string(height));
    }
    assign(m_height, height, Field::Height);
}

void Canvas::setTitle(std::string title) {
    assign(m_title, std::move(title), Field::Title);
}

void Canvas::setBackgroundColor(const std::optional<Color>& color) {
    assign(m_backgroundColor, color, Field::BackgroundColor);
}

ViewList Canvas::views() const {
    ViewList result;
    result.reserve(m_views.size());
    for (const auto& slot : m_views) {
        if (auto view = slot.view.lock()) {
            result.push_back(std::move(view));
        }
    }
    return result;
}

std::vector<Canvas::ViewSlot>::iterator Canvas::findSlot(const ViewPtr& view) {
    return std::find_if(m_views.begin(), m_views.end(),
                        [&view](const ViewSlot& slot) { return slot.view.lock() == view; });
}

void Canvas::addView(const ViewPtr& view) {
    insertView(view, true);
}

void Canvas::insertView(const ViewPtr& view, bool owning) {
    if (!view) {
        throw ValidationError("cannot add a null view to a canvas");
    }
    if (findSlot(view) != m_views.end()) {
        return;
    }
    // Dropping the view from its previous canvas may release that canvas
    if (auto previous = view->m_canvas.lock()) {
        previous->removeView(view);
    }
    m_views.erase(std::remove_if(m_views.begin(), m_views.end(),
                                 [](const ViewSlot& slot) { return slot.view.expired(); }),
                  m_views.end());

    view->m_canvas = sharedCanvas();
    m_views.push_back({view, owning ? view : nullptr});
    publish(Field::Views, FieldValue(std::in_place_type<ViewList>, views()));
}

bool Canvas::removeView(const ViewPtr& view) {
    auto it = findSlot(view);
    if (it == m_views.end()) {
        return false;
    }
    // The view may hold the last reference to this canvas
    CanvasPtr self = sharedCanvas();
    ViewPtr removed = view;
    m_views.erase(it);
    if (removed->m_canvas.lock().get() == this) {
        removed->m_canvas.reset();
    }
    if (removed->m_ownedCanvas.get() == this) {
        removed->m_ownedCanvas.reset();
    }
    publish(Field::Views, FieldValue(std::in_place_type<ViewList>, views()));
    return true;
}

std::vector<Field> Canvas::fields() const {
    return {Field::Width, Field::Height, Field::Title, Field::BackgroundColor,
            Field::Visible, Field::Views};
}

FieldValue Canvas::get(Field field) const {
    switch (field) {
        case Field::Width:           return FieldValue(std::in_place_type<int>, m_width);
        case Field::Height:          return FieldValue(std::in_place_type<int>, m_height);
        case Field::Title:           return FieldValue(std::in_place_type<std::string>, m_title);
        case Field::BackgroundColor: return FieldValue(std::in_place_type<std::optional<Color>>, m_backgroundColor);
        case Field::Visible:         return FieldValue(std::in_place_type<bool>, m_visible);
        case Field::Views:           return FieldValue(std::in_place_type<ViewList>, views());
        default:
            throw ValidationError(std::string("Canvas has no field '") + fieldName(field) + "'");
    }
}

} // namespace scenex
