#include <scenex/points.h>
#include <scenex/errors.h>
#include <cmath>

namespace scenex {

namespace {

float nonNegative(float value, const char* what) {
    if (!std::isfinite(value) || value < 0.0f) {
        throw ValidationError(std::string(what) + " must be non-negative, got " + std::to_string(value));
    }
    return value;
}

} // namespace

void Points::setCoords(PointList coords) {
    for (const auto& p : coords) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z)) {
            throw ValidationError("point coordinates must be finite");
        }
    }
    assign(m_coords, std::move(coords), Field::Coords);
}

void Points::setSize(float size) {
    assign(m_size, nonNegative(size, "point size"), Field::PointSize);
}

void Points::setFaceColor(const Color& color) {
    assign(m_faceColor, color, Field::FaceColor);
}

void Points::setEdgeColor(const Color& color) {
    assign(m_edgeColor, color, Field::EdgeColor);
}

void Points::setEdgeWidth(float width) {
    assign(m_edgeWidth, nonNegative(width, "edge width"), Field::EdgeWidth);
}

void Points::setSymbol(SymbolName symbol) {
    assign(m_symbol, symbol, Field::Symbol);
}

void Points::setScaling(ScalingMode mode) {
    assign(m_scaling, mode, Field::Scaling);
}

void Points::setAntialias(float antialias) {
    assign(m_antialias, nonNegative(antialias, "antialias"), Field::Antialias);
}

std::vector<Field> Points::fields() const {
    auto list = Node::fields();
    list.insert(list.end(), {Field::Coords, Field::PointSize, Field::FaceColor, Field::EdgeColor,
                             Field::EdgeWidth, Field::Symbol, Field::Scaling, Field::Antialias});
    return list;
}

FieldValue Points::get(Field field) const {
    switch (field) {
        case Field::Coords:    return FieldValue(std::in_place_type<PointList>, m_coords);
        case Field::PointSize: return FieldValue(std::in_place_type<float>, m_size);
        case Field::FaceColor: return FieldValue(std::in_place_type<Color>, m_faceColor);
        case Field::EdgeColor: return FieldValue(std::in_place_type<Color>, m_edgeColor);
        case Field::EdgeWidth: return FieldValue(std::in_place_type<float>, m_edgeWidth);
        case Field::Symbol:    return FieldValue(std::in_place_type<SymbolName>, m_symbol);
        case Field::Scaling:   return FieldValue(std::in_place_type<ScalingMode>, m_scaling);
        case Field::Antialias: return FieldValue(std::in_place_type<float>, m_antialias);
        default:               return Node::get(field);
    }
}

} // namespace scenex
