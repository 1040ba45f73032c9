#pragma once

/**
 * @file points.h
 * @brief Point cloud / marker node
 */

#include <scenex/node.h>

namespace scenex {

class Points : public Node {
public:
    static constexpr ModelKind Kind = ModelKind::Points;

    explicit Points(ModelKey key) : Node(key) {}

    ModelKind kind() const override { return Kind; }

    const PointList& coords() const { return m_coords; }
    void setCoords(PointList coords);

    /// Marker size, in units given by scaling()
    float size() const { return m_size; }
    void setSize(float size);

    const Color& faceColor() const { return m_faceColor; }
    void setFaceColor(const Color& color);

    const Color& edgeColor() const { return m_edgeColor; }
    void setEdgeColor(const Color& color);

    float edgeWidth() const { return m_edgeWidth; }
    void setEdgeWidth(float width);

    SymbolName symbol() const { return m_symbol; }
    void setSymbol(SymbolName symbol);

    ScalingMode scaling() const { return m_scaling; }
    void setScaling(ScalingMode mode);

    float antialias() const { return m_antialias; }
    void setAntialias(float antialias);

    std::vector<Field> fields() const override;
    FieldValue get(Field field) const override;

private:
    PointList m_coords;
    float m_size = 10.0f;
    Color m_faceColor = Color::White;
    Color m_edgeColor = Color::Black;
    float m_edgeWidth = 1.0f;
    SymbolName m_symbol = SymbolName::Disc;
    ScalingMode m_scaling = ScalingMode::Fixed;
    float m_antialias = 1.0f;
};

} // namespace scenex
