#include <scenex/field.h>

namespace scenex {

const char* fieldName(Field field) {
    switch (field) {
        case Field::Name:            return "name";
        case Field::Visible:         return "visible";
        case Field::Interactive:     return "interactive";
        case Field::Opacity:         return "opacity";
        case Field::Order:           return "order";
        case Field::Transform:       return "transform";
        case Field::Parent:          return "parent";
        case Field::Children:        return "children";
        case Field::CameraType:      return "type";
        case Field::Zoom:            return "zoom";
        case Field::Center:          return "center";
        case Field::Range:           return "range";
        case Field::Data:            return "data";
        case Field::Cmap:            return "cmap";
        case Field::Clims:           return "clims";
        case Field::Gamma:           return "gamma";
        case Field::Interpolation:   return "interpolation";
        case Field::Coords:          return "coords";
        case Field::PointSize:       return "size";
        case Field::FaceColor:       return "face_color";
        case Field::EdgeColor:       return "edge_color";
        case Field::EdgeWidth:       return "edge_width";
        case Field::Symbol:          return "symbol";
        case Field::Scaling:         return "scaling";
        case Field::Antialias:       return "antialias";
        case Field::Scene:           return "scene";
        case Field::Camera:          return "camera";
        case Field::Layout:          return "layout";
        case Field::Blending:        return "blending";
        case Field::BackgroundColor: return "background_color";
        case Field::Width:           return "width";
        case Field::Height:          return "height";
        case Field::Title:           return "title";
        case Field::Views:           return "views";
    }
    return "unknown";
}

} // namespace scenex
