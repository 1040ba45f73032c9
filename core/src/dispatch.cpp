#include <scenex/dispatch.h>
#include <scenex/errors.h>
#include <functional>
#include <map>
#include <sstream>

namespace scenex {

namespace {

using Binding = std::function<void(Adaptor&, const FieldValue&)>;
using BindingTable = std::map<Field, Binding>;

template <typename T>
const T& valueAs(const FieldValue& value, Field field) {
    const T* typed = std::get_if<T>(&value);
    if (!typed) {
        throw BackendSyncError(std::string("value of unexpected type for field '") + fieldName(field) + "'");
    }
    return *typed;
}

template <typename AdaptorT>
AdaptorT& adaptorAs(Adaptor& adaptor) {
    auto* typed = dynamic_cast<AdaptorT*>(&adaptor);
    if (!typed) {
        throw BackendSyncError(std::string("adaptor for ") + modelKindName(adaptor.modelKind()) +
                               " does not implement the expected contract");
    }
    return *typed;
}

/// Binding calling `method` on contract `AdaptorT` with a value of type `T`
template <typename AdaptorT, typename T, typename Method>
Binding bindSetter(Field field, Method method) {
    return [field, method](Adaptor& adaptor, const FieldValue& value) {
        (adaptorAs<AdaptorT>(adaptor).*method)(valueAs<T>(value, field));
    };
}

/**
 * Runs several setters that together apply one field, each inside its own
 * boundary, then raises the worst outcome naming every part that did not apply.
 */
class PartialApply {
public:
    template <typename Fn>
    void run(const char* part, Fn&& fn) {
        try {
            fn();
        } catch (const UnsupportedCapabilityError& e) {
            m_unsupported.push_back(std::string(part) + ": " + e.what());
        } catch (const std::exception& e) {
            m_failed.push_back(std::string(part) + ": " + e.what());
        }
    }

    void finish() const {
        if (!m_failed.empty()) {
            throw BackendSyncError(join(m_failed));
        }
        if (!m_unsupported.empty()) {
            throw UnsupportedCapabilityError(join(m_unsupported));
        }
    }

private:
    static std::string join(const std::vector<std::string>& parts) {
        std::string out;
        for (const auto& p : parts) {
            if (!out.empty()) out += "; ";
            out += p;
        }
        return out;
    }

    std::vector<std::string> m_unsupported;
    std::vector<std::string> m_failed;
};

void addNodeBindings(BindingTable& t) {
    t[Field::Name] = bindSetter<NodeAdaptor, std::optional<std::string>>(Field::Name, &NodeAdaptor::setName);
    t[Field::Visible] = bindSetter<NodeAdaptor, bool>(Field::Visible, &NodeAdaptor::setVisible);
    t[Field::Interactive] = bindSetter<NodeAdaptor, bool>(Field::Interactive, &NodeAdaptor::setInteractive);
    t[Field::Opacity] = bindSetter<NodeAdaptor, float>(Field::Opacity, &NodeAdaptor::setOpacity);
    t[Field::Order] = bindSetter<NodeAdaptor, int>(Field::Order, &NodeAdaptor::setOrder);
    t[Field::Transform] = bindSetter<NodeAdaptor, Transform>(Field::Transform, &NodeAdaptor::setTransform);
    t[Field::Parent] = bindSetter<NodeAdaptor, NodePtr>(Field::Parent, &NodeAdaptor::setParent);
    t[Field::Children] = bindSetter<NodeAdaptor, NodeList>(Field::Children, &NodeAdaptor::setChildren);
}

BindingTable buildTable(ModelKind kind) {
    BindingTable t;
    switch (kind) {
        case ModelKind::Scene:
            addNodeBindings(t);
            break;

        case ModelKind::Camera:
            addNodeBindings(t);
            t[Field::CameraType] = bindSetter<CameraAdaptor, CameraType>(Field::CameraType, &CameraAdaptor::setType);
            t[Field::Zoom] = bindSetter<CameraAdaptor, float>(Field::Zoom, &CameraAdaptor::setZoom);
            t[Field::Center] = bindSetter<CameraAdaptor, glm::vec3>(Field::Center, &CameraAdaptor::setCenter);
            t[Field::Range] = bindSetter<CameraAdaptor, float>(Field::Range, &CameraAdaptor::setRange);
            break;

        case ModelKind::Image:
            addNodeBindings(t);
            t[Field::Data] = bindSetter<ImageAdaptor, ArrayPtr>(Field::Data, &ImageAdaptor::setData);
            t[Field::Cmap] = bindSetter<ImageAdaptor, Colormap>(Field::Cmap, &ImageAdaptor::setCmap);
            t[Field::Clims] = bindSetter<ImageAdaptor, std::optional<glm::vec2>>(Field::Clims, &ImageAdaptor::setClims);
            t[Field::Gamma] = bindSetter<ImageAdaptor, float>(Field::Gamma, &ImageAdaptor::setGamma);
            t[Field::Interpolation] = bindSetter<ImageAdaptor, InterpolationMode>(Field::Interpolation, &ImageAdaptor::setInterpolation);
            break;

        case ModelKind::Points:
            addNodeBindings(t);
            t[Field::Coords] = bindSetter<PointsAdaptor, PointList>(Field::Coords, &PointsAdaptor::setCoords);
            t[Field::PointSize] = bindSetter<PointsAdaptor, float>(Field::PointSize, &PointsAdaptor::setSize);
            t[Field::FaceColor] = bindSetter<PointsAdaptor, Color>(Field::FaceColor, &PointsAdaptor::setFaceColor);
            t[Field::EdgeColor] = bindSetter<PointsAdaptor, Color>(Field::EdgeColor, &PointsAdaptor::setEdgeColor);
            t[Field::EdgeWidth] = bindSetter<PointsAdaptor, float>(Field::EdgeWidth, &PointsAdaptor::setEdgeWidth);
            t[Field::Symbol] = bindSetter<PointsAdaptor, SymbolName>(Field::Symbol, &PointsAdaptor::setSymbol);
            t[Field::Scaling] = bindSetter<PointsAdaptor, ScalingMode>(Field::Scaling, &PointsAdaptor::setScaling);
            t[Field::Antialias] = bindSetter<PointsAdaptor, float>(Field::Antialias, &PointsAdaptor::setAntialias);
            break;

        case ModelKind::View:
            t[Field::Scene] = bindSetter<ViewAdaptor, ScenePtr>(Field::Scene, &ViewAdaptor::setScene);
            t[Field::Camera] = bindSetter<ViewAdaptor, CameraPtr>(Field::Camera, &ViewAdaptor::setCamera);
            t[Field::Layout] = [](Adaptor& adaptor, const FieldValue& value) {
                auto& view = adaptorAs<ViewAdaptor>(adaptor);
                const auto& layout = valueAs<Layout>(value, Field::Layout);
                PartialApply parts;
                parts.run("layout", [&] { view.setLayout(layout); });
                parts.run("position", [&] { view.setPosition(layout.position()); });
                parts.run("size", [&] { view.setSize(layout.size()); });
                parts.run("border_width", [&] { view.setBorderWidth(layout.borderWidth()); });
                parts.run("border_color", [&] { view.setBorderColor(layout.borderColor()); });
                parts.run("padding", [&] { view.setPadding(layout.padding()); });
                parts.run("margin", [&] { view.setMargin(layout.margin()); });
                parts.finish();
            };
            t[Field::Visible] = bindSetter<ViewAdaptor, bool>(Field::Visible, &ViewAdaptor::setVisible);
            t[Field::Blending] = bindSetter<ViewAdaptor, BlendMode>(Field::Blending, &ViewAdaptor::setBlending);
            t[Field::BackgroundColor] = bindSetter<ViewAdaptor, std::optional<Color>>(Field::BackgroundColor, &ViewAdaptor::setBackgroundColor);
            break;

        case ModelKind::Canvas:
            t[Field::Width] = bindSetter<CanvasAdaptor, int>(Field::Width, &CanvasAdaptor::setWidth);
            t[Field::Height] = bindSetter<CanvasAdaptor, int>(Field::Height, &CanvasAdaptor::setHeight);
            t[Field::Title] = bindSetter<CanvasAdaptor, std::string>(Field::Title, &CanvasAdaptor::setTitle);
            t[Field::BackgroundColor] = bindSetter<CanvasAdaptor, std::optional<Color>>(Field::BackgroundColor, &CanvasAdaptor::setBackgroundColor);
            t[Field::Visible] = bindSetter<CanvasAdaptor, bool>(Field::Visible, &CanvasAdaptor::setVisible);
            t[Field::Views] = bindSetter<CanvasAdaptor, ViewList>(Field::Views, &CanvasAdaptor::setViews);
            break;
    }
    return t;
}

const BindingTable& tableFor(ModelKind kind) {
    static const std::map<ModelKind, BindingTable> tables = [] {
        std::map<ModelKind, BindingTable> all;
        for (auto kind : {ModelKind::Scene, ModelKind::Camera, ModelKind::Image,
                          ModelKind::Points, ModelKind::View, ModelKind::Canvas}) {
            all[kind] = buildTable(kind);
        }
        return all;
    }();
    return tables.at(kind);
}

/// Run a batching call (block/unblock/force) and record it if it did not succeed
template <typename Fn>
void guarded(SyncReport& report, Field field, const char* step, Fn&& fn) {
    try {
        fn();
    } catch (const UnsupportedCapabilityError& e) {
        report.add({field, SetterStatus::Unsupported, std::string(step) + ": " + e.what()});
    } catch (const std::exception& e) {
        report.add({field, SetterStatus::Failed, std::string(step) + ": " + e.what()});
    }
}

} // namespace

const char* setterStatusName(SetterStatus status) {
    switch (status) {
        case SetterStatus::Applied:     return "applied";
        case SetterStatus::Unsupported: return "unsupported";
        case SetterStatus::Failed:      return "failed";
    }
    return "unknown";
}

// =============================================================================
// SyncReport
// =============================================================================

void SyncReport::merge(const SyncReport& other) {
    m_results.insert(m_results.end(), other.m_results.begin(), other.m_results.end());
}

size_t SyncReport::count(SetterStatus status) const {
    size_t n = 0;
    for (const auto& r : m_results) {
        if (r.status == status) ++n;
    }
    return n;
}

std::string SyncReport::summary() const {
    std::ostringstream ss;
    ss << modelKindName(m_kind) << " #" << m_model << ": "
       << count(SetterStatus::Applied) << " applied, "
       << count(SetterStatus::Unsupported) << " unsupported, "
       << count(SetterStatus::Failed) << " failed";

    bool first = true;
    for (const auto& r : m_results) {
        if (r.status == SetterStatus::Applied) continue;
        ss << (first ? " (" : "; ") << fieldName(r.field) << " " << setterStatusName(r.status);
        if (!r.reason.empty()) {
            ss << ": " << r.reason;
        }
        first = false;
    }
    if (!first) ss << ")";
    return ss.str();
}

void SyncReport::throwIfFailed() const {
    if (ok()) {
        return;
    }
    std::string message = "synchronization failed for " + std::string(modelKindName(m_kind)) +
                          " #" + std::to_string(m_model) + ":";
    for (const auto& r : m_results) {
        if (r.status == SetterStatus::Failed) {
            message += std::string(" ") + fieldName(r.field) + " (" + r.reason + ")";
        }
    }
    throw BackendSyncError(message);
}

// =============================================================================
// Dispatch
// =============================================================================

bool hasBinding(ModelKind kind, Field field) {
    return tableFor(kind).count(field) > 0;
}

SetterResult dispatch(Adaptor& adaptor, Field field, const FieldValue& value) {
    SetterResult result;
    result.field = field;

    const auto& table = tableFor(adaptor.modelKind());
    auto it = table.find(field);
    if (it == table.end()) {
        result.status = SetterStatus::Unsupported;
        result.reason = std::string("no setter for ") + modelKindName(adaptor.modelKind()) +
                        "." + fieldName(field);
        return result;
    }

    try {
        it->second(adaptor, value);
        result.status = SetterStatus::Applied;
    } catch (const UnsupportedCapabilityError& e) {
        result.status = SetterStatus::Unsupported;
        result.reason = e.what();
    } catch (const std::exception& e) {
        result.status = SetterStatus::Failed;
        result.reason = e.what();
    }
    return result;
}

SyncReport syncAdaptor(Adaptor& adaptor, const EventedModel& model) {
    SyncReport report(model.id(), model.kind());
    auto fields = model.fields();

    guarded(report, fields.front(), "blockUpdates", [&] { adaptor.blockUpdates(); });
    for (Field field : fields) {
        report.add(dispatch(adaptor, field, model.get(field)));
    }
    guarded(report, fields.back(), "unblockUpdates", [&] { adaptor.unblockUpdates(); });
    guarded(report, fields.back(), "forceUpdate", [&] { adaptor.forceUpdate(); });
    return report;
}

} // namespace scenex
