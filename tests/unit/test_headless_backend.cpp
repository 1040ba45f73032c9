/**
 * @file test_headless_backend.cpp
 * @brief Unit tests for the headless reference backend
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <scenex/headless/adaptors.h>
#include <scenex/headless/backend.h>

using namespace scenex;
using namespace scenex::headless;
using Catch::Matchers::WithinAbs;

namespace {

RegistryOptions quiet() {
    RegistryOptions options;
    options.logUnsupported = false;
    options.logFailures = false;
    return options;
}

} // namespace

TEST_CASE("Native objects", "[unit][headless]") {
    NativeObject root("Scene");
    NativeObject a("Image");
    NativeObject b("Points");

    SECTION("add moves between parents") {
        NativeObject other("Scene");
        root.add(a);
        other.add(a);
        REQUIRE(root.children().empty());
        REQUIRE(a.parent() == &other);
        REQUIRE(other.countChildren("Image") == 1);
    }

    SECTION("reorder puts the given objects first") {
        root.add(a);
        root.add(b);
        root.reorder({&b});
        REQUIRE(root.children()[0] == &b);
        REQUIRE(root.children()[1] == &a);
    }

    SECTION("blocked writes commit together") {
        root.block();
        root.setProp("opacity", 0.5);
        root.setProp("visible", false);
        REQUIRE_FALSE(root.hasProp("opacity"));
        root.unblock();
        REQUIRE(root.commitCount() == 1);
        REQUIRE(root.prop("opacity") == 0.5);
        REQUIRE(root.prop("visible") == false);
    }

    SECTION("world bounds follow the parent chain") {
        root.add(a);
        root.setMatrix(glm::mat4(2.0f));
        a.setLocalBounds(Bounds{glm::vec3(0.0f), glm::vec3(1.0f, 1.0f, 0.0f)});
        auto bounds = root.worldBounds();
        REQUIRE(bounds);
        REQUIRE_THAT(bounds->max.x, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("destroying a child detaches it") {
        {
            NativeObject temp("Points");
            root.add(temp);
            REQUIRE(root.children().size() == 1);
        }
        REQUIRE(root.children().empty());
    }
}

TEST_CASE("Headless backend covers every kind", "[unit][headless]") {
    auto backend = createBackend();
    REQUIRE(backend->name() == "headless");
    REQUIRE(backend->supportedKinds().size() == 6);
}

TEST_CASE("Headless node adaptors", "[unit][headless]") {
    AdaptorRegistry registry(createBackend(), quiet());

    SECTION("points record their state") {
        auto points = make<Points>();
        points->setCoords({glm::vec3(0.0f), glm::vec3(4.0f, 2.0f, 0.0f)});
        auto& native = nativeOf(registry.getAdaptor(points));

        REQUIRE(native.type() == "Points");
        REQUIRE(native.prop("count") == 2);
        REQUIRE(native.prop("face_color") == "#FFFFFFFF");
        REQUIRE(native.localBounds()->max.x == 4.0f);

        points->setFaceColor(Color::Red);
        REQUIRE(native.prop("face_color") == "#FF0000FF");
    }

    SECTION("initial sync commits once") {
        auto points = make<Points>();
        auto& native = nativeOf(registry.getAdaptor(points));
        REQUIRE(native.commitCount() == 1);
        REQUIRE(native.forceUpdateCount() == 1);
    }

    SECTION("image clims default to the data range") {
        auto image = make<Image>();
        image->setData(Array({2, 2}, {-1.0f, 0.0f, 2.0f, 5.0f}));
        auto& native = nativeOf(registry.getAdaptor(image));
        REQUIRE(native.prop("clims") == nlohmann::json::array({-1.0, 5.0}));

        image->setClims(glm::vec2(0.0f, 1.0f));
        REQUIRE(native.prop("clims") == nlohmann::json::array({0.0, 1.0}));
    }

    SECTION("unsupported values are reported and the rest still applies") {
        auto image = make<Image>();
        image->setGamma(2.0f);
        image->setInterpolation(InterpolationMode::Bicubic);
        image->setCmap(Colormap("viridis"));
        auto& native = nativeOf(registry.getAdaptor(image));

        REQUIRE(registry.lastReport().count(SetterStatus::Unsupported) == 2);
        REQUIRE(registry.lastReport().ok());
        REQUIRE(native.prop("interpolation") == "linear");
        REQUIRE(native.prop("cmap") == "viridis");
    }

    SECTION("interactive nodes are unsupported") {
        auto scene = make<Scene>();
        registry.getAdaptor(scene);
        SyncReport seen;
        registry.setReportHandler([&](const SyncReport& r) { seen = r; });
        scene->setInteractive(true);
        REQUIRE(seen.count(SetterStatus::Unsupported) == 1);
    }

    SECTION("transforms reach the native matrix") {
        auto points = make<Points>();
        auto& native = nativeOf(registry.getAdaptor(points));
        points->setTransform(Transform::translation({3.0f, 0.0f, 0.0f}));
        REQUIRE(native.matrix()[3][0] == 3.0f);
    }
}

TEST_CASE("Headless camera frames its scene", "[unit][headless]") {
    AdaptorRegistry registry(createBackend(), quiet());
    auto view = make<View>();
    auto image = make<Image>();
    image->setData(Array::zeros({20, 40}));
    view->scene()->addChild(image);

    registry.getAdaptor(view);
    auto& camera = registry.getAdaptorAs<HeadlessCamera>(view->camera());

    // The camera syncs before the image joins the native tree
    camera.forceUpdate();
    REQUIRE(camera.framedSize());
    REQUIRE_THAT(camera.framedSize()->x, WithinAbs(40.0f, 1e-5f));
    REQUIRE_THAT(camera.framedSize()->y, WithinAbs(20.0f, 1e-5f));

    SECTION("a batch refits the camera") {
        {
            auto guard = view->camera()->batch();
            view->camera()->setRange(0.25f);
        }
        REQUIRE_THAT(camera.object().prop("fit_zoom").get<float>(), WithinAbs(0.75f, 1e-6f));
    }
}

TEST_CASE("Headless canvas rendering", "[unit][headless]") {
    AdaptorRegistry registry(createBackend(), quiet());
    auto view = make<View>();
    auto canvas = view->canvas();
    canvas->setWidth(4);
    canvas->setHeight(2);
    canvas->setBackgroundColor(Color::Black);

    SECTION("clear color fills the frame") {
        Array frame = registry.render(canvas);
        REQUIRE(frame.shapeString() == "2x4x4");
        REQUIRE(frame.at({1, 3, 3}) == 1.0f);
        REQUIRE(frame.at({0, 0, 0}) == 0.0f);
    }

    SECTION("view backgrounds are drawn inside their layout") {
        view->setBackgroundColor(Color::Red);
        view->setLayout(Layout(glm::vec2(2.0f, 0.0f), glm::vec2(2.0f, 2.0f)));
        Array frame = registry.render(canvas);
        REQUIRE(frame.at({0, 1, 0}) == 0.0f);
        REQUIRE(frame.at({0, 2, 0}) == 1.0f);
        REQUIRE(frame.at({1, 3, 0}) == 1.0f);
    }

    SECTION("hidden views are not drawn") {
        view->setBackgroundColor(Color::Red);
        view->setVisible(false);
        Array frame = registry.render(canvas);
        REQUIRE(frame.at({0, 0, 0}) == 0.0f);
    }

    SECTION("model changes after the first frame are picked up") {
        Array first = registry.render(canvas);
        REQUIRE(first.shapeString() == "2x4x4");
        canvas->setWidth(8);
        Array second = registry.render(canvas);
        REQUIRE(second.shapeString() == "2x8x4");
        REQUIRE(registry.getAdaptorAs<HeadlessCanvas>(canvas).frameCount() == 2);
    }

    SECTION("a closed canvas cannot render") {
        registry.close(canvas);
        REQUIRE_THROWS_AS(registry.render(canvas), BackendSyncError);
    }

    SECTION("views with borders are reported") {
        view->setLayout(Layout(glm::vec2(0.0f), std::nullopt, 1.0f, Color::White));
        std::vector<SetterResult> unsupported;
        registry.setReportHandler([&](const SyncReport& r) {
            for (const auto& result : r.results()) {
                if (result.status == SetterStatus::Unsupported) unsupported.push_back(result);
            }
        });
        registry.getAdaptor(canvas);
        REQUIRE(unsupported.size() == 1);
        REQUIRE(unsupported[0].field == Field::Layout);
        REQUIRE(registry.findAdaptor(view->id()) != nullptr);
    }
}
