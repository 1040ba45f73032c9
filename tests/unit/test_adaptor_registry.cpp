/**
 * @file test_adaptor_registry.cpp
 * @brief Unit tests for adaptor caching, event forwarding and eviction
 */

#include <catch2/catch_test_macros.hpp>
#include <scenex/adaptor_registry.h>
#include "recording_backend.h"

using namespace scenex;
using namespace scenex::testing;

namespace {

struct RegistryFixture {
    RegistryFixture() : registry(recordingBackend(), quietOptions()) { callLog().reset(); }

    AdaptorRegistry registry;
};

} // namespace

TEST_CASE("A registry needs a backend", "[unit][registry]") {
    REQUIRE_THROWS_AS(AdaptorRegistry(nullptr), ValidationError);
}

TEST_CASE("Backends register one adaptor per kind", "[unit][registry]") {
    auto backend = recordingBackend({ModelKind::Points});
    REQUIRE(backend->name() == "recording");
    REQUIRE(backend->supports(ModelKind::Image));
    REQUIRE_FALSE(backend->supports(ModelKind::Points));
    REQUIRE(backend->supportedKinds().size() == 5);
}

TEST_CASE_METHOD(RegistryFixture, "Adaptors are created once and cached", "[unit][registry]") {
    auto image = make<Image>();

    Adaptor& first = registry.getAdaptor(image);
    Adaptor& second = registry.getAdaptor(image);

    REQUIRE(&first == &second);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.contains(*image));
    REQUIRE(registry.findAdaptor(image->id()) == &first);
    REQUIRE(first.modelId() == image->id());
    REQUIRE(std::any_cast<ModelId>(registry.native(image)) == image->id());
    REQUIRE(&registry.getAdaptorAs<ImageAdaptor>(image) == &first);
    REQUIRE_THROWS_AS(registry.getAdaptorAs<PointsAdaptor>(image), UnsupportedCapabilityError);
}

TEST_CASE_METHOD(RegistryFixture, "Lookup without creation", "[unit][registry]") {
    auto points = make<Points>();

    REQUIRE_THROWS_AS(registry.getAdaptor(points, false), AdaptorNotFoundError);
    REQUIRE(registry.size() == 0);
    REQUIRE(registry.findAdaptor(points->id()) == nullptr);
    REQUIRE(callLog().calls.empty());
}

TEST_CASE_METHOD(RegistryFixture, "Creation pushes the full model state", "[unit][registry]") {
    auto points = make<Points>();
    SyncReport seen;
    registry.setReportHandler([&](const SyncReport& r) { seen = r; });

    registry.getAdaptor(points);

    REQUIRE(seen.model() == points->id());
    REQUIRE(seen.results().size() == points->fields().size());
    REQUIRE(registry.lastReport().clean());
    REQUIRE(callLog().count("setCoords") == 1);
    REQUIRE(callLog().count("setAntialias") == 1);
    REQUIRE(callLog().count("blockUpdates") == 1);
    REQUIRE(callLog().count("unblockUpdates") == 1);
}

TEST_CASE_METHOD(RegistryFixture, "Model changes reach the adaptor", "[unit][registry]") {
    auto camera = make<Camera>();
    registry.getAdaptor(camera);
    callLog().reset();

    SECTION("one setter per change") {
        camera->setZoom(4.0f);
        REQUIRE(callLog().calls.size() == 1);
        REQUIRE(callLog().count("setZoom") == 1);
    }

    SECTION("equal values do not reach the backend") {
        camera->setZoom(1.0f);
        REQUIRE(callLog().calls.empty());
    }

    SECTION("a batch ends with one forced update") {
        {
            auto guard = camera->batch();
            camera->setZoom(2.0f);
            camera->setRange(0.2f);
        }
        REQUIRE(callLog().count("setZoom") == 1);
        REQUIRE(callLog().count("setRange") == 1);
        REQUIRE(callLog().count("forceUpdate") == 1);
    }

    SECTION("backend errors are reported, not thrown") {
        SyncReport seen;
        registry.setReportHandler([&](const SyncReport& r) { seen = r; });
        callLog().failing.insert("setCenter");

        REQUIRE_NOTHROW(camera->setCenter({1.0f, 2.0f, 3.0f}));
        REQUIRE(camera->center().x == 1.0f);
        REQUIRE(seen.count(SetterStatus::Failed) == 1);
        REQUIRE(seen.results().front().field == Field::Center);
    }
}

TEST_CASE_METHOD(RegistryFixture, "Structure is materialized with its owner", "[unit][registry]") {
    auto view = make<View>();
    auto image = make<Image>();
    view->scene()->addChild(image);
    auto canvas = make<Canvas>();
    canvas->addView(view);

    registry.getAdaptor(canvas);

    REQUIRE(registry.contains(*view));
    REQUIRE(registry.contains(*view->scene()));
    REQUIRE(registry.contains(*view->camera()));
    REQUIRE(registry.contains(*image));
    REQUIRE(registry.size() == 5);

    SECTION("children added later get adaptors before the parent hears of them") {
        auto points = make<Points>();
        callLog().childLists.clear();
        image->addChild(points);

        REQUIRE(registry.contains(*points));
        // The new child's own sync runs first, then the parent's update
        REQUIRE(callLog().childLists.size() == 2);
        REQUIRE(callLog().childLists.front().empty());
        REQUIRE(callLog().childLists.back() == NodeList{points});
    }

    SECTION("a replaced scene is materialized") {
        auto scene = make<Scene>();
        view->setScene(scene);
        REQUIRE(registry.contains(*scene));
    }

    SECTION("creation order puts owners first") {
        auto all = registry.all();
        REQUIRE(all.front()->modelId() == canvas->id());
    }
}

TEST_CASE("Unsupported kinds are skipped while materializing", "[unit][registry]") {
    AdaptorRegistry registry(recordingBackend({ModelKind::Points}), quietOptions());
    auto scene = make<Scene>();
    auto points = make<Points>();
    scene->addChild(points);

    REQUIRE_NOTHROW(registry.getAdaptor(scene));
    REQUIRE(registry.contains(*scene));
    REQUIRE_FALSE(registry.contains(*points));
    REQUIRE_THROWS_AS(registry.getAdaptor(points), UnsupportedCapabilityError);
}

TEST_CASE_METHOD(RegistryFixture, "Eviction", "[unit][registry]") {
    auto scene = make<Scene>();
    auto image = make<Image>();
    scene->addChild(image);
    registry.getAdaptor(scene);
    REQUIRE(registry.size() == 2);

    SECTION("evict stops event forwarding") {
        REQUIRE(registry.evict(*image));
        REQUIRE_FALSE(registry.evict(*image));
        callLog().reset();
        image->setGamma(2.0f);
        REQUIRE(callLog().calls.empty());
        REQUIRE(image->subscriberCount() == 0);
    }

    SECTION("a new adaptor is created after eviction") {
        registry.evict(*image);
        callLog().reset();
        registry.getAdaptor(image);
        REQUIRE(registry.contains(*image));
        REQUIRE(callLog().count("setData") == 1);
    }

    SECTION("evictSubtree removes descendants") {
        REQUIRE(registry.evictSubtree(*scene) == 2);
        REQUIRE(registry.size() == 0);
    }

    SECTION("garbage collection releases unreferenced models") {
        REQUIRE(registry.collectGarbage() == 0);
        scene.reset();
        image.reset();
        REQUIRE(registry.collectGarbage() == 2);
        REQUIRE(registry.size() == 0);
    }

    SECTION("garbage collection keeps models that are still used") {
        scene.reset();
        REQUIRE(registry.collectGarbage() == 1);
        REQUIRE(registry.contains(*image));
    }
}

TEST_CASE_METHOD(RegistryFixture, "Canvas helpers", "[unit][registry]") {
    auto view = make<View>();

    Array frame = registry.render(view);
    REQUIRE(frame.shapeString() == "1x1x4");
    REQUIRE(callLog().count("render") == 1);

    auto canvas = view->currentCanvas();
    REQUIRE(canvas != nullptr);
    registry.close(canvas);
    REQUIRE(callLog().count("close") == 1);
}

TEST_CASE("Registry options from the environment", "[unit][registry]") {
    RegistryOptions defaults;
    REQUIRE_FALSE(defaults.debug);
    REQUIRE(defaults.logUnsupported);
    REQUIRE(defaults.logFailures);
}
