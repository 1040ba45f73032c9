/**
 * @file test_scene_sync.cpp
 * @brief Integration tests for model-to-native synchronization
 *
 * Builds model trees, binds them to the headless backend, and checks that
 * the native tree follows every structural change.
 */

#include <catch2/catch_test_macros.hpp>
#include <scenex/headless/adaptors.h>
#include <scenex/headless/backend.h>
#include <scenex/scenex.h>

using namespace scenex;
using namespace scenex::headless;

namespace {

const char* kExpectedTree =
    "Scene\n"
    "    ├── Image\n"
    "    ├── Image\n"
    "    ├── Points\n"
    "    └── Camera";

RegistryOptions quiet() {
    RegistryOptions options;
    options.logUnsupported = false;
    options.logFailures = false;
    return options;
}

ViewPtr basicView() {
    auto scene = make<Scene>();
    auto first = make<Image>();
    first->setData(Array::filled({10, 10}, 0.5f));
    auto second = make<Image>();
    second->setData(Array::filled({10, 10}, 0.25f));
    second->setTransform(Transform::translation({10.0f, 0.0f, 0.0f}));
    auto points = make<Points>();
    points->setCoords({glm::vec3(1.0f, 1.0f, 0.0f), glm::vec3(5.0f, 8.0f, 0.0f)});
    scene->addChild(first);
    scene->addChild(second);
    scene->addChild(points);

    auto view = make<View>();
    view->setScene(scene);
    return view;
}

std::string nativeName(const NativeObject& object) {
    return object.type();
}

std::string modelName(const Node& node) {
    return node.kindName();
}

NativeObject& nativeScene(AdaptorRegistry& registry, const ViewPtr& view) {
    return nativeOf(registry.getAdaptor(view->scene(), false));
}

} // namespace

TEST_CASE("Basic view", "[integration][sync]") {
    auto view = basicView();
    AdaptorRegistry registry(createBackend(), quiet());

    SECTION("model outline") {
        REQUIRE(treeRepr(*view->scene()) == kExpectedTree);
        REQUIRE(checkTreeInvariants(*view->scene()).empty());
    }

    SECTION("documents") {
        REQUIRE_FALSE(dumpJson(*view).empty());
        REQUIRE(toJson(*view).is_object());
    }

    SECTION("render") {
        view->setBackgroundColor(Color::Coral);
        Array frame = registry.render(view);
        REQUIRE(frame.shapeString() == "500x500x4");
        REQUIRE(frame.at({250, 250, 0}) == Color::Coral.r);
        REQUIRE(view->currentCanvas() != nullptr);
    }

    SECTION("the native tree matches the model tree") {
        registry.getAdaptor(view);
        NativeObject& native = nativeScene(registry, view);
        REQUIRE(treeDict(native, nativeName) == treeDict(*view->scene(), modelName));
        REQUIRE(treeRepr(native, nativeName) == kExpectedTree);
    }

    SECTION("the camera frames the whole scene") {
        registry.getAdaptor(view);
        auto& camera = registry.getAdaptorAs<HeadlessCamera>(view->camera());
        view->camera()->setRange(0.2f);
        REQUIRE(camera.framedSize());
        REQUIRE(camera.framedSize()->x == 20.0f);
        REQUIRE(camera.framedSize()->y == 10.0f);
    }
}

TEST_CASE("Changing parent updates the native tree", "[integration][sync]") {
    AdaptorRegistry registry(createBackend(), quiet());
    auto scene1 = make<Scene>();
    auto scene2 = make<Scene>();
    auto img1 = make<Image>();
    img1->setData(Array::filled({10, 10}, 1.0f));
    auto img2 = make<Image>();
    img2->setData(Array::filled({10, 10}, 2.0f));

    NativeObject& native1 = nativeOf(registry.getAdaptor(scene1));
    NativeObject& native2 = nativeOf(registry.getAdaptor(scene2));
    REQUIRE(native1.countChildren("Image") == 0);
    REQUIRE(native2.countChildren("Image") == 0);

    img1->setParent(scene1);
    REQUIRE(img1->parent() == scene1.get());
    REQUIRE(scene1->contains(*img1));
    REQUIRE(native1.countChildren("Image") == 1);

    scene2->addChild(img2);
    REQUIRE(img2->parent() == scene2.get());
    REQUIRE(native2.countChildren("Image") == 1);

    scene2->addChild(img1);
    REQUIRE(img1->parent() == scene2.get());
    REQUIRE_FALSE(scene1->contains(*img1));
    REQUIRE(native1.countChildren("Image") == 0);
    REQUIRE(native2.countChildren("Image") == 2);

    scene2->removeChild(img2);
    REQUIRE(img2->parent() == nullptr);
    REQUIRE(native2.countChildren("Image") == 1);
    REQUIRE(nativeOf(registry.getAdaptor(img2, false)).parent() == nullptr);

    img1->setParent(nullptr);
    REQUIRE(img1->parent() == nullptr);
    REQUIRE(native2.countChildren("Image") == 0);

    REQUIRE(checkTreeInvariants(*scene1).empty());
    REQUIRE(checkTreeInvariants(*scene2).empty());
}

TEST_CASE("Native children follow model order", "[integration][sync]") {
    AdaptorRegistry registry(createBackend(), quiet());
    auto scene = make<Scene>();
    auto points = make<Points>();
    auto image = make<Image>();
    scene->addChild(points);
    scene->addChild(image);
    NativeObject& native = nativeOf(registry.getAdaptor(scene));

    // Re-adding moves a node to the end
    points->setParent(nullptr);
    scene->addChild(points);

    REQUIRE(treeDict(native, nativeName) == treeDict(*scene, modelName));
    REQUIRE(native.children().back()->type() == "Points");
}

TEST_CASE("A loaded document syncs like a built one", "[integration][sync]") {
    auto original = basicView();
    auto canvas = original->canvas();
    canvas->setWidth(64);
    canvas->setHeight(32);

    ModelPtr loaded = loadJson(dumpJson(*canvas));
    auto copy = modelCast<Canvas>(loaded);
    REQUIRE(copy);

    AdaptorRegistry registry(createBackend(), quiet());
    Array frame = registry.render(copy);
    REQUIRE(frame.shapeString() == "32x64x4");

    auto view = copy->views().front();
    NativeObject& native = nativeScene(registry, view);
    REQUIRE(treeRepr(native, nativeName) == kExpectedTree);
}

TEST_CASE("Tearing down the registry leaves models intact", "[integration][sync]") {
    auto view = basicView();
    {
        AdaptorRegistry registry(createBackend(), quiet());
        registry.getAdaptor(view);
        REQUIRE(view->scene()->subscriberCount() == 1);
    }
    REQUIRE(view->scene()->subscriberCount() == 0);
    REQUIRE(view->scene()->children().size() == 4);

    // Changes after teardown reach nobody
    REQUIRE_NOTHROW(view->scene()->setVisible(false));
}
