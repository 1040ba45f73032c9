/**
 * @file test_serialization.cpp
 * @brief Unit tests for JSON documents
 */

#include <catch2/catch_test_macros.hpp>
#include <scenex/errors.h>
#include <scenex/image.h>
#include <scenex/points.h>
#include <scenex/serialization.h>
#include <scenex/tree_repr.h>

using namespace scenex;
using json = nlohmann::json;

TEST_CASE("Nodes carry their node_type", "[unit][serialization]") {
    auto points = make<Points>();

    SECTION("full document") {
        json doc = toJson(*points);
        REQUIRE(doc["node_type"] == "points");
        REQUIRE(doc["size"] == 10.0);
        REQUIRE(doc["opacity"] == 1.0);
        REQUIRE(doc["children"].empty());
        REQUIRE_FALSE(doc.contains("parent"));
    }

    SECTION("defaults excluded") {
        json doc = toJson(*points, true);
        REQUIRE(doc == json{{"node_type", "points"}});
    }

    SECTION("changed fields survive exclusion") {
        points->setSize(3.0f);
        points->setName(std::string("markers"));
        json doc = toJson(*points, true);
        REQUIRE(doc.size() == 3);
        REQUIRE(doc["size"] == 3.0);
        REQUIRE(doc["name"] == "markers");
    }
}

TEST_CASE("Loading a node tree", "[unit][serialization]") {
    json doc = {
        {"node_type", "scene"},
        {"children", {
            {{"node_type", "image"},
             {"cmap", "viridis"},
             {"data", {{"shape", {2, 2}}, {"values", {0, 1, 2, 3}}}}},
            {{"node_type", "points"},
             {"coords", {{0, 0}, {1, 1, 1}}},
             {"face_color", "#FF0000"}}
        }}
    };

    NodePtr root = nodeFromJson(doc);
    REQUIRE(root->kind() == ModelKind::Scene);
    REQUIRE(root->children().size() == 2);

    auto image = nodeCast<Image>(root->children()[0]);
    REQUIRE(image);
    REQUIRE(image->parent() == root.get());
    REQUIRE(image->cmap().name == "viridis");
    REQUIRE(image->data()->at({1, 1}) == 3.0f);

    auto points = nodeCast<Points>(root->children()[1]);
    REQUIRE(points);
    REQUIRE(points->coords().size() == 2);
    REQUIRE(points->coords()[0].z == 0.0f);
    REQUIRE(points->faceColor() == Color::Red);
}

TEST_CASE("Documents round trip", "[unit][serialization]") {
    auto view = make<View>();
    auto image = make<Image>();
    image->setData(Array({1, 3}, {0.0f, 0.5f, 1.0f}));
    image->setClims(glm::vec2(0.0f, 2.0f));
    view->scene()->addChild(image);
    view->camera()->setZoom(2.0f);
    view->setBackgroundColor(Color::Blue);
    view->setLayout(Layout(glm::vec2(10.0f, 20.0f), glm::vec2(100.0f, 80.0f)));

    auto canvas = view->canvas();
    canvas->setTitle("demo");

    json first = toJson(*canvas);
    ModelPtr loaded = modelFromJson(first);
    REQUIRE(loaded->kind() == ModelKind::Canvas);
    REQUIRE(toJson(*loaded) == first);

    auto copy = modelCast<Canvas>(loaded);
    REQUIRE(copy->views().size() == 1);
    auto loadedView = copy->views()[0];
    REQUIRE(loadedView->camera()->parent() == loadedView->scene().get());
    REQUIRE(loadedView->scene()->children().size() == 2);
    REQUIRE(loadedView->currentCanvas() == copy);
}

TEST_CASE("The view camera is written once", "[unit][serialization]") {
    auto view = make<View>();
    json doc = toJson(*view);
    REQUIRE(doc["scene"]["children"].empty());
    REQUIRE(doc["camera"]["node_type"] == "camera");
    REQUIRE(modelFromJson(doc)->kind() == ModelKind::View);
}

TEST_CASE("Scene child order survives a round trip", "[unit][serialization]") {
    auto view = make<View>();

    SECTION("camera first, as a new view builds it") {
        view->scene()->addChild(make<Image>());
        view->scene()->addChild(make<Points>());
        std::string before = treeRepr(*view->scene());

        json doc = toJson(*view);
        REQUIRE(doc["camera_index"] == 0);

        auto loaded = viewFromJson(doc);
        REQUIRE(treeRepr(*loaded->scene()) == before);
        REQUIRE(loaded->scene()->children().front() == loaded->camera());
        REQUIRE(checkTreeInvariants(*loaded->scene()).empty());
    }

    SECTION("camera between other children") {
        view->scene()->addChild(make<Image>());
        view->setCamera(make<Camera>());
        view->scene()->addChild(make<Points>());
        std::string before = treeRepr(*view->scene());
        REQUIRE(before == "Scene\n    ├── Image\n    ├── Camera\n    └── Points");

        auto loaded = viewFromJson(toJson(*view));
        REQUIRE(treeRepr(*loaded->scene()) == before);
        REQUIRE(loaded->scene()->children()[1] == loaded->camera());
    }

    SECTION("documents without camera_index append the camera") {
        view->scene()->addChild(make<Image>());
        json doc = toJson(*view);
        doc.erase("camera_index");

        auto loaded = viewFromJson(doc);
        REQUIRE(loaded->scene()->children().size() == 2);
        REQUIRE(loaded->scene()->children().back() == loaded->camera());
    }

    SECTION("a negative camera_index is rejected") {
        json doc = toJson(*view);
        doc["camera_index"] = -1;
        REQUIRE_THROWS_AS(viewFromJson(doc), SerializationError);
    }
}

TEST_CASE("Malformed documents", "[unit][serialization]") {
    SECTION("unparseable text") {
        REQUIRE_THROWS_AS(loadJson("{not json"), SerializationError);
    }

    SECTION("unknown node_type") {
        REQUIRE_THROWS_AS(nodeFromJson(json{{"node_type", "mesh"}}), SerializationError);
    }

    SECTION("wrong value types") {
        REQUIRE_THROWS_AS(nodeFromJson(json{{"node_type", "points"}, {"size", "big"}}), SerializationError);
        REQUIRE_THROWS_AS(nodeFromJson(json{{"node_type", "points"}, {"symbol", "blob"}}), SerializationError);
    }

    SECTION("integer fields reject fractional numbers") {
        REQUIRE_THROWS_AS(nodeFromJson(json{{"node_type", "scene"}, {"order", 1.5}}), SerializationError);
        REQUIRE_THROWS_AS(canvasFromJson(json{{"width", 64.5}}), SerializationError);
        REQUIRE_THROWS_AS(canvasFromJson(json{{"height", 10.0}}), SerializationError);
        REQUIRE_THROWS_AS(viewFromJson(json{{"layout", {{"padding", 2.5}}}}), SerializationError);
        REQUIRE_THROWS_AS(viewFromJson(json{{"layout", {{"margin", 0.5}}}}), SerializationError);
        REQUIRE(canvasFromJson(json{{"width", 64}})->width() == 64);
    }

    SECTION("values out of range") {
        REQUIRE_THROWS_AS(nodeFromJson(json{{"node_type", "image"}, {"opacity", 2.0}}), ValidationError);
    }

    SECTION("unrecognized documents") {
        REQUIRE_THROWS_AS(modelFromJson(json{{"width", 10}}), SerializationError);
        REQUIRE_THROWS_AS(modelFromJson(json::array()), SerializationError);
    }

    SECTION("a view scene must be a scene") {
        json doc = {{"scene", {{"node_type", "points"}}}};
        REQUIRE_THROWS_AS(viewFromJson(doc), SerializationError);
    }
}
