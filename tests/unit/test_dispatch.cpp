/**
 * @file test_dispatch.cpp
 * @brief Unit tests for field-to-setter routing and sync reports
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <scenex/dispatch.h>
#include "recording_backend.h"

using namespace scenex;
using namespace scenex::testing;
using Catch::Matchers::ContainsSubstring;

namespace {

struct DispatchFixture {
    DispatchFixture() : registry(recordingBackend(), quietOptions()) { callLog().reset(); }

    AdaptorRegistry registry;
};

} // namespace

TEST_CASE("Every model field has a binding", "[unit][dispatch]") {
    for (ModelPtr model : {ModelPtr(make<Scene>()), ModelPtr(make<Camera>()), ModelPtr(make<Image>()),
                           ModelPtr(make<Points>()), ModelPtr(make<View>()), ModelPtr(make<Canvas>())}) {
        for (Field field : model->fields()) {
            INFO(model->kindName() << "." << fieldName(field));
            REQUIRE(hasBinding(model->kind(), field));
        }
    }
    REQUIRE_FALSE(hasBinding(ModelKind::Scene, Field::Gamma));
}

TEST_CASE_METHOD(DispatchFixture, "dispatch routes a value to its setter", "[unit][dispatch]") {
    auto points = make<Points>();
    RecordingPoints adaptor(*points, registry);

    SECTION("applied") {
        auto result = dispatch(adaptor, Field::PointSize, FieldValue(std::in_place_type<float>, 3.0f));
        REQUIRE(result.status == SetterStatus::Applied);
        REQUIRE(callLog().count("setSize") == 1);
    }

    SECTION("a backend that cannot honor the value") {
        callLog().unsupported.insert("setSymbol");
        auto result = dispatch(adaptor, Field::Symbol, FieldValue(std::in_place_type<SymbolName>, SymbolName::Star));
        REQUIRE(result.status == SetterStatus::Unsupported);
        REQUIRE_THAT(result.reason, ContainsSubstring("setSymbol"));
    }

    SECTION("a setter that throws") {
        callLog().failing.insert("setCoords");
        auto result = dispatch(adaptor, Field::Coords, FieldValue(std::in_place_type<PointList>));
        REQUIRE(result.status == SetterStatus::Failed);
        REQUIRE_THAT(result.reason, ContainsSubstring("blew up"));
    }

    SECTION("a field the kind does not have") {
        auto result = dispatch(adaptor, Field::Gamma, FieldValue(std::in_place_type<float>, 2.0f));
        REQUIRE(result.status == SetterStatus::Unsupported);
        REQUIRE(callLog().calls.empty());
    }

    SECTION("a value of the wrong type") {
        auto result = dispatch(adaptor, Field::PointSize, FieldValue(std::in_place_type<int>, 3));
        REQUIRE(result.status == SetterStatus::Failed);
        REQUIRE(callLog().calls.empty());
    }
}

TEST_CASE_METHOD(DispatchFixture, "syncAdaptor pushes every field inside a block", "[unit][dispatch]") {
    auto image = make<Image>();
    RecordingImage adaptor(*image, registry);

    SyncReport report = syncAdaptor(adaptor, *image);

    REQUIRE(report.model() == image->id());
    REQUIRE(report.results().size() == image->fields().size());
    REQUIRE(report.clean());

    const auto& calls = callLog().calls;
    REQUIRE_THAT(calls.front(), ContainsSubstring(".blockUpdates"));
    REQUIRE_THAT(calls[calls.size() - 2], ContainsSubstring(".unblockUpdates"));
    REQUIRE_THAT(calls.back(), ContainsSubstring(".forceUpdate"));
    REQUIRE(callLog().count("setData") == 1);
    REQUIRE(callLog().count("setGamma") == 1);
}

TEST_CASE_METHOD(DispatchFixture, "A failing setter does not stop the sync", "[unit][dispatch]") {
    auto image = make<Image>();
    RecordingImage adaptor(*image, registry);
    callLog().failing.insert("setCmap");
    callLog().unsupported.insert("setGamma");

    SyncReport report = syncAdaptor(adaptor, *image);

    REQUIRE(report.count(SetterStatus::Failed) == 1);
    REQUIRE(report.count(SetterStatus::Unsupported) == 1);
    REQUIRE_FALSE(report.ok());
    REQUIRE(callLog().count("setClims") == 1);
    REQUIRE(callLog().count("setInterpolation") == 1);
    REQUIRE_THAT(report.summary(), ContainsSubstring("cmap failed"));
    REQUIRE_THAT(report.summary(), ContainsSubstring("gamma unsupported"));
    REQUIRE_THROWS_AS(report.throwIfFailed(), BackendSyncError);
}

TEST_CASE_METHOD(DispatchFixture, "Failures in the batching calls are reported", "[unit][dispatch]") {
    auto scene = make<Scene>();
    RecordingScene adaptor(*scene, registry);
    callLog().failing.insert("forceUpdate");

    SyncReport report = syncAdaptor(adaptor, *scene);

    REQUIRE(report.count(SetterStatus::Failed) == 1);
    REQUIRE_THAT(report.results().back().reason, ContainsSubstring("forceUpdate"));
}

TEST_CASE_METHOD(DispatchFixture, "Layout is applied piece by piece", "[unit][dispatch]") {
    auto view = make<View>();
    RecordingView adaptor(*view, registry);
    Layout layout(glm::vec2(1.0f, 2.0f), glm::vec2(30.0f, 40.0f), 2.0f);

    SECTION("every part is set") {
        auto result = dispatch(adaptor, Field::Layout, FieldValue(std::in_place_type<Layout>, layout));
        REQUIRE(result.status == SetterStatus::Applied);
        for (const char* call : {"setPosition", "setSize", "setBorderWidth", "setBorderColor",
                                 "setPadding", "setMargin"}) {
            REQUIRE(callLog().count(call) == 1);
        }
    }

    SECTION("an unsupported part does not skip the others") {
        callLog().unsupported.insert("setBorderWidth");
        auto result = dispatch(adaptor, Field::Layout, FieldValue(std::in_place_type<Layout>, layout));
        REQUIRE(result.status == SetterStatus::Unsupported);
        REQUIRE_THAT(result.reason, ContainsSubstring("border_width"));
        REQUIRE(callLog().count("setMargin") == 1);
    }

    SECTION("a failing part wins over an unsupported one") {
        callLog().unsupported.insert("setPadding");
        callLog().failing.insert("setPosition");
        auto result = dispatch(adaptor, Field::Layout, FieldValue(std::in_place_type<Layout>, layout));
        REQUIRE(result.status == SetterStatus::Failed);
    }
}

TEST_CASE_METHOD(DispatchFixture, "Optional capabilities default to no-ops", "[unit][dispatch]") {
    auto canvas = make<Canvas>();
    RecordingCanvas adaptor(*canvas, registry);

    auto result = dispatch(adaptor, Field::Views, FieldValue(std::in_place_type<ViewList>));
    REQUIRE(result.status == SetterStatus::Applied);
    REQUIRE(callLog().calls.empty());
}

TEST_CASE("SyncReport merging and summary", "[unit][dispatch]") {
    SyncReport a(7, ModelKind::Points);
    a.add({Field::PointSize, SetterStatus::Applied, ""});
    SyncReport b(7, ModelKind::Points);
    b.add({Field::Symbol, SetterStatus::Unsupported, "no stars"});

    a.merge(b);

    REQUIRE(a.results().size() == 2);
    REQUIRE(a.ok());
    REQUIRE_FALSE(a.clean());
    REQUIRE(a.summary() == "Points #7: 1 applied, 1 unsupported, 0 failed (symbol unsupported: no stars)");
    REQUIRE_NOTHROW(a.throwIfFailed());
}
