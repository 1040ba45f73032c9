/**
 * @file test_transform.cpp
 * @brief Unit tests for Transform
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <scenex/errors.h>
#include <scenex/transform.h>

using namespace scenex;
using Catch::Matchers::WithinAbs;

TEST_CASE("Transform defaults to identity", "[unit][transform]") {
    Transform t;
    REQUIRE(t.isIdentity());
    REQUIRE(t == Transform(glm::mat4(1.0f)));
    REQUIRE_THAT(t.determinant(), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("Transform factories map points", "[unit][transform]") {
    SECTION("translation") {
        auto p = Transform::translation({1.0f, 2.0f, 3.0f}).map({1.0f, 1.0f, 1.0f});
        REQUIRE_THAT(p.x, WithinAbs(2.0f, 1e-6f));
        REQUIRE_THAT(p.y, WithinAbs(3.0f, 1e-6f));
        REQUIRE_THAT(p.z, WithinAbs(4.0f, 1e-6f));
    }

    SECTION("scaling") {
        auto p = Transform::scaling({2.0f, 3.0f, 4.0f}).map({1.0f, 1.0f, 1.0f});
        REQUIRE_THAT(p.x, WithinAbs(2.0f, 1e-6f));
        REQUIRE_THAT(p.y, WithinAbs(3.0f, 1e-6f));
        REQUIRE_THAT(p.z, WithinAbs(4.0f, 1e-6f));
    }

    SECTION("rotation about z") {
        auto p = Transform::rotation(90.0f, {0.0f, 0.0f, 1.0f}).map({1.0f, 0.0f, 0.0f});
        REQUIRE_THAT(p.x, WithinAbs(0.0f, 1e-5f));
        REQUIRE_THAT(p.y, WithinAbs(1.0f, 1e-5f));
    }

    SECTION("rotation about a zero axis is identity") {
        REQUIRE(Transform::rotation(45.0f, glm::vec3(0.0f)).isIdentity());
    }

    SECTION("vectors ignore translation") {
        auto v = Transform::translation({5.0f, 5.0f, 5.0f}).mapVector({1.0f, 0.0f, 0.0f});
        REQUIRE_THAT(v.x, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(v.y, WithinAbs(0.0f, 1e-6f));
    }
}

TEST_CASE("Transform chain composes right to left", "[unit][transform]") {
    Transform a = Transform::translation({10.0f, 0.0f, 0.0f});
    Transform b = Transform::scaling({2.0f, 2.0f, 2.0f});
    Transform c = Transform::rotation(90.0f, {0.0f, 0.0f, 1.0f});

    SECTION("matrix equals the ordered product") {
        Transform chained = Transform::chain({a, b, c});
        REQUIRE(chained.approxEqual(Transform(a.matrix() * b.matrix() * c.matrix())));
    }

    SECTION("the last transform is applied first") {
        auto p = Transform::chain({a, b}).map({1.0f, 0.0f, 0.0f});
        REQUIRE_THAT(p.x, WithinAbs(12.0f, 1e-5f));
    }

    SECTION("chain of nothing is identity, chain of one is a copy") {
        REQUIRE(Transform::chain({}).isIdentity());
        REQUIRE(Transform::chain({a}) == a);
    }

    SECTION("composition is associative") {
        Transform left = Transform::chain({Transform::chain({a, b}), c});
        Transform right = Transform::chain({a, Transform::chain({b, c})});
        REQUIRE(left.approxEqual(right));
    }

    SECTION("then applies the argument after this") {
        REQUIRE(b.then(a).approxEqual(Transform::chain({a, b})));
        REQUIRE(b.translated({10.0f, 0.0f, 0.0f}).approxEqual(a * b));
    }
}

TEST_CASE("Transform inverse", "[unit][transform]") {
    SECTION("inverse undoes the transform") {
        Transform t = Transform::chain({Transform::translation({1.0f, -2.0f, 3.0f}),
                                        Transform::rotation(30.0f, {0.0f, 1.0f, 0.0f}),
                                        Transform::scaling({2.0f, 0.5f, 4.0f})});
        REQUIRE((t * t.inverse()).isIdentity(1e-5f));
        REQUIRE((t.inverse() * t).isIdentity(1e-5f));
    }

    SECTION("singular transforms cannot be inverted") {
        Transform flat = Transform::scaling({1.0f, 0.0f, 1.0f});
        REQUIRE_THROWS_AS(flat.inverse(), SingularTransformError);
        REQUIRE_THROWS_AS(flat.inverse(), StructuralError);
    }
}
