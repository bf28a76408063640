#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <prism/core/error.h>
#include <prism/scene/camera.h>

using namespace prism;
using Catch::Matchers::WithinAbs;

namespace {

Camera MakeCamera() {
    Camera camera;
    camera.position = Vec3(0.0, -5.0, 0.0);
    camera.direction = Vec3(0.0, 2.0, 0.0);
    camera.screen_distance = 1.0;
    camera.screen_width = 2.0;
    camera.screen_height = 1.0;
    camera.screen_columns = 4;
    camera.screen_rows = 2;
    return camera;
}

} // namespace

TEST_CASE("Camera basis", "[scene][camera]") {
    SECTION("Looking along +y with z up") {
        auto basis = CameraRays::BuildBasis(Vec3(0.0, 2.0, 0.0), kDefaultWorldUp);

        REQUIRE(basis.u == Vec3(0.0, 1.0, 0.0));
        REQUIRE(basis.v == Vec3(1.0, 0.0, 0.0));
        REQUIRE(basis.w == Vec3(0.0, 0.0, 1.0));
    }

    SECTION("World up is configurable") {
        auto basis = CameraRays::BuildBasis(Vec3(0.0, 0.0, -1.0), Vec3(0.0, 1.0, 0.0));

        REQUIRE(basis.u == Vec3(0.0, 0.0, -1.0));
        REQUIRE(basis.v == Vec3(1.0, 0.0, 0.0));
        REQUIRE(basis.w == Vec3(0.0, 1.0, 0.0));
    }

    SECTION("Direction parallel to world up is rejected") {
        REQUIRE_THROWS_AS(CameraRays::BuildBasis(Vec3(0.0, 0.0, 3.0), kDefaultWorldUp), SceneError);
        REQUIRE_THROWS_AS(CameraRays::BuildBasis(Vec3(0.0, 0.0, -1.0), kDefaultWorldUp), SceneError);
    }

    SECTION("Zero direction is rejected") {
        REQUIRE_THROWS_AS(CameraRays::BuildBasis(Vec3(0.0), kDefaultWorldUp), SceneError);
    }
}

TEST_CASE("Primary rays", "[scene][camera]") {
    const Camera camera = MakeCamera();
    const CameraRays rays(camera);

    SECTION("Rays start at the camera position") {
        REQUIRE(rays.RayForPixel(0, 0).origin == camera.position);
        REQUIRE(rays.RayForPixel(3, 1).origin == camera.position);
    }

    SECTION("Centre pixel looks straight ahead") {
        Ray ray = rays.RayForPixel(2, 1);
        REQUIRE(ray.direction == Vec3(0.0, 1.0, 0.0));
    }

    SECTION("Top-left pixel points left and up") {
        Ray ray = rays.RayForPixel(0, 0);
        REQUIRE_THAT(ray.direction.x, WithinAbs(-0.5, 1e-12));
        REQUIRE_THAT(ray.direction.y, WithinAbs(1.0, 1e-12));
        REQUIRE_THAT(ray.direction.z, WithinAbs(0.25, 1e-12));
    }

    SECTION("Rows grow downward and columns to the right") {
        Ray below = rays.RayForPixel(2, 1);
        Ray above = rays.RayForPixel(2, 0);
        REQUIRE(above.direction.z > below.direction.z);

        Ray left = rays.RayForPixel(1, 1);
        Ray right = rays.RayForPixel(3, 1);
        REQUIRE(right.direction.x > left.direction.x);
    }

    SECTION("Screen distance scales the forward component") {
        Camera farther = camera;
        farther.screen_distance = 3.0;
        Ray ray = CameraRays(farther).RayForPixel(2, 1);
        REQUIRE(ray.direction == Vec3(0.0, 3.0, 0.0));
    }

    SECTION("Same pixel, same ray") {
        Ray a = rays.RayForPixel(1, 0);
        Ray b = rays.RayForPixel(1, 0);
        REQUIRE(a.origin == b.origin);
        REQUIRE(a.direction == b.direction);
    }

    SECTION("Degenerate camera cannot generate rays") {
        Camera looking_up = camera;
        looking_up.direction = Vec3(0.0, 0.0, 1.0);
        REQUIRE_THROWS_AS(CameraRays(looking_up), SceneError);
    }
}
