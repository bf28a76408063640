#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <prism/core/config.h>

using namespace prism::config;

TEST_CASE("Config defaults", "[core][config]") {
    SECTION("Missing file yields defaults") {
        auto config = load_from_file("does/not/exist/prism.json");

        REQUIRE(config.log_level == spdlog::level::info);
        REQUIRE(config.render.max_bounces == 10);
        REQUIRE(config.render.threads == 0);
        REQUIRE_THAT(config.render.shadow_epsilon, Catch::Matchers::WithinRel(0.1));
        REQUIRE_THAT(config.render.reflection_epsilon, Catch::Matchers::WithinRel(1e-4));
    }

    SECTION("Malformed document yields defaults") {
        auto config = load_from_string("{ \"render\": { \"maxBounces\": ");
        REQUIRE(config.render.max_bounces == 10);
    }

    SECTION("Mistyped value yields defaults") {
        auto config = load_from_string(R"({ "render": { "maxBounces": 3, "threads": "many" } })");
        REQUIRE(config.render.max_bounces == 10);
        REQUIRE(config.render.threads == 0);
    }

    SECTION("Negative thread count yields defaults") {
        auto config = load_from_string(R"({ "render": { "maxBounces": 3, "threads": -1 } })");
        REQUIRE(config.render.threads == 0);
        REQUIRE(config.render.max_bounces == 10);
    }

    SECTION("Thread count above the limit yields defaults") {
        auto config = load_from_string(R"({ "render": { "threads": 4294967295 } })");
        REQUIRE(config.render.threads == 0);
    }
}

TEST_CASE("Config accepts the thread limit", "[core][config]") {
    auto config = load_from_string(R"({ "render": { "threads": 1024 } })");
    REQUIRE(config.render.threads == prism::tracer::kMaxThreads);
}

TEST_CASE("Config values", "[core][config]") {
    auto config = load_from_string(R"({
        "logging": { "level": "debug" },
        "render": {
            "threads": 4,
            "maxBounces": 3,
            "shadowEpsilon": 0.01,
            "reflectionEpsilon": 0.001
        }
    })");

    REQUIRE(config.log_level == spdlog::level::debug);
    REQUIRE(config.render.threads == 4);
    REQUIRE(config.render.max_bounces == 3);
    REQUIRE_THAT(config.render.shadow_epsilon, Catch::Matchers::WithinRel(0.01));
    REQUIRE_THAT(config.render.reflection_epsilon, Catch::Matchers::WithinRel(0.001));
}

TEST_CASE("Config keeps defaults for absent keys", "[core][config]") {
    auto config = load_from_string(R"({ "render": { "shadowEpsilon": 0.5 } })");

    REQUIRE_THAT(config.render.shadow_epsilon, Catch::Matchers::WithinRel(0.5));
    REQUIRE(config.render.max_bounces == 10);
    REQUIRE(config.log_level == spdlog::level::info);
}
