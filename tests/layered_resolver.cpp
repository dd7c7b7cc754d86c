#include <catch2/catch.hpp>

#include "core/layered_resolver.h"

using namespace replay;

TEST_CASE("LayeredResolver keeps the first accepted candidate") {
    int calls = 0;
    LayeredResolver<int> resolver;
    resolver.add(ResolveTier::Primary, "principal", [&]() -> std::optional<int> {
                ++calls;
                return -5;
            })
        .add(ResolveTier::Alternate, "absent", [&]() -> std::optional<int> {
            ++calls;
            return std::nullopt;
        })
        .add(ResolveTier::Alternate, "second", [&]() -> std::optional<int> {
            ++calls;
            return 42;
        })
        .add(ResolveTier::Scan, "balayage", [&]() -> std::optional<int> {
            ++calls;
            return 7;
        });
    REQUIRE(resolver.size() == 4);

    auto resolved = resolver.resolve([](const int &v) { return v > 0; });
    REQUIRE(resolved.has_value());
    CHECK(resolved->value == 42);
    CHECK(resolved->tier == ResolveTier::Alternate);
    CHECK(resolved->label == "second");
    CHECK(calls == 3);
}

TEST_CASE("LayeredResolver returns nothing when every candidate is rejected") {
    LayeredResolver<std::string> resolver;
    resolver.add(ResolveTier::Primary, "a", [] { return std::optional<std::string>("x"); });
    resolver.add(ResolveTier::Scan, "b", [] { return std::optional<std::string>("yy"); });
    CHECK_FALSE(resolver.resolve([](const std::string &s) { return s.size() > 5; }).has_value());

    LayeredResolver<int> empty;
    CHECK_FALSE(empty.resolve([](const int &) { return true; }).has_value());
}
