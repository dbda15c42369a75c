#include "doctest.h"
#include "errors.hpp"
#include <format>

using namespace svcdeck;

TEST_CASE("error ring tags entries with its command") {
    ErrorRing ring("systemctl");
    ring.add("list-timers: exit status 1");

    auto errors = ring.recent();
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].command == "systemctl");
    CHECK(errors[0].message == "list-timers: exit status 1");
}

TEST_CASE("error ring keeps only the newest entries") {
    ErrorRing ring("journalctl");
    for (size_t i = 0; i < ErrorRing::kMaxErrors + 3; ++i) {
        ring.add(std::format("failure {}", i));
    }

    auto errors = ring.recent();
    REQUIRE(errors.size() == ErrorRing::kMaxErrors);
    CHECK(errors.front().message == "failure 3");
    CHECK(errors.back().message == std::format("failure {}", ErrorRing::kMaxErrors + 2));
}

TEST_CASE("empty error ring reports nothing") {
    ErrorRing ring("systemctl");
    CHECK(ring.recent().empty());
}
