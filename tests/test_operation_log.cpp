#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include "operation_log.hpp"

TEST_CASE("OperationLog evicts the oldest entries beyond capacity") {
    OperationLog log;
    for (int i = 0; i < 105; ++i) {
        log.append("op" + std::to_string(i), {{"index", std::to_string(i)}});
    }

    REQUIRE(log.size() == OperationLog::kDefaultCapacity);
    const auto entries = log.entries();
    REQUIRE(entries.front().operation == "op5");
    REQUIRE(entries.back().operation == "op104");
    REQUIRE(entries.back().details.at("index") == "104");
}

TEST_CASE("OperationLog keeps entries in append order with timestamps") {
    OperationLog log(3);
    log.append("connect", {{"status", "success"}});
    log.append("takeoff", {{"status", "success"}});

    const auto entries = log.entries();
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].operation == "connect");
    REQUIRE(entries[1].operation == "takeoff");
    REQUIRE(entries[0].timestamp <= entries[1].timestamp);
}

TEST_CASE("OperationLog rejects zero capacity") {
    REQUIRE_THROWS_AS(OperationLog(0), std::invalid_argument);
}
