#include <catch2/catch_test_macros.hpp>
#include "rewind/core/result.hpp"

#include <stdexcept>
#include <string>
#include <utility>

using namespace rewindkit::core;

TEST_CASE("Result with value", "[result]") {
    auto result = Result<int, std::string>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.value() == 42);
}

TEST_CASE("Result with error", "[result]") {
    auto result = Result<int, std::string>::err("something went wrong");

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.error() == "something went wrong");
}

TEST_CASE("Result void success", "[result]") {
    auto result = Result<void, std::string>::ok();

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
}

TEST_CASE("Result void error", "[result]") {
    auto result = Result<void, Error>::err(ErrorCode::StoreNotOpen, "closed", "rewind.state");

    REQUIRE(result.is_err());
    REQUIRE(result.error().code == ErrorCode::StoreNotOpen);
    REQUIRE(result.error().full_message() == "closed [rewind.state]");
}

TEST_CASE("Result accessors on the wrong side throw", "[result]") {
    REQUIRE_THROWS_AS((Result<int, Error>::err(ErrorCode::Unknown).value()), std::runtime_error);
    REQUIRE_THROWS_AS((Result<int, Error>::ok(1).error()), std::runtime_error);
    REQUIRE_THROWS_AS((Result<void, Error>::ok().error()), std::runtime_error);
}

TEST_CASE("Result moves out of an rvalue", "[result]") {
    auto text = Result<std::string, Error>::ok(std::string(64, 'x'));
    std::string taken = std::move(text).value();
    REQUIRE(taken.size() == 64);

    auto failed = Result<std::string, Error>::err(ErrorCode::QuotaExceeded, "full", "rewind.documents");
    Error error = std::move(failed).error();
    REQUIRE(error.is_quota_exceeded());
    REQUIRE(error.context == "rewind.documents");
}

TEST_CASE("Error classification", "[result]") {
    REQUIRE(Error{ErrorCode::QuotaExceeded}.is_persistence_error());
    REQUIRE(Error{ErrorCode::MediumUnavailable}.is_persistence_error());
    REQUIRE_FALSE(Error{ErrorCode::SnapshotNotFound}.is_persistence_error());
    REQUIRE(Error{ErrorCode::SnapshotNotFound}.is_not_found());
    REQUIRE(Error{ErrorCode::DocumentNotFound}.is_not_found());
    REQUIRE_FALSE(Error{ErrorCode::RollbackWriteFailed}.is_not_found());

    Error e{ErrorCode::RollbackWriteFailed, "write failed", "snap-1"};
    e.with_source("snapshot_manager");
    REQUIRE(e.full_message() == "write failed [snap-1] at snapshot_manager");
}
