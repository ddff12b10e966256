#include <catch2/catch_test_macros.hpp>
#include "rewind/core/uuid.hpp"

#include <set>

using namespace rewindkit::core;

TEST_CASE("UUID generation", "[uuid]") {
    auto uuid1 = UUID::generate();
    auto uuid2 = UUID::generate();

    REQUIRE(uuid1.to_string() != uuid2.to_string());
    REQUIRE(uuid1.to_string().length() == 36);  // Standard UUID format
}

TEST_CASE("UUID uniqueness", "[uuid]") {
    std::set<std::string> uuids;

    for (int i = 0; i < 1000; ++i) {
        uuids.insert(UUID::generate().to_string());
    }

    REQUIRE(uuids.size() == 1000);
}

TEST_CASE("UUID from string", "[uuid]") {
    std::string uuid_str = "550e8400-e29b-41d4-a716-446655440000";
    auto uuid = UUID::from_string(uuid_str);

    REQUIRE(uuid.is_valid());
    REQUIRE(uuid.to_string() == uuid_str);
}

TEST_CASE("UUID invalid string", "[uuid]") {
    auto uuid = UUID::from_string("not-a-valid-uuid");

    REQUIRE_FALSE(uuid.is_valid());
}

TEST_CASE("Base36 encoding", "[uuid]") {
    REQUIRE(to_base36(0) == "0");
    REQUIRE(to_base36(35) == "z");
    REQUIRE(to_base36(36) == "10");
    REQUIRE(to_base36(1700000000000ULL) == "loyw3v28");
}

TEST_CASE("Snapshot id format", "[uuid]") {
    auto id = generate_snapshot_id(from_epoch_ms(1700000000000));

    REQUIRE(id.rfind("snap-loyw3v28-", 0) == 0);
    REQUIRE(id.size() == std::string("snap-loyw3v28-").size() + 5);
    REQUIRE(generate_snapshot_id() != generate_snapshot_id());
}

TEST_CASE("Document id format", "[uuid]") {
    auto id = generate_document_id();

    REQUIRE(id.rfind("doc_", 0) == 0);
    REQUIRE(id.size() == 12);
}
