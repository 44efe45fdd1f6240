/**
 * @file record_store_test.cpp
 * @brief Unit tests for record_store class
 *
 * Tests the JSON document store behind the users, vehicles and bookings
 * collections.
 */

#include <thumbcache/storage/record_store.hpp>

#include "../fixtures/test_images.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace thumbcache;
using namespace thumbcache::storage;
using thumbcache::testing::temp_directory;

namespace {

auto read_file(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << text;
}

}  // namespace

// ============================================================================
// Collection metadata
// ============================================================================

TEST_CASE("record_store: collection metadata", "[storage][record_store]") {
    CHECK(collection_name(collection::users) == "users");
    CHECK(collection_name(collection::vehicles) == "vehicles");
    CHECK(collection_name(collection::bookings) == "bookings");

    CHECK(record_label(collection::users) == "User");
    CHECK(record_label(collection::vehicles) == "Vehicle");
    CHECK(record_label(collection::bookings) == "Booking");

    CHECK(id_prefix(collection::users) == "u");
    CHECK(id_prefix(collection::vehicles) == "v");
    CHECK(id_prefix(collection::bookings) == "b");

    CHECK(parse_collection("vehicles") == collection::vehicles);
    CHECK_FALSE(parse_collection("cars").has_value());

    CHECK(filter_fields(collection::bookings).size() == 2);
}

// ============================================================================
// Loading
// ============================================================================

TEST_CASE("record_store: open", "[storage][record_store]") {
    temp_directory temp_dir;
    auto path = temp_dir.path() / "db.json";

    SECTION("a missing file is an empty document") {
        record_store store(record_store_config{path});
        REQUIRE(store.open().is_ok());
        CHECK(store.size(collection::users) == 0);
        CHECK(store.list(collection::users).value() == "[]");
        CHECK_FALSE(std::filesystem::exists(path));
    }

    SECTION("existing records are loaded") {
        write_file(path, R"({
  "users": [{"id": "u1", "name": "Ann", "email": "ann@example.com"}],
  "vehicles": [{"id": "v1", "provider_id": "u1", "seats": 4}]
})");
        record_store store(record_store_config{path});
        REQUIRE(store.open().is_ok());
        CHECK(store.size(collection::users) == 1);
        CHECK(store.size(collection::vehicles) == 1);
        CHECK(store.size(collection::bookings) == 0);

        auto vehicle = store.get(collection::vehicles, "v1");
        REQUIRE(vehicle.is_ok());
        CHECK(vehicle.value() == R"({"id": "v1", "provider_id": "u1", "seats": 4})");
    }

    SECTION("malformed documents are rejected") {
        write_file(path, "{not json");
        record_store store(record_store_config{path});
        auto result = store.open();
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::store_io_error);
    }

    SECTION("collections must be arrays") {
        write_file(path, R"({"users": {"id": "u1"}})");
        record_store store(record_store_config{path});
        auto result = store.open();
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::store_io_error);
    }
}

// ============================================================================
// CRUD
// ============================================================================

TEST_CASE("record_store: create", "[storage][record_store]") {
    temp_directory temp_dir;
    record_store store(record_store_config{temp_dir.path() / "db.json"});
    REQUIRE(store.open().is_ok());

    SECTION("ids are assigned when missing") {
        auto first = store.create(collection::users, R"({"name":"Ann"})");
        auto second = store.create(collection::users, R"({"name":"Bob"})");
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        CHECK(first.value() == R"({"name": "Ann", "id": "u1"})");
        CHECK(second.value() == R"({"name": "Bob", "id": "u2"})");
    }

    SECTION("explicit ids are kept") {
        auto created = store.create(collection::vehicles, R"({"id":"v9","seats":2})");
        REQUIRE(created.is_ok());
        CHECK(created.value() == R"({"id": "v9", "seats": 2})");
        CHECK(store.get(collection::vehicles, "v9").is_ok());
    }

    SECTION("generated ids skip used ones") {
        REQUIRE(store.create(collection::bookings, R"({"id":"b1"})").is_ok());
        auto created = store.create(collection::bookings, R"({})");
        REQUIRE(created.is_ok());
        CHECK(created.value() == R"({"id": "b2"})");
    }

    SECTION("bodies must be JSON objects") {
        for (const char* body : {"", "not json", "[1, 2]", "\"text\"", "42"}) {
            INFO("body = " << body);
            auto result = store.create(collection::users, body);
            REQUIRE(result.is_err());
            CHECK(result.error().code == error_codes::invalid_record);
            CHECK(result.error().message == "Invalid JSON body");
        }
        CHECK(store.size(collection::users) == 0);
    }
}

TEST_CASE("record_store: get, replace and remove", "[storage][record_store]") {
    temp_directory temp_dir;
    record_store store(record_store_config{temp_dir.path() / "db.json"});
    REQUIRE(store.open().is_ok());
    REQUIRE(store.create(collection::users, R"({"name":"Ann","email":"ann@example.com"})")
                .is_ok());

    SECTION("get") {
        auto found = store.get(collection::users, "u1");
        REQUIRE(found.is_ok());
        CHECK(found.value() == R"({"name": "Ann", "email": "ann@example.com", "id": "u1"})");

        auto missing = store.get(collection::users, "u404");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == error_codes::record_not_found);
        CHECK(missing.error().message == "User not found");
    }

    SECTION("replace") {
        auto replaced = store.replace(collection::users, "u1",
                                      R"({"id":"u1","name":"Anne"})");
        REQUIRE(replaced.is_ok());
        CHECK(replaced.value() == R"({"id": "u1", "name": "Anne"})");
        CHECK(store.get(collection::users, "u1").value() ==
              R"({"id": "u1", "name": "Anne"})");

        auto missing = store.replace(collection::vehicles, "v1", R"({"id":"v1"})");
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == error_codes::record_not_found);
        CHECK(missing.error().message == "Vehicle not found");

        auto invalid = store.replace(collection::users, "u1", "[]");
        REQUIRE(invalid.is_err());
        CHECK(invalid.error().code == error_codes::invalid_record);
    }

    SECTION("remove") {
        REQUIRE(store.remove(collection::users, "u1").is_ok());
        CHECK(store.size(collection::users) == 0);
        CHECK(store.get(collection::users, "u1").is_err());

        // Removing an unknown id is not an error
        CHECK(store.remove(collection::users, "u1").is_ok());
    }
}

TEST_CASE("record_store: filtered listing", "[storage][record_store]") {
    temp_directory temp_dir;
    record_store store(record_store_config{temp_dir.path() / "db.json"});
    REQUIRE(store.open().is_ok());

    REQUIRE(store.create(collection::bookings,
                         R"({"user_id":"u1","vehicle_id":"v1"})").is_ok());
    REQUIRE(store.create(collection::bookings,
                         R"({"user_id":"u2","vehicle_id":"v1"})").is_ok());
    REQUIRE(store.create(collection::bookings,
                         R"({"user_id":"u1","vehicle_id":"v2"})").is_ok());

    SECTION("no filters") {
        auto all = store.list(collection::bookings);
        REQUIRE(all.is_ok());
        CHECK(all.value().find("\"b3\"") != std::string::npos);
    }

    SECTION("single filter") {
        auto listed = store.list(collection::bookings, {{"user_id", "u2"}});
        REQUIRE(listed.is_ok());
        CHECK(listed.value() == R"([{"user_id": "u2", "vehicle_id": "v1", "id": "b2"}])");
    }

    SECTION("filters combine") {
        auto listed = store.list(collection::bookings,
                                 {{"user_id", "u1"}, {"vehicle_id", "v2"}});
        REQUIRE(listed.is_ok());
        CHECK(listed.value() == R"([{"user_id": "u1", "vehicle_id": "v2", "id": "b3"}])");
    }

    SECTION("unknown fields and empty values are ignored") {
        auto listed = store.list(collection::bookings,
                                 {{"status", "x"}, {"user_id", ""}});
        REQUIRE(listed.is_ok());
        CHECK(listed.value() == store.list(collection::bookings).value());
    }

    SECTION("no match") {
        auto listed = store.list(collection::bookings, {{"vehicle_id", "v9"}});
        REQUIRE(listed.is_ok());
        CHECK(listed.value() == "[]");
    }
}

// ============================================================================
// Persistence
// ============================================================================

TEST_CASE("record_store: document file", "[storage][record_store]") {
    temp_directory temp_dir;
    auto path = temp_dir.path() / "data" / "db.json";

    {
        record_store store(record_store_config{path});
        REQUIRE(store.open().is_ok());
        REQUIRE(store.create(collection::users, R"({"name":"Ann"})").is_ok());
    }

    SECTION("the document is pretty-printed with every collection") {
        CHECK(read_file(path) ==
              "{\n"
              "  \"users\": [\n"
              "    {\n"
              "      \"name\": \"Ann\",\n"
              "      \"id\": \"u1\"\n"
              "    }\n"
              "  ],\n"
              "  \"vehicles\": [],\n"
              "  \"bookings\": []\n"
              "}");
    }

    SECTION("a new instance sees the records") {
        record_store reopened(record_store_config{path});
        REQUIRE(reopened.open().is_ok());
        CHECK(reopened.get(collection::users, "u1").value() ==
              R"({"name": "Ann", "id": "u1"})");
    }
}

TEST_CASE("record_store: unknown top-level members are preserved",
          "[storage][record_store]") {
    temp_directory temp_dir;
    auto path = temp_dir.path() / "db.json";
    write_file(path, R"({"users": [], "schema": {"version": 2}})");

    record_store store(record_store_config{path});
    REQUIRE(store.open().is_ok());
    REQUIRE(store.create(collection::vehicles, R"({"seats":5})").is_ok());

    auto text = read_file(path);
    CHECK(text.find("\"schema\": {") != std::string::npos);
    CHECK(text.find("\"version\": 2") != std::string::npos);
    CHECK(text.find("\"seats\": 5") != std::string::npos);
}
