/**
 * @file record_store.hpp
 * @brief JSON document store for users, vehicles and bookings
 *
 * The whole document lives in one JSON file:
 * @code
 * {
 *   "users": [ { "id": "u1", "email": "..." } ],
 *   "vehicles": [ ... ],
 *   "bookings": [ ... ]
 * }
 * @endcode
 * It is loaded once by open(), kept in memory, and rewritten atomically
 * after every change.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <thumbcache/core/result.hpp>

#include <array>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace thumbcache::storage {

/**
 * @brief Collections held by the record store
 */
enum class collection {
    users,
    vehicles,
    bookings
};

/// All collections in document order
inline constexpr std::array<collection, 3> all_collections = {
    collection::users, collection::vehicles, collection::bookings};

/**
 * @brief Document key of a collection ("users", "vehicles", "bookings")
 */
[[nodiscard]] auto collection_name(collection c) -> std::string_view;

/**
 * @brief Singular display name ("User", "Vehicle", "Booking")
 */
[[nodiscard]] auto record_label(collection c) -> std::string_view;

/**
 * @brief Prefix of generated ids ("u", "v", "b")
 */
[[nodiscard]] auto id_prefix(collection c) -> std::string_view;

/**
 * @brief Query parameters accepted as equality filters by list()
 *
 * users: email; vehicles: provider_id; bookings: user_id, vehicle_id
 */
[[nodiscard]] auto filter_fields(collection c) -> std::vector<std::string_view>;

/**
 * @brief Resolve a collection from its document key
 */
[[nodiscard]] auto parse_collection(std::string_view name)
    -> std::optional<collection>;

/**
 * @brief Configuration for record_store
 */
struct record_store_config {
    /// Path of the JSON document
    std::filesystem::path path{"db.json"};
};

/**
 * @class record_store
 * @brief Key-based JSON collections persisted in a single file
 *
 * Records are JSON objects identified by their string `id` member. Bodies
 * are stored verbatim; only `id` is ever added by the store.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @par Example
 * @code
 * record_store store(record_store_config{"db.json"});
 * if (store.open().is_ok()) {
 *     auto created = store.create(collection::bookings,
 *                                 R"({"user_id":"u1","vehicle_id":"v2"})");
 *     auto bookings = store.list(collection::bookings, {{"user_id", "u1"}});
 * }
 * @endcode
 */
class record_store {
public:
    using filter_map = std::map<std::string, std::string>;

    explicit record_store(record_store_config config);

    /// Non-copyable
    record_store(const record_store&) = delete;
    auto operator=(const record_store&) -> record_store& = delete;

    /**
     * @brief Load the document from disk
     *
     * A missing file yields an empty document.
     *
     * @return Success, or store_io_error when the file cannot be read or
     *         is not a JSON object of arrays
     */
    [[nodiscard]] auto open() -> VoidResult;

    /**
     * @brief List records matching all filters
     *
     * Filters on fields not listed by filter_fields() and filters with an
     * empty value are ignored.
     *
     * @return JSON array text
     */
    [[nodiscard]] auto list(collection c, const filter_map& filters = {}) const
        -> Result<std::string>;

    /**
     * @brief Get one record by id
     * @return JSON object text, or record_not_found
     */
    [[nodiscard]] auto get(collection c, std::string_view id) const
        -> Result<std::string>;

    /**
     * @brief Append a record
     *
     * When the body has no `id` member, `<prefix><n>` is assigned with the
     * smallest n >= 1 not used by the collection.
     *
     * @param body JSON object text
     * @return The stored record, invalid_record, or store_io_error
     */
    [[nodiscard]] auto create(collection c, std::string_view body)
        -> Result<std::string>;

    /**
     * @brief Replace a record with a new body
     * @return The stored record, record_not_found, invalid_record, or
     *         store_io_error
     */
    [[nodiscard]] auto replace(collection c, std::string_view id,
                               std::string_view body) -> Result<std::string>;

    /**
     * @brief Remove every record with an id
     *
     * Removing an unknown id succeeds without writing.
     */
    [[nodiscard]] auto remove(collection c, std::string_view id) -> VoidResult;

    /**
     * @brief Number of records in a collection
     */
    [[nodiscard]] auto size(collection c) const -> std::size_t;

    /**
     * @brief Path of the backing document
     */
    [[nodiscard]] auto path() const -> const std::filesystem::path&;

private:
    struct record {
        /// Compact JSON text, member order preserved
        std::string json;

        /// Top-level string members, used for id lookup and filters
        std::unordered_map<std::string, std::string> strings;

        [[nodiscard]] auto id() const -> const std::string*;
    };

    [[nodiscard]] auto records(collection c) -> std::vector<record>&;
    [[nodiscard]] auto records(collection c) const -> const std::vector<record>&;

    /// Smallest unused `<prefix><n>` id
    [[nodiscard]] auto next_id(collection c) const -> std::string;

    /// Rewrite the document file (caller holds mutex_)
    [[nodiscard]] auto save() const -> VoidResult;

    record_store_config config_;
    mutable std::mutex mutex_;
    std::array<std::vector<record>, all_collections.size()> collections_;

    /// Top-level members other than the known collections, as compact JSON
    std::vector<std::pair<std::string, std::string>> extra_members_;
};

}  // namespace thumbcache::storage
