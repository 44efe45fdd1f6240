/**
 * @file record_store.cpp
 * @brief Implementation of the JSON document record store
 */

#include "crow/json.h"

#include <thumbcache/storage/record_store.hpp>
#include <thumbcache/web/rest_types.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <iterator>
#include <random>
#include <set>

namespace thumbcache::storage {

namespace {

using crow::json::rvalue;

constexpr int kDocumentIndent = 2;

auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." +
                     std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

void write_number(std::string& out, const rvalue& value) {
    switch (value.nt()) {
        case crow::json::num_type::Signed_integer:
            out += std::to_string(value.i());
            return;
        case crow::json::num_type::Unsigned_integer:
            out += std::to_string(value.u());
            return;
        default: {
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value.d());
            if (ec == std::errc{}) {
                out.append(buf, ptr);
            } else {
                out += "null";
            }
            return;
        }
    }
}

void write_string(std::string& out, const std::string& value) {
    out += '"';
    out += web::json_escape(value);
    out += '"';
}

void write_break(std::string& out, int indent, int depth) {
    out += '\n';
    out.append(static_cast<std::size_t>(indent * depth), ' ');
}

/**
 * @brief Serialize a parsed value, keeping member order
 *
 * indent < 0 writes one line with ", " and ": " separators; otherwise
 * nested values go on their own lines indented by `indent` spaces.
 */
void write_json(std::string& out, const rvalue& value, int indent, int depth) {
    switch (value.t()) {
        case crow::json::type::Null:
            out += "null";
            break;
        case crow::json::type::False:
            out += "false";
            break;
        case crow::json::type::True:
            out += "true";
            break;
        case crow::json::type::Number:
            write_number(out, value);
            break;
        case crow::json::type::String:
            write_string(out, std::string(value.s()));
            break;
        case crow::json::type::List:
        case crow::json::type::Object: {
            const bool is_object = value.t() == crow::json::type::Object;
            out += is_object ? '{' : '[';
            bool first = true;
            for (const auto& child : value) {
                if (!first) out += indent < 0 ? ", " : ",";
                first = false;
                if (indent >= 0) write_break(out, indent, depth + 1);
                if (is_object) {
                    write_string(out, child.key());
                    out += ": ";
                }
                write_json(out, child, indent, depth + 1);
            }
            if (!first && indent >= 0) write_break(out, indent, depth);
            out += is_object ? '}' : ']';
            break;
        }
        default:
            out += "null";
            break;
    }
}

auto to_compact(const rvalue& value) -> std::string {
    std::string out;
    write_json(out, value, -1, 0);
    return out;
}

auto invalid_body() -> Result<std::string> {
    return thumbcache_error<std::string>(error_codes::invalid_record,
                                         "Invalid JSON body");
}

}  // namespace

// ============================================================================
// Collection metadata
// ============================================================================

auto collection_name(collection c) -> std::string_view {
    switch (c) {
        case collection::users:
            return "users";
        case collection::vehicles:
            return "vehicles";
        case collection::bookings:
            return "bookings";
    }
    return "";
}

auto record_label(collection c) -> std::string_view {
    switch (c) {
        case collection::users:
            return "User";
        case collection::vehicles:
            return "Vehicle";
        case collection::bookings:
            return "Booking";
    }
    return "Record";
}

auto id_prefix(collection c) -> std::string_view {
    switch (c) {
        case collection::users:
            return "u";
        case collection::vehicles:
            return "v";
        case collection::bookings:
            return "b";
    }
    return "r";
}

auto filter_fields(collection c) -> std::vector<std::string_view> {
    switch (c) {
        case collection::users:
            return {"email"};
        case collection::vehicles:
            return {"provider_id"};
        case collection::bookings:
            return {"user_id", "vehicle_id"};
    }
    return {};
}

auto parse_collection(std::string_view name) -> std::optional<collection> {
    for (auto c : all_collections) {
        if (collection_name(c) == name) {
            return c;
        }
    }
    return std::nullopt;
}

// ============================================================================
// record
// ============================================================================

auto record_store::record::id() const -> const std::string* {
    auto it = strings.find("id");
    return it != strings.end() ? &it->second : nullptr;
}

namespace {

template <typename Record>
auto make_record(const rvalue& value) -> Record {
    Record rec;
    rec.json = to_compact(value);
    if (value.t() == crow::json::type::Object) {
        for (const auto& member : value) {
            if (member.t() == crow::json::type::String) {
                rec.strings.insert_or_assign(member.key(),
                                             std::string(member.s()));
            }
        }
    }
    return rec;
}

auto has_member(const rvalue& object, std::string_view key) -> bool {
    for (const auto& member : object) {
        if (member.key() == key) {
            return true;
        }
    }
    return false;
}

}  // namespace

// ============================================================================
// Construction and loading
// ============================================================================

record_store::record_store(record_store_config config)
    : config_(std::move(config)) {}

auto record_store::open() -> VoidResult {
    std::lock_guard lock(mutex_);

    for (auto& records : collections_) {
        records.clear();
    }
    extra_members_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(config_.path, ec)) {
        return ok();
    }

    std::ifstream file(config_.path, std::ios::binary);
    if (!file) {
        return thumbcache_void_error(error_codes::store_io_error,
                                     "Failed to open record document",
                                     config_.path.string());
    }
    std::string text{std::istreambuf_iterator<char>(file),
                     std::istreambuf_iterator<char>()};

    auto document = crow::json::load(text);
    if (!document || document.t() != crow::json::type::Object) {
        return thumbcache_void_error(error_codes::store_io_error,
                                     "Record document is not a JSON object",
                                     config_.path.string());
    }

    for (const auto& member : document) {
        auto name = member.key();
        auto c = parse_collection(name);
        if (!c) {
            extra_members_.emplace_back(name, to_compact(member));
            continue;
        }
        if (member.t() != crow::json::type::List) {
            return thumbcache_void_error(error_codes::store_io_error,
                                         "Collection is not a JSON array",
                                         name);
        }
        auto& target = records(*c);
        for (const auto& element : member) {
            target.push_back(make_record<record>(element));
        }
    }

    return ok();
}

// ============================================================================
// Queries
// ============================================================================

auto record_store::list(collection c, const filter_map& filters) const
    -> Result<std::string> {
    std::vector<std::pair<std::string, std::string>> active;
    for (auto field : filter_fields(c)) {
        auto it = filters.find(std::string(field));
        if (it != filters.end() && !it->second.empty()) {
            active.emplace_back(it->first, it->second);
        }
    }

    std::lock_guard lock(mutex_);

    std::string out = "[";
    bool first = true;
    for (const auto& rec : records(c)) {
        bool matches = std::all_of(
            active.begin(), active.end(), [&rec](const auto& filter) {
                auto it = rec.strings.find(filter.first);
                return it != rec.strings.end() && it->second == filter.second;
            });
        if (!matches) {
            continue;
        }
        if (!first) out += ", ";
        first = false;
        out += rec.json;
    }
    out += "]";
    return out;
}

auto record_store::get(collection c, std::string_view id) const
    -> Result<std::string> {
    std::lock_guard lock(mutex_);

    for (const auto& rec : records(c)) {
        const auto* rec_id = rec.id();
        if (rec_id && *rec_id == id) {
            return rec.json;
        }
    }
    return thumbcache_error<std::string>(
        error_codes::record_not_found,
        std::string(record_label(c)) + " not found", std::string(id));
}

auto record_store::size(collection c) const -> std::size_t {
    std::lock_guard lock(mutex_);
    return records(c).size();
}

auto record_store::path() const -> const std::filesystem::path& {
    return config_.path;
}

// ============================================================================
// Mutations
// ============================================================================

auto record_store::create(collection c, std::string_view body)
    -> Result<std::string> {
    auto value = crow::json::load(body.data(), body.size());
    if (!value || value.t() != crow::json::type::Object) {
        return invalid_body();
    }

    std::lock_guard lock(mutex_);

    auto rec = make_record<record>(value);
    if (!has_member(value, "id")) {
        auto id = next_id(c);
        if (rec.json == "{}") {
            rec.json = "{\"id\": \"" + id + "\"}";
        } else {
            rec.json.pop_back();
            rec.json += ", \"id\": \"" + id + "\"}";
        }
        rec.strings.insert_or_assign("id", id);
    }

    auto& target = records(c);
    target.push_back(rec);

    auto saved = save();
    if (saved.is_err()) {
        target.pop_back();
        return Result<std::string>(saved.error());
    }
    return rec.json;
}

auto record_store::replace(collection c, std::string_view id,
                           std::string_view body) -> Result<std::string> {
    auto value = crow::json::load(body.data(), body.size());
    if (!value || value.t() != crow::json::type::Object) {
        return invalid_body();
    }

    std::lock_guard lock(mutex_);

    auto& target = records(c);
    auto it = std::find_if(target.begin(), target.end(), [id](const record& r) {
        const auto* rec_id = r.id();
        return rec_id && *rec_id == id;
    });
    if (it == target.end()) {
        return thumbcache_error<std::string>(
            error_codes::record_not_found,
            std::string(record_label(c)) + " not found", std::string(id));
    }

    auto previous = std::move(*it);
    *it = make_record<record>(value);

    auto saved = save();
    if (saved.is_err()) {
        *it = std::move(previous);
        return Result<std::string>(saved.error());
    }
    return it->json;
}

auto record_store::remove(collection c, std::string_view id) -> VoidResult {
    std::lock_guard lock(mutex_);

    auto& target = records(c);
    auto previous = target;
    auto removed = std::remove_if(target.begin(), target.end(),
                                  [id](const record& r) {
                                      const auto* rec_id = r.id();
                                      return rec_id && *rec_id == id;
                                  });
    if (removed == target.end()) {
        return ok();
    }
    target.erase(removed, target.end());

    auto saved = save();
    if (saved.is_err()) {
        target = std::move(previous);
        return saved;
    }
    return ok();
}

// ============================================================================
// Internals
// ============================================================================

auto record_store::records(collection c) -> std::vector<record>& {
    return collections_[static_cast<std::size_t>(c)];
}

auto record_store::records(collection c) const -> const std::vector<record>& {
    return collections_[static_cast<std::size_t>(c)];
}

auto record_store::next_id(collection c) const -> std::string {
    std::set<std::string, std::less<>> used;
    for (const auto& rec : records(c)) {
        if (const auto* rec_id = rec.id()) {
            used.insert(*rec_id);
        }
    }

    const std::string prefix(id_prefix(c));
    for (std::size_t counter = 1;; ++counter) {
        auto candidate = prefix + std::to_string(counter);
        if (used.find(candidate) == used.end()) {
            return candidate;
        }
    }
}

auto record_store::save() const -> VoidResult {
    std::string out = "{";
    bool first = true;

    auto begin_member = [&](const std::string& key) {
        if (!first) out += ",";
        first = false;
        write_break(out, kDocumentIndent, 1);
        write_string(out, key);
        out += ": ";
    };

    for (auto c : all_collections) {
        begin_member(std::string(collection_name(c)));
        const auto& items = records(c);
        if (items.empty()) {
            out += "[]";
            continue;
        }
        out += "[";
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) out += ",";
            write_break(out, kDocumentIndent, 2);
            auto value = crow::json::load(items[i].json);
            if (!value) {
                return thumbcache_void_error(error_codes::store_io_error,
                                             "Corrupt in-memory record",
                                             items[i].json);
            }
            write_json(out, value, kDocumentIndent, 2);
        }
        write_break(out, kDocumentIndent, 1);
        out += "]";
    }

    for (const auto& [key, json] : extra_members_) {
        begin_member(key);
        auto value = crow::json::load(json);
        if (!value) {
            return thumbcache_void_error(error_codes::store_io_error,
                                         "Corrupt in-memory member", key);
        }
        write_json(out, value, kDocumentIndent, 1);
    }

    write_break(out, kDocumentIndent, 0);
    out += "}";

    auto parent = config_.path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    auto temp_path = generate_temp_filename(config_.path);
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return thumbcache_void_error(error_codes::store_io_error,
                                         "Failed to create temp file",
                                         temp_path.string());
        }
        file.write(out.data(), static_cast<std::streamsize>(out.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return thumbcache_void_error(error_codes::store_io_error,
                                         "Failed to write record document",
                                         temp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, config_.path, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
        return thumbcache_void_error(error_codes::store_io_error,
                                     "Failed to rename temp file: " + ec.message());
    }

    return ok();
}

}  // namespace thumbcache::storage
