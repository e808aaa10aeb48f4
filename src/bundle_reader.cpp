#include "bundle_reader.hpp"
#include "trace.hpp"
#include <nlohmann/json.hpp>
#include <fmt/core.h>

using json = nlohmann::json;

namespace reprint {

BundleReader::BundleReader(const std::string& bundle_path)
    : db_(nullptr), bundle_path_(bundle_path) {
    int result = sqlite3_open_v2(bundle_path.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (result != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw BundleReaderError(fmt::format("Failed to open bundle file '{}': {}", bundle_path, error));
    }
}

BundleReader::~BundleReader() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void BundleReader::check_sqlite_result(int result, const std::string& operation) {
    if (result != SQLITE_OK && result != SQLITE_ROW && result != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        throw BundleReaderError(fmt::format("{}: {}", operation, error));
    }
}

std::vector<TypeRow> BundleReader::get_type_rows() {
    std::vector<TypeRow> rows;
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT type_hash, kind, type_name, shape FROM types ORDER BY rowid";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare types query");

    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        TypeRow row;
        // SQLite integers are signed; hashes keep their bit pattern.
        row.type_hash = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        const unsigned char* text;

        text = sqlite3_column_text(stmt, 1);
        row.kind = text ? reinterpret_cast<const char*>(text) : "";

        text = sqlite3_column_text(stmt, 2);
        row.type_name = text ? reinterpret_cast<const char*>(text) : "";

        text = sqlite3_column_text(stmt, 3);
        row.shape = text ? reinterpret_cast<const char*>(text) : "";

        rows.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);
    check_sqlite_result(result, "Failed to execute types query");

    return rows;
}

size_t BundleReader::load_types(HashedTypeTable& table) {
    std::vector<TypeRow> rows = get_type_rows();
    for (const auto& row : rows) {
        if constexpr (TRACE_BUNDLE_READER) {
            fmt::print(stderr, "Loading type {} ({}) from {}\n", row.type_name, row.kind, bundle_path_);
        }
        register_type_row(table, row);
    }
    return rows.size();
}

std::vector<std::string> BundleReader::get_value_names() {
    std::vector<std::string> names;
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT id_name FROM \"values\" ORDER BY rowid";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare values query");

    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* idname = sqlite3_column_text(stmt, 0);
        if (idname) {
            names.emplace_back(reinterpret_cast<const char*>(idname));
        }
    }

    sqlite3_finalize(stmt);
    check_sqlite_result(result, "Failed to execute values query");

    return names;
}

std::string BundleReader::get_value(const std::string& idname) {
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT value FROM \"values\" WHERE id_name = ?";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare value query");

    result = sqlite3_bind_text(stmt, 1, idname.c_str(), -1, SQLITE_TRANSIENT);
    if (result != SQLITE_OK) {
        sqlite3_finalize(stmt);
        check_sqlite_result(result, "Failed to bind parameter");
    }

    result = sqlite3_step(stmt);
    if (result != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        check_sqlite_result(result, "Failed to read value");
        throw BundleReaderError(fmt::format("Value not found: {}", idname));
    }

    const unsigned char* text = sqlite3_column_text(stmt, 0);
    std::string value = text ? reinterpret_cast<const char*>(text) : "";

    sqlite3_finalize(stmt);
    return value;
}

static std::vector<std::string> read_names(const json& j, const std::string& context) {
    if (!j.is_array()) {
        throw BundleReaderError(fmt::format("{}: expected an array of field names", context));
    }
    std::vector<std::string> names;
    for (const auto& name : j) {
        names.push_back(name.get<std::string>());
    }
    return names;
}

void register_type_row(HashedTypeTable& table, const TypeRow& row) {
    try {
        json shape = json::parse(row.shape);
        if (row.kind == "record") {
            table.add_record(row.type_hash, row.type_name, read_names(shape, row.type_name));
        } else if (row.kind == "enum") {
            if (!shape.is_array()) {
                throw BundleReaderError(fmt::format("{}: expected an array of variants", row.type_name));
            }
            std::vector<VariantSpec> variants;
            for (const auto& v : shape) {
                VariantSpec spec;
                spec.variant_id = v.at("id").get<uint32_t>();
                spec.name = v.at("name").get<std::string>();
                if (v.contains("fields")) {
                    spec.record_fields = read_names(v.at("fields"), spec.name);
                }
                if (v.contains("arity")) {
                    spec.arity = v.at("arity").get<uint32_t>();
                } else {
                    spec.arity = spec.record_fields ? static_cast<uint32_t>(spec.record_fields->size()) : 0;
                }
                variants.push_back(std::move(spec));
            }
            table.add_sum_type(row.type_hash, row.type_name, variants);
        } else {
            throw BundleReaderError(fmt::format("Unknown type kind '{}' for {}", row.kind, row.type_name));
        }
    } catch (const json::exception& e) {
        throw BundleReaderError(fmt::format("Bad shape for type {}: {}", row.type_name, e.what()));
    }
}

} // namespace reprint
