#ifndef BUNDLE_READER_HPP
#define BUNDLE_READER_HPP

#include "type_registry.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <stdexcept>

namespace reprint {

class BundleReaderError : public std::runtime_error {
public:
    explicit BundleReaderError(const std::string& msg) : std::runtime_error(msg) {}
};

// Represents a row from the types table.
struct TypeRow {
    uint64_t type_hash;
    std::string kind;       // "record" or "enum".
    std::string type_name;
    std::string shape;      // JSON-encoded field list or variant list.
};

// Reads type metadata and value descriptions from an SQLite bundle.
//
// Schema:
//   types(type_hash INTEGER, kind TEXT, type_name TEXT, shape TEXT)
//   "values"(id_name TEXT, value TEXT)
class BundleReader {
private:
    sqlite3* db_;
    std::string bundle_path_;

    // Helper to execute queries and handle errors.
    void check_sqlite_result(int result, const std::string& operation);

public:
    explicit BundleReader(const std::string& bundle_path);
    ~BundleReader();

    // Disable copy, we own the SQLite handle.
    BundleReader(const BundleReader&) = delete;
    BundleReader& operator=(const BundleReader&) = delete;

    // All rows of the types table.
    std::vector<TypeRow> get_type_rows();

    // Register every type in the bundle. Returns the number registered.
    size_t load_types(HashedTypeTable& table);

    // Names of all value descriptions, in insertion order.
    std::vector<std::string> get_value_names();

    // JSON value description by name.
    std::string get_value(const std::string& idname);
};

// Register one type row; shape must match the kind.
void register_type_row(HashedTypeTable& table, const TypeRow& row);

} // namespace reprint

#endif // BUNDLE_READER_HPP
