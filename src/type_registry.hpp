#ifndef TYPE_REGISTRY_HPP
#define TYPE_REGISTRY_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace reprint {

// Reserved hashes of the built-in sum types. These are resolved without a table lookup.
constexpr uint64_t OPTION_TYPE_HASH = 0x0B71'0000'0000'0001ULL;
constexpr uint64_t RESULT_TYPE_HASH = 0x0B71'0000'0000'0002ULL;
constexpr uint64_t LIST_TYPE_HASH   = 0x0B71'0000'0000'0003ULL;

constexpr uint16_t LIST_EMPTY_VARIANT = 0;
constexpr uint16_t LIST_CONS_VARIANT  = 1;

constexpr size_t DEFAULT_BUCKET_COUNT = 64;

class TypeRegistryError : public std::runtime_error {
public:
    explicit TypeRegistryError(const std::string& msg) : std::runtime_error(msg) {}
};

enum class TypeShape {
    Record,
    SumType
};

// One alternative of a sum type. A nonzero record_field_offset is the distance,
// within the block's name pool, from the variant's name to its inline-record
// field names.
struct VariantEntry {
    uint32_t variant_id;
    uint32_t name_index;
    uint32_t arity;
    uint32_t record_field_offset;
};

// Shape description of one type. Names are interned in a single pool per block.
struct MetadataBlock {
    uint64_t type_hash;
    TypeShape shape;
    std::string type_name;
    std::vector<std::string> names;
    std::vector<VariantEntry> variants;  // Empty for records.
};

// Owned copy of what a caller needs to render one variant.
struct VariantInfo {
    std::string name;
    uint32_t arity;
    std::optional<std::vector<std::string>> record_fields;
};

// Input form for registering a variant.
struct VariantSpec {
    uint32_t variant_id;
    std::string name;
    uint32_t arity;
    std::optional<std::vector<std::string>> record_fields;
};

// Read-only lookup service the renderer consults for record and variant shapes.
class TypeRegistry {
public:
    virtual ~TypeRegistry() = default;

    // Returns nullptr when the hash is not registered.
    virtual const MetadataBlock* find_type(uint64_t type_hash) const = 0;
};

// Hash-bucketed type table: bucket = hash % bucket_count, then a linear scan.
class HashedTypeTable : public TypeRegistry {
private:
    struct Entry {
        uint64_t type_hash;
        size_t block_index;
    };

    std::vector<std::vector<Entry>> buckets_;
    std::vector<MetadataBlock> blocks_;

    void insert(MetadataBlock block);

public:
    explicit HashedTypeTable(size_t bucket_count = DEFAULT_BUCKET_COUNT);

    // Registering an already known hash throws TypeRegistryError.
    void add_record(uint64_t type_hash, const std::string& type_name,
                    const std::vector<std::string>& fields);
    void add_sum_type(uint64_t type_hash, const std::string& type_name,
                      const std::vector<VariantSpec>& variants);

    const MetadataBlock* find_type(uint64_t type_hash) const override;

    size_t bucket_count() const { return buckets_.size(); }
    size_t size() const { return blocks_.size(); }
};

// Field names of a record block, or nothing if the block cannot supply arity names.
std::optional<std::vector<std::string>> field_names(const MetadataBlock& block, uint32_t arity);

// The variant with the given id, or nothing if the block has none.
std::optional<VariantInfo> variant_info(const MetadataBlock& block, uint32_t variant_id);

// Variant names of Option and Result.
std::optional<std::string> builtin_variant_name(uint64_t type_hash, uint32_t variant_id);

} // namespace reprint

#endif // TYPE_REGISTRY_HPP
