#include "type_registry.hpp"
#include "trace.hpp"
#include <array>
#include <fmt/core.h>

namespace reprint {

static const std::array<const char*, 2> OPTION_VARIANTS = {"Some", "None"};
static const std::array<const char*, 2> RESULT_VARIANTS = {"Ok", "Err"};

HashedTypeTable::HashedTypeTable(size_t bucket_count)
    : buckets_(bucket_count == 0 ? 1 : bucket_count) {
}

void HashedTypeTable::insert(MetadataBlock block) {
    if (find_type(block.type_hash) != nullptr) {
        throw TypeRegistryError(fmt::format("Type hash {:#x} ({}) is already registered",
                                            block.type_hash, block.type_name));
    }
    auto& bucket = buckets_[block.type_hash % buckets_.size()];
    bucket.push_back(Entry{block.type_hash, blocks_.size()});
    if constexpr (TRACE_REGISTRY) {
        fmt::print(stderr, "Registered type {} ({:#x}) in bucket {}\n",
                   block.type_name, block.type_hash, block.type_hash % buckets_.size());
    }
    blocks_.push_back(std::move(block));
}

void HashedTypeTable::add_record(uint64_t type_hash, const std::string& type_name,
                                 const std::vector<std::string>& fields) {
    MetadataBlock block;
    block.type_hash = type_hash;
    block.shape = TypeShape::Record;
    block.type_name = type_name;
    block.names = fields;
    insert(std::move(block));
}

void HashedTypeTable::add_sum_type(uint64_t type_hash, const std::string& type_name,
                                   const std::vector<VariantSpec>& variants) {
    MetadataBlock block;
    block.type_hash = type_hash;
    block.shape = TypeShape::SumType;
    block.type_name = type_name;

    // Each variant's name is followed in the pool by its inline-record fields, if any.
    for (const auto& spec : variants) {
        VariantEntry entry;
        entry.variant_id = spec.variant_id;
        entry.name_index = static_cast<uint32_t>(block.names.size());
        entry.arity = spec.arity;
        entry.record_field_offset = 0;
        block.names.push_back(spec.name);
        if (spec.record_fields) {
            if (spec.record_fields->size() != spec.arity) {
                throw TypeRegistryError(fmt::format(
                    "Variant {} of {} has arity {} but {} record fields",
                    spec.name, type_name, spec.arity, spec.record_fields->size()));
            }
            entry.record_field_offset = 1;
            block.names.insert(block.names.end(), spec.record_fields->begin(), spec.record_fields->end());
        }
        block.variants.push_back(entry);
    }
    insert(std::move(block));
}

const MetadataBlock* HashedTypeTable::find_type(uint64_t type_hash) const {
    const auto& bucket = buckets_[type_hash % buckets_.size()];
    for (const auto& entry : bucket) {
        if (entry.type_hash == type_hash) {
            return &blocks_[entry.block_index];
        }
    }
    return nullptr;
}

std::optional<std::vector<std::string>> field_names(const MetadataBlock& block, uint32_t arity) {
    if (block.shape != TypeShape::Record || block.names.size() < arity) {
        return std::nullopt;
    }
    return std::vector<std::string>(block.names.begin(), block.names.begin() + arity);
}

std::optional<VariantInfo> variant_info(const MetadataBlock& block, uint32_t variant_id) {
    if (block.shape != TypeShape::SumType) {
        return std::nullopt;
    }
    for (const auto& entry : block.variants) {
        if (entry.variant_id != variant_id) {
            continue;
        }
        VariantInfo info;
        info.name = block.names[entry.name_index];
        info.arity = entry.arity;
        if (entry.record_field_offset != 0) {
            size_t first = entry.name_index + entry.record_field_offset;
            if (first + entry.arity > block.names.size()) {
                return std::nullopt;
            }
            info.record_fields = std::vector<std::string>(block.names.begin() + first,
                                                          block.names.begin() + first + entry.arity);
        }
        return info;
    }
    return std::nullopt;
}

std::optional<std::string> builtin_variant_name(uint64_t type_hash, uint32_t variant_id) {
    if (type_hash == OPTION_TYPE_HASH && variant_id < OPTION_VARIANTS.size()) {
        return OPTION_VARIANTS[variant_id];
    }
    if (type_hash == RESULT_TYPE_HASH && variant_id < RESULT_VARIANTS.size()) {
        return RESULT_VARIANTS[variant_id];
    }
    return std::nullopt;
}

} // namespace reprint
