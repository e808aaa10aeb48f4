#include "heap.hpp"
#include "type_registry.hpp"
#include <bit>
#include <cstring>
#include <new>
#include <stdexcept>

namespace reprint {

// 1MB = 1048576 bytes = 131072 cells (8 bytes each).
static constexpr size_t POOL_SIZE_BYTES = 1024 * 1024;
static constexpr size_t POOL_SIZE_CELLS = POOL_SIZE_BYTES / sizeof(Cell);

Pool::Pool(size_t num_cells)
    : cells_(num_cells), next_free_(0) {
}

Cell* Pool::allocate(size_t n) {
    if (next_free_ + n > cells_.size()) {
        throw std::bad_alloc();
    }
    Cell* result = &cells_[next_free_];
    next_free_ += n;
    return result;
}

bool Pool::contains(const void* ptr) const {
    const Cell* cell_ptr = static_cast<const Cell*>(ptr);
    return cell_ptr >= cells_.data() && cell_ptr < cells_.data() + cells_.size();
}

ObjectBuilder::ObjectBuilder(Pool* pool)
    : pool_(pool) {
}

void ObjectBuilder::add_cell(Cell cell) {
    cells_.push_back(cell);
}

void ObjectBuilder::add_u64(uint64_t value) {
    Cell cell;
    cell.u64 = value;
    cells_.push_back(cell);
}

void ObjectBuilder::add_i64(int64_t value) {
    Cell cell;
    cell.i64 = value;
    cells_.push_back(cell);
}

void ObjectBuilder::add_f64(double value) {
    Cell cell;
    cell.f64 = value;
    cells_.push_back(cell);
}

void ObjectBuilder::add_bytes(const uint8_t* data, size_t count) {
    size_t first = cells_.size();
    cells_.resize(first + cells_for_bytes(count), make_raw_u64(0));
    if (count > 0) {
        std::memcpy(&cells_[first], data, count);
    }
}

Cell ObjectBuilder::commit() {
    if (cells_.empty()) {
        throw std::runtime_error("Cannot commit empty ObjectBuilder");
    }

    // Allocate space in the pool.
    Cell* base = pool_->allocate(cells_.size());

    // Copy accumulated cells to the pool.
    for (size_t i = 0; i < cells_.size(); i++) {
        base[i] = cells_[i];
    }

    // Reset the builder for reuse.
    cells_.clear();

    return make_tagged_ptr(base);
}

Heap::Heap()
    : pool_(POOL_SIZE_CELLS) {
}

Heap::Heap(size_t num_cells)
    : pool_(num_cells) {
}

Cell Heap::allocate_string(std::string_view text) {
    // String layout:
    // [0: header, length = byte count]
    // [1..: UTF-8 data packed into cells]
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::String, 0, 0, static_cast<uint32_t>(text.size())));
    builder.add_bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return builder.commit();
}

Cell Heap::allocate_bytes(const std::vector<uint8_t>& bytes) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Bytes, 0, 0, static_cast<uint32_t>(bytes.size())));
    builder.add_bytes(bytes.data(), bytes.size());
    return builder.commit();
}

Cell Heap::allocate_tuple(const std::vector<Cell>& items) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Tuple, 0, 0, static_cast<uint32_t>(items.size())));
    for (Cell item : items) {
        builder.add_cell(item);
    }
    return builder.commit();
}

Cell Heap::allocate_array(const std::vector<Cell>& items) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Array, 0, 0, static_cast<uint32_t>(items.size())));
    for (Cell item : items) {
        builder.add_cell(item);
    }
    return builder.commit();
}

Cell Heap::allocate_record(uint64_t type_hash, const std::vector<Cell>& fields) {
    // Record layout:
    // [0: header, length = arity]
    // [1: type hash]
    // [2..: field values in declaration order]
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Record, 0, 0, static_cast<uint32_t>(fields.size())));
    builder.add_u64(type_hash);
    for (Cell field : fields) {
        builder.add_cell(field);
    }
    return builder.commit();
}

Cell Heap::allocate_variant(uint64_t type_hash, uint16_t variant_id, const std::vector<Cell>& args) {
    // Variant layout:
    // [0: header, aux = variant id, length = arity]
    // [1: type hash]
    // [2..: payload]
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Variant, 0, variant_id, static_cast<uint32_t>(args.size())));
    builder.add_u64(type_hash);
    for (Cell arg : args) {
        builder.add_cell(arg);
    }
    return builder.commit();
}

Cell Heap::allocate_int32(int32_t value) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::Int32), 0, 1));
    builder.add_i64(value);
    return builder.commit();
}

Cell Heap::allocate_uint32(uint32_t value) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::Uint32), 0, 1));
    builder.add_u64(value);
    return builder.commit();
}

Cell Heap::allocate_int64(int64_t value) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::Int64), 0, 1));
    builder.add_i64(value);
    return builder.commit();
}

Cell Heap::allocate_uint64(uint64_t value) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::Uint64), 0, 1));
    builder.add_u64(value);
    return builder.commit();
}

Cell Heap::allocate_float32(float value) {
    // The IEEE single bits live in the low half of the payload cell.
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::Float32), 0, 1));
    builder.add_u64(std::bit_cast<uint32_t>(value));
    return builder.commit();
}

Cell Heap::allocate_float64(double value) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::Float64), 0, 1));
    builder.add_f64(value);
    return builder.commit();
}

Cell Heap::allocate_bigint(bool negative, const std::vector<uint64_t>& limbs) {
    size_t used = limbs.size();
    while (used > 0 && limbs[used - 1] == 0) {
        used--;
    }
    ObjectBuilder builder(&pool_);
    // Zero has no sign.
    uint16_t sign = (negative && used > 0) ? 1 : 0;
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::BigInt), sign,
                                 static_cast<uint32_t>(used)));
    for (size_t i = 0; i < used; i++) {
        builder.add_u64(limbs[i]);
    }
    return builder.commit();
}

Cell Heap::allocate_rational(Cell numerator, Cell denominator) {
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Boxed, static_cast<uint8_t>(NumberTag::Rational), 0, 2));
    builder.add_cell(numerator);
    builder.add_cell(denominator);
    return builder.commit();
}

Cell Heap::allocate_function(int nparams) {
    // Function layout:
    // [0: header, length = parameter count]
    // [1: code address, unused by the printer]
    ObjectBuilder builder(&pool_);
    builder.add_cell(pack_header(Flavour::Function, 0, 0, static_cast<uint32_t>(nparams)));
    builder.add_u64(0);
    return builder.commit();
}

Cell Heap::allocate_list(const std::vector<Cell>& items) {
    Cell list = allocate_variant(LIST_TYPE_HASH, LIST_EMPTY_VARIANT, {});
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        list = allocate_variant(LIST_TYPE_HASH, LIST_CONS_VARIANT, {*it, list});
    }
    return list;
}

} // namespace reprint
