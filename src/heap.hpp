#ifndef HEAP_HPP
#define HEAP_HPP

#include <cstdint>
#include <string_view>
#include <vector>
#include "value.hpp"

namespace reprint {

// Object flavours in the heap. Zero is deliberately not a flavour.
enum class Flavour : uint8_t {
    String = 1,
    Bytes = 2,
    Tuple = 3,
    Array = 4,
    Record = 5,
    Variant = 6,
    Boxed = 7,
    Function = 8
};

// Subtags of boxed numbers.
enum class NumberTag : uint8_t {
    Int32 = 1,
    Uint32 = 2,
    Int64 = 3,
    Uint64 = 4,
    Float32 = 5,
    Float64 = 6,
    Rational = 7,
    BigInt = 8
};

// The first cell of every heap object.
// Layout: bits 0-7 flavour, 8-15 subtag, 16-31 aux, 32-63 length.
struct ObjectHeader {
    uint8_t flavour;
    uint8_t subtag;
    uint16_t aux;
    uint32_t length;
};

inline Cell pack_header(Flavour flavour, uint8_t subtag, uint16_t aux, uint32_t length) {
    Cell c;
    c.u64 = static_cast<uint64_t>(flavour)
          | (static_cast<uint64_t>(subtag) << 8)
          | (static_cast<uint64_t>(aux) << 16)
          | (static_cast<uint64_t>(length) << 32);
    return c;
}

inline ObjectHeader unpack_header(Cell cell) {
    ObjectHeader h;
    h.flavour = static_cast<uint8_t>(cell.u64 & 0xFF);
    h.subtag = static_cast<uint8_t>((cell.u64 >> 8) & 0xFF);
    h.aux = static_cast<uint16_t>((cell.u64 >> 16) & 0xFFFF);
    h.length = static_cast<uint32_t>(cell.u64 >> 32);
    return h;
}

// Number of cells needed to hold n bytes.
inline size_t cells_for_bytes(size_t n) {
    return (n + sizeof(Cell) - 1) / sizeof(Cell);
}

// Pool is a fixed-size linear allocation arena.
class Pool {
private:
    std::vector<Cell> cells_;
    size_t next_free_;  // Index of next free cell.

public:
    explicit Pool(size_t num_cells);

    // Allocate n cells, returns pointer to first cell.
    // Throws std::bad_alloc if insufficient space.
    Cell* allocate(size_t n);

    // Check if pointer is in this pool.
    bool contains(const void* ptr) const;
};

// ObjectBuilder allows incremental construction of heap objects.
// Values are accumulated in a temporary buffer, then committed to the pool atomically.
class ObjectBuilder {
private:
    std::vector<Cell> cells_;
    Pool* pool_;  // Target pool for commit.

public:
    explicit ObjectBuilder(Pool* pool);

    void add_cell(Cell cell);
    void add_u64(uint64_t value);
    void add_i64(int64_t value);
    void add_f64(double value);

    // Append raw bytes, padded with zeros to a whole number of cells.
    void add_bytes(const uint8_t* data, size_t count);

    // Commit the accumulated cells to the pool and return a tagged pointer to the first cell.
    // After commit, the builder is reset and can be reused.
    Cell commit();

};

// Heap manages the pool and provides typed allocation.
// Every allocate_ function returns the tagged pointer to the new object.
class Heap {
private:
    Pool pool_;

public:
    Heap();
    explicit Heap(size_t num_cells);

    Pool* get_pool() { return &pool_; }

    Cell allocate_string(std::string_view text);
    Cell allocate_bytes(const std::vector<uint8_t>& bytes);
    Cell allocate_tuple(const std::vector<Cell>& items);
    Cell allocate_array(const std::vector<Cell>& items);
    Cell allocate_record(uint64_t type_hash, const std::vector<Cell>& fields);
    Cell allocate_variant(uint64_t type_hash, uint16_t variant_id, const std::vector<Cell>& args);

    Cell allocate_int32(int32_t value);
    Cell allocate_uint32(uint32_t value);
    Cell allocate_int64(int64_t value);
    Cell allocate_uint64(uint64_t value);
    Cell allocate_float32(float value);
    Cell allocate_float64(double value);

    // Magnitude limbs are little-endian; leading zero limbs are dropped.
    Cell allocate_bigint(bool negative, const std::vector<uint64_t>& limbs);
    Cell allocate_rational(Cell numerator, Cell denominator);

    Cell allocate_function(int nparams);

    // Builds a list from the built-in list type, last element innermost.
    Cell allocate_list(const std::vector<Cell>& items);
};

} // namespace reprint

#endif // HEAP_HPP
