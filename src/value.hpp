#ifndef VALUE_HPP
#define VALUE_HPP

#include <cstdint>
#include <string>

namespace reprint {

// Cell is a 64-bit unit of storage.
// Can hold tagged values or raw storage in the heap.
union Cell {
    int64_t i64;
    double f64;
    void* ptr;
    uint64_t u64;
};

// Type tags.
constexpr uint64_t TAG_INT     = 0x0;  // x00 pattern.
constexpr uint64_t TAG_PTR     = 0x1;  // 001 pattern.
constexpr uint64_t TAG_SHORT   = 0x3;  // 011 pattern.
constexpr uint64_t TAG_SPECIAL = 0x7;  // 111 pattern.

constexpr uint64_t TAG_MASK_2BIT = 0x3;  // For x00.
constexpr uint64_t TAG_MASK_3BIT = 0x7;  // For 001, 011 and 111.

// Short inline values keep their subkind in bits 3-7 and the payload from bit 8 up.
constexpr int SHORT_KIND_SHIFT = 3;
constexpr uint64_t SHORT_KIND_MASK = 0x1F;
constexpr int SHORT_PAYLOAD_SHIFT = 8;

// What a cell holds, decided from its bit pattern alone.
enum class ValueKind {
    ImmediateNumber,
    Constant,
    ShortInline,
    HeapPointer,
    Unknown
};

enum class ConstantKind {
    False,
    True,
    Void,
    Unknown
};

enum class ShortKind : uint8_t {
    Char = 0,
    Int8 = 1,
    Int16 = 2,
    Uint8 = 3,
    Uint16 = 4,
    Unknown = 0x1F
};

inline Cell make_raw_u64(uint64_t value) {
    Cell c;
    c.u64 = value;
    return c;
}

// Integer operations (x00 tag - 62-bit integers).
// Bit 2 is the low-order bit of the integer, bits 0-1 are always 00.
inline Cell make_tagged_int(int64_t value) {
    Cell c;
    c.u64 = static_cast<uint64_t>(value) << 2;
    return c;
}

inline int64_t as_detagged_int(Cell cell) {
    // Arithmetic right shift by 2 to preserve sign and recover all 62 bits.
    return static_cast<int64_t>(cell.u64) >> 2;
}

inline bool is_tagged_int(Cell cell) {
    return (cell.u64 & TAG_MASK_2BIT) == TAG_INT;
}

// Pointer operations (001 tag).
// Assumes pointers are 8-byte aligned (bottom 3 bits are 000).
inline Cell make_tagged_ptr(const void* ptr) {
    Cell c;
    c.u64 = reinterpret_cast<uint64_t>(ptr) | TAG_PTR;
    return c;
}

inline void* as_detagged_ptr(Cell cell) {
    // Clear the bottom 3 bits to recover the original pointer.
    Cell c;
    c.u64 = cell.u64 & ~TAG_MASK_3BIT;
    return c.ptr;
}

inline bool is_tagged_ptr(Cell cell) {
    return (cell.u64 & TAG_MASK_3BIT) == TAG_PTR;
}

// Special literals (111 tag).
// Use upper bits to distinguish between bool true, bool false and void.
constexpr Cell SPECIAL_FALSE = {.u64 = TAG_SPECIAL};                 // 0x7
constexpr Cell SPECIAL_TRUE  = {.u64 = (1ULL << 3) | TAG_SPECIAL};   // 0xF
constexpr Cell SPECIAL_VOID  = {.u64 = (2ULL << 3) | TAG_SPECIAL};   // 0x17

inline Cell make_bool(bool value) {
    return value ? SPECIAL_TRUE : SPECIAL_FALSE;
}

inline Cell make_void() {
    return SPECIAL_VOID;
}

inline bool is_special(Cell cell) {
    return (cell.u64 & TAG_MASK_3BIT) == TAG_SPECIAL;
}

// Short inline values (011 tag).
inline Cell make_short(ShortKind kind, int64_t payload) {
    Cell c;
    c.u64 = (static_cast<uint64_t>(payload) << SHORT_PAYLOAD_SHIFT)
          | ((static_cast<uint64_t>(kind) & SHORT_KIND_MASK) << SHORT_KIND_SHIFT)
          | TAG_SHORT;
    return c;
}

inline Cell make_char(char32_t code_point) {
    return make_short(ShortKind::Char, static_cast<int64_t>(code_point));
}

inline bool is_short(Cell cell) {
    return (cell.u64 & TAG_MASK_3BIT) == TAG_SHORT;
}

inline uint64_t short_unsigned_payload(Cell cell) {
    return cell.u64 >> SHORT_PAYLOAD_SHIFT;
}

inline int64_t short_signed_payload(Cell cell) {
    return static_cast<int64_t>(cell.u64) >> SHORT_PAYLOAD_SHIFT;
}

// Decoding. These never dereference the cell.
ValueKind classify(Cell cell);
ConstantKind classify_constant(Cell cell);
ShortKind classify_short(Cell cell);

// Helper for debugging: convert cell to string representation.
std::string cell_to_string(Cell cell);

} // namespace reprint

#endif // VALUE_HPP
