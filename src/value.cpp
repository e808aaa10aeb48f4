#include "value.hpp"
#include <fmt/core.h>

namespace reprint {

ValueKind classify(Cell cell) {
    if (is_tagged_int(cell)) {
        return ValueKind::ImmediateNumber;
    } else if (is_tagged_ptr(cell)) {
        // A tagged null is not something we can follow.
        return as_detagged_ptr(cell) == nullptr ? ValueKind::Unknown : ValueKind::HeapPointer;
    } else if (is_short(cell)) {
        return ValueKind::ShortInline;
    } else if (is_special(cell)) {
        return ValueKind::Constant;
    }
    // The x10 patterns are not used by this encoding.
    return ValueKind::Unknown;
}

ConstantKind classify_constant(Cell cell) {
    if (cell.u64 == SPECIAL_FALSE.u64) {
        return ConstantKind::False;
    } else if (cell.u64 == SPECIAL_TRUE.u64) {
        return ConstantKind::True;
    } else if (cell.u64 == SPECIAL_VOID.u64) {
        return ConstantKind::Void;
    }
    return ConstantKind::Unknown;
}

ShortKind classify_short(Cell cell) {
    uint64_t bits = (cell.u64 >> SHORT_KIND_SHIFT) & SHORT_KIND_MASK;
    switch (bits) {
        case static_cast<uint64_t>(ShortKind::Char):
            return ShortKind::Char;
        case static_cast<uint64_t>(ShortKind::Int8):
            return ShortKind::Int8;
        case static_cast<uint64_t>(ShortKind::Int16):
            return ShortKind::Int16;
        case static_cast<uint64_t>(ShortKind::Uint8):
            return ShortKind::Uint8;
        case static_cast<uint64_t>(ShortKind::Uint16):
            return ShortKind::Uint16;
        default:
            return ShortKind::Unknown;
    }
}

std::string cell_to_string(Cell cell) {
    switch (classify(cell)) {
        case ValueKind::ImmediateNumber:
            return fmt::format("{}", as_detagged_int(cell));
        case ValueKind::HeapPointer:
            // Only the address, the decoder does not look inside heap objects.
            return fmt::format("<ptr@{:x}>", reinterpret_cast<uintptr_t>(as_detagged_ptr(cell)));
        case ValueKind::ShortInline:
            return fmt::format("<short {} {}>",
                               static_cast<int>(classify_short(cell)), short_signed_payload(cell));
        case ValueKind::Constant:
            switch (classify_constant(cell)) {
                case ConstantKind::False:
                    return "false";
                case ConstantKind::True:
                    return "true";
                case ConstantKind::Void:
                    return "void";
                case ConstantKind::Unknown:
                    break;
            }
            break;
        case ValueKind::Unknown:
            break;
    }
    return fmt::format("<unknown cell {:x}>", cell.u64);
}

} // namespace reprint
