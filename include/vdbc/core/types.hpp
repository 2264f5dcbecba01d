#pragma once

#include <datapod/datapod.hpp>

namespace vdbc {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using FrameId = u32;
    using PGN = u32;
    using Address = u8;

    // ─── Signal bit numbering (DBC '@0' = Motorola, '@1' = Intel) ───────────────
    enum class ByteOrder : u8 {
        BigEndian = 0,
        LittleEndian = 1,
    };

    // ─── Raw value interpretation ────────────────────────────────────────────────
    enum class ValueKind : u8 {
        Unsigned = 0,
        Signed = 1,
        Float = 2,  // IEEE-754 single, 32 bits
        Double = 3, // IEEE-754 double, 64 bits
    };

    // ─── Object kinds an attribute definition can own ───────────────────────────
    enum class ObjectKind : u8 {
        Database = 0, // ""
        Node,         // BU_
        Message,      // BO_
        Signal,       // SG_
        EnvironmentVariable, // EV_
    };

    inline const char *object_kind_name(ObjectKind kind) noexcept {
        switch (kind) {
        case ObjectKind::Database:
            return "database";
        case ObjectKind::Node:
            return "node";
        case ObjectKind::Message:
            return "message";
        case ObjectKind::Signal:
            return "signal";
        case ObjectKind::EnvironmentVariable:
            return "environment variable";
        }
        return "unknown";
    }

} // namespace vdbc
