#pragma once

#include "../core/types.hpp"
#include "attribute.hpp"
#include <datapod/datapod.hpp>

namespace vdbc::model {

    // ─── Node / ECU on the bus (BU_) ────────────────────────────────────────────
    // Transmit and receive sets are not stored here; the database indexes them
    // by node name.
    struct Node {
        dp::String name;
        dp::Optional<dp::String> comment;
        AttributeSet attributes;

        Node() = default;
        explicit Node(dp::String n) : name(std::move(n)) {}
    };

    // ─── CAN bus (BS_ / bus section) ────────────────────────────────────────────
    struct Bus {
        dp::String name;
        dp::Optional<u32> baudrate;
        dp::Optional<dp::String> comment;
    };

} // namespace vdbc::model
