#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/bitfield.hpp"
#include <string>

namespace vdbc::id {

    // ─── J1939 29-bit identifier ────────────────────────────────────────────────
    // Layout: [Priority:3][Reserved:1][DataPage:1][PDU Format:8][PDU Specific:8][Source:8]
    struct J1939Id {
        u8 priority = 0;
        u8 reserved = 0;
        u8 data_page = 0;
        u8 pdu_format = 0;
        u8 pdu_specific = 0;
        Address source_address = 0;

        static constexpr J1939Id decode(FrameId raw) noexcept {
            J1939Id id;
            id.priority = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 26, 3));
            id.reserved = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 25, 1));
            id.data_page = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 24, 1));
            id.pdu_format = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 16, 8));
            id.pdu_specific = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 8, 8));
            id.source_address = static_cast<Address>(bitfield::get_bits<FrameId>(raw, 0, 8));
            return id;
        }

        // Priority, reserved and data page are the only fields that can be out of width
        Result<FrameId> encode() const {
            if (priority > 7) {
                return Result<FrameId>::err(
                    Error::invalid_identifier("J1939 priority " + dp::String(std::to_string(priority)) + " > 7"));
            }
            if (reserved > 1) {
                return Result<FrameId>::err(Error::invalid_identifier("J1939 reserved bit must be 0 or 1"));
            }
            if (data_page > 1) {
                return Result<FrameId>::err(Error::invalid_identifier("J1939 data page must be 0 or 1"));
            }
            FrameId raw = 0;
            raw = bitfield::set_bits<FrameId>(raw, 26, 3, priority);
            raw = bitfield::set_bits<FrameId>(raw, 25, 1, reserved);
            raw = bitfield::set_bits<FrameId>(raw, 24, 1, data_page);
            raw = bitfield::set_bits<FrameId>(raw, 16, 8, pdu_format);
            raw = bitfield::set_bits<FrameId>(raw, 8, 8, pdu_specific);
            raw = bitfield::set_bits<FrameId>(raw, 0, 8, source_address);
            return Result<FrameId>::ok(raw);
        }

        constexpr bool is_pdu2() const noexcept { return pdu_format >= J1939_PDU2_THRESHOLD; }

        constexpr PGN pgn() const noexcept {
            PGN base = (static_cast<PGN>(reserved) << 17) | (static_cast<PGN>(data_page) << 16) |
                       (static_cast<PGN>(pdu_format) << 8);
            if (!is_pdu2()) {
                // PDU1: destination-specific, PGN does not include PS
                return base;
            }
            // PDU2: broadcast, PGN includes PS as group extension
            return base | pdu_specific;
        }

        constexpr Address destination() const noexcept {
            if (is_pdu2()) {
                return J1939_GLOBAL_ADDRESS;
            }
            return pdu_specific;
        }

        // Priority and source are left at zero
        static Result<J1939Id> from_pgn(PGN pgn) {
            if (pgn > J1939_PGN_MAX) {
                return Result<J1939Id>::err(Error::invalid_identifier(
                    "expected a parameter group number 0..0x3ffff, got " + dp::String(std::to_string(pgn))));
            }
            J1939Id id;
            id.reserved = static_cast<u8>((pgn >> 17) & 0x01);
            id.data_page = static_cast<u8>((pgn >> 16) & 0x01);
            id.pdu_format = static_cast<u8>((pgn >> 8) & 0xFF);
            id.pdu_specific = static_cast<u8>(pgn & 0xFF);
            return Result<J1939Id>::ok(id);
        }

        constexpr bool operator==(const J1939Id &other) const noexcept = default;
    };

} // namespace vdbc::id
