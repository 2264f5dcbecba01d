#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/bitfield.hpp"

namespace vdbc::id {

    // ─── GM Parameter ID, 29-bit frames ─────────────────────────────────────────
    // Layout: [Priority:3][Parameter ID:13][Source ID:13]
    struct GMParameterId {
        u8 priority = 0;
        u16 parameter_id = 0;
        u16 source_id = 0;

        static constexpr GMParameterId decode(FrameId raw) noexcept {
            GMParameterId id;
            id.priority = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 26, 3));
            id.parameter_id = static_cast<u16>(bitfield::get_bits<FrameId>(raw, 13, 13));
            id.source_id = static_cast<u16>(bitfield::get_bits<FrameId>(raw, 0, 13));
            return id;
        }

        Result<FrameId> encode() const {
            if (priority > 7 || parameter_id > 0x1FFF || source_id > 0x1FFF) {
                return Result<FrameId>::err(Error::invalid_identifier("GM parameter id field exceeds its width"));
            }
            FrameId raw = bitfield::set_bits<FrameId>(0, 26, 3, priority);
            raw = bitfield::set_bits<FrameId>(raw, 13, 13, parameter_id);
            raw = bitfield::set_bits<FrameId>(raw, 0, 13, source_id);
            return Result<FrameId>::ok(raw);
        }

        constexpr bool operator==(const GMParameterId &other) const noexcept = default;
    };

    // ─── GM Parameter ID, 11-bit frames ─────────────────────────────────────────
    // Layout: [Request Type:3][Arbitration ID:8]
    struct GMParameterIdStandard {
        u8 request_type = 0;
        u8 arbitration_id = 0;

        static constexpr GMParameterIdStandard decode(FrameId raw) noexcept {
            GMParameterIdStandard id;
            id.request_type = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 8, 3));
            id.arbitration_id = static_cast<u8>(bitfield::get_bits<FrameId>(raw, 0, 8));
            return id;
        }

        Result<FrameId> encode() const {
            if (request_type > 7) {
                return Result<FrameId>::err(Error::invalid_identifier("GM request type exceeds 3 bits"));
            }
            FrameId raw = bitfield::set_bits<FrameId>(0, 8, 3, request_type);
            return Result<FrameId>::ok(bitfield::set_bits<FrameId>(raw, 0, 8, arbitration_id));
        }

        constexpr bool operator==(const GMParameterIdStandard &other) const noexcept = default;
    };

} // namespace vdbc::id
