#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "gm_parameter_id.hpp"
#include "j1939.hpp"
#include <cstdio>
#include <variant>

namespace vdbc::id {

    // ─── Plain identifiers ───────────────────────────────────────────────────────
    struct StandardId {
        FrameId id = 0; // 0..0x7FF
        constexpr bool operator==(const StandardId &other) const noexcept = default;
    };

    struct ExtendedId {
        FrameId id = 0; // 0..0x1FFFFFFF
        constexpr bool operator==(const ExtendedId &other) const noexcept = default;
    };

    using IdVariant = std::variant<StandardId, ExtendedId, J1939Id, GMParameterId, GMParameterIdStandard>;

    // ─── Decoding scheme, stated by the database (never guessed from the bits) ──
    enum class IdScheme : u8 {
        Plain = 0,
        J1939,
        GMParameterId,
    };

    inline const char *id_scheme_name(IdScheme scheme) noexcept {
        switch (scheme) {
        case IdScheme::Plain:
            return "plain";
        case IdScheme::J1939:
            return "J1939";
        case IdScheme::GMParameterId:
            return "GMParameterId";
        }
        return "unknown";
    }

    inline Result<void> check_width(u64 raw, bool is_extended) {
        if (raw > (is_extended ? EXTENDED_ID_MAX : STANDARD_ID_MAX)) {
            return Result<void>::err(Error::invalid_identifier(raw, is_extended));
        }
        return {};
    }

    // J1939 is defined for 29-bit frames only; 11-bit frames under a J1939
    // database decode as Standard.
    inline Result<IdVariant> decode(u64 raw, bool is_extended, IdScheme scheme) {
        auto width = check_width(raw, is_extended);
        if (!width.is_ok()) {
            return Result<IdVariant>::err(width.error());
        }
        auto id = static_cast<FrameId>(raw);

        switch (scheme) {
        case IdScheme::GMParameterId:
            if (is_extended)
                return Result<IdVariant>::ok(IdVariant{GMParameterId::decode(id)});
            return Result<IdVariant>::ok(IdVariant{GMParameterIdStandard::decode(id)});
        case IdScheme::J1939:
            if (is_extended)
                return Result<IdVariant>::ok(IdVariant{J1939Id::decode(id)});
            break;
        case IdScheme::Plain:
            break;
        }
        if (is_extended)
            return Result<IdVariant>::ok(IdVariant{ExtendedId{id}});
        return Result<IdVariant>::ok(IdVariant{StandardId{id}});
    }

    inline bool is_extended(const IdVariant &variant) noexcept {
        return !std::holds_alternative<StandardId>(variant) && !std::holds_alternative<GMParameterIdStandard>(variant);
    }

    inline Result<FrameId> encode(const IdVariant &variant) {
        if (const auto *s = std::get_if<StandardId>(&variant)) {
            auto width = check_width(s->id, false);
            if (!width.is_ok())
                return Result<FrameId>::err(width.error());
            return Result<FrameId>::ok(s->id);
        }
        if (const auto *e = std::get_if<ExtendedId>(&variant)) {
            auto width = check_width(e->id, true);
            if (!width.is_ok())
                return Result<FrameId>::err(width.error());
            return Result<FrameId>::ok(e->id);
        }
        if (const auto *j = std::get_if<J1939Id>(&variant))
            return j->encode();
        if (const auto *g = std::get_if<GMParameterId>(&variant))
            return g->encode();
        return std::get<GMParameterIdStandard>(variant).encode();
    }

    // ─── Source field access (J1939 source address / GM source id) ──────────────
    inline dp::Optional<u32> source_of(const IdVariant &variant) noexcept {
        if (const auto *j = std::get_if<J1939Id>(&variant))
            return static_cast<u32>(j->source_address);
        if (const auto *g = std::get_if<GMParameterId>(&variant))
            return static_cast<u32>(g->source_id);
        return dp::nullopt;
    }

    // Schemes without a source field are returned unchanged
    inline Result<IdVariant> with_source(IdVariant variant, u32 source) {
        if (auto *j = std::get_if<J1939Id>(&variant)) {
            if (source > 0xFF) {
                return Result<IdVariant>::err(Error::invalid_identifier("J1939 source address exceeds 8 bits"));
            }
            j->source_address = static_cast<Address>(source);
        } else if (auto *g = std::get_if<GMParameterId>(&variant)) {
            if (source > 0x1FFF) {
                return Result<IdVariant>::err(Error::invalid_identifier("GM source id exceeds 13 bits"));
            }
            g->source_id = static_cast<u16>(source);
        }
        return Result<IdVariant>::ok(std::move(variant));
    }

    // 0x123 for standard frames, 0x18FEF100 for extended frames
    inline dp::String hex_string(FrameId raw, bool is_extended) {
        char buf[16];
        if (is_extended)
            std::snprintf(buf, sizeof(buf), "0x%08X", static_cast<unsigned>(raw));
        else
            std::snprintf(buf, sizeof(buf), "0x%03X", static_cast<unsigned>(raw));
        return dp::String(buf);
    }

} // namespace vdbc::id
