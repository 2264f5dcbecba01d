#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace vdbc::model {

    enum class MuxKind : u8 {
        None = 0,
        Multiplexor,        // M
        MultiplexedBy,      // m<value>
        MultiplexedByRange, // SG_MUL_VAL_ <switch> <lo>-<hi>, ...
    };

    // Inclusive on both ends
    struct MuxRange {
        i64 lower = 0;
        i64 upper = 0;

        constexpr bool contains(i64 value) const noexcept { return value >= lower && value <= upper; }
    };

    // ─── Multiplexer role of a signal ───────────────────────────────────────────
    struct MultiplexerRole {
        MuxKind kind = MuxKind::None;
        i64 selector = 0;          // MultiplexedBy
        dp::String switch_name;    // MultiplexedByRange: the multiplexor signal
        dp::Vector<MuxRange> ranges; // MultiplexedByRange

        static MultiplexerRole none() { return {}; }

        static MultiplexerRole multiplexor() {
            MultiplexerRole role;
            role.kind = MuxKind::Multiplexor;
            return role;
        }

        static MultiplexerRole multiplexed_by(i64 value) {
            MultiplexerRole role;
            role.kind = MuxKind::MultiplexedBy;
            role.selector = value;
            return role;
        }

        static MultiplexerRole multiplexed_by_range(dp::String switch_signal, i64 lower, i64 upper) {
            MultiplexerRole role;
            role.kind = MuxKind::MultiplexedByRange;
            role.switch_name = std::move(switch_signal);
            role.ranges.push_back(MuxRange{lower, upper});
            return role;
        }

        MultiplexerRole &add_range(i64 lower, i64 upper) {
            ranges.push_back(MuxRange{lower, upper});
            return *this;
        }

        bool is_multiplexor() const noexcept { return kind == MuxKind::Multiplexor; }

        bool is_multiplexed() const noexcept {
            return kind == MuxKind::MultiplexedBy || kind == MuxKind::MultiplexedByRange;
        }

        // True when this signal is present for the multiplexor raw value
        bool matches(i64 mux_value) const noexcept {
            switch (kind) {
            case MuxKind::MultiplexedBy:
                return mux_value == selector;
            case MuxKind::MultiplexedByRange:
                for (const auto &range : ranges) {
                    if (range.contains(mux_value))
                        return true;
                }
                return false;
            case MuxKind::None:
            case MuxKind::Multiplexor:
                return true;
            }
            return false;
        }
    };

} // namespace vdbc::model
