#pragma once

#include "../core/types.hpp"
#include "attribute.hpp"
#include "multiplexer.hpp"
#include "value_table.hpp"
#include <datapod/datapod.hpp>

namespace vdbc::model {

    // ─── Signal (SG_) ───────────────────────────────────────────────────────────
    // start_bit follows DBC numbering: the LSB for Intel signals, the MSB for
    // Motorola signals.
    struct Signal {
        dp::String name;
        u16 start_bit = 0;
        u8 length = 1; // 1..64
        ByteOrder byte_order = ByteOrder::LittleEndian;
        ValueKind kind = ValueKind::Unsigned;
        f64 factor = 1.0;
        f64 offset = 0.0;
        dp::Optional<f64> minimum;
        dp::Optional<f64> maximum;
        dp::String unit;
        MultiplexerRole mux;
        dp::Vector<dp::String> receivers;
        AttributeSet attributes;
        ValueTable choices;                // local VAL_ entries
        dp::Optional<dp::String> value_table; // named VAL_TABLE_ reference
        dp::Optional<dp::String> comment;

        Signal() = default;
        Signal(dp::String n, u16 start, u8 len, ByteOrder order = ByteOrder::LittleEndian,
               ValueKind k = ValueKind::Unsigned)
            : name(std::move(n)), start_bit(start), length(len), byte_order(order), kind(k) {}

        bool is_big_endian() const noexcept { return byte_order == ByteOrder::BigEndian; }
        bool is_float() const noexcept { return kind == ValueKind::Float || kind == ValueKind::Double; }
        bool is_signed() const noexcept { return kind == ValueKind::Signed; }
        bool is_multiplexor() const noexcept { return mux.is_multiplexor(); }
        bool is_multiplexed() const noexcept { return mux.is_multiplexed(); }

        bool is_received_by(const dp::String &node) const {
            for (const auto &r : receivers) {
                if (r == node)
                    return true;
            }
            return false;
        }

        // Bit position when the payload is read MSB-first; used for ordering
        usize sort_key() const noexcept {
            if (is_big_endian())
                return 8 * (start_bit / 8) + (7 - (start_bit % 8));
            return start_bit;
        }

        // ─── Fluent setters ──────────────────────────────────────────────────────
        Signal &set_scaling(f64 f, f64 o) {
            factor = f;
            offset = o;
            return *this;
        }
        Signal &set_range(f64 min, f64 max) {
            minimum = min;
            maximum = max;
            return *this;
        }
        Signal &set_unit(dp::String u) {
            unit = std::move(u);
            return *this;
        }
        Signal &set_mux(MultiplexerRole role) {
            mux = std::move(role);
            return *this;
        }
        Signal &add_receiver(dp::String node) {
            receivers.push_back(std::move(node));
            return *this;
        }
        Signal &add_choice(i64 raw, dp::String label) {
            choices.add(raw, std::move(label));
            return *this;
        }
        Signal &set_value_table(dp::String table) {
            value_table = std::move(table);
            return *this;
        }
    };

} // namespace vdbc::model
