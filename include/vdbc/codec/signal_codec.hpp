#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../model/database.hpp"
#include "../model/signal.hpp"
#include "../util/bitfield.hpp"
#include "options.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <string>

namespace vdbc::codec {

    using model::Signal;

    // ─── Result of decoding one signal ──────────────────────────────────────────
    struct DecodedSignal {
        dp::String name;
        u64 raw_bits = 0; // as extracted, before sign extension
        i64 raw = 0;      // sign-extended for signed signals
        f64 value = 0.0;  // physical (or raw when scaling is off)
        dp::Optional<dp::String> label;
    };

    // ─── Bit-level codec for a single signal ────────────────────────────────────
    class SignalCodec {
        const model::Database *db_ = nullptr; // resolves named value tables
        CodecOptions options_;

      public:
        explicit SignalCodec(const model::Database *db = nullptr, CodecOptions options = {})
            : db_(db), options_(options) {}

        const CodecOptions &options() const noexcept { return options_; }

        // Shape and span checks shared by decode and inject
        static Result<void> check_span(const Signal &sig, usize payload_bits) {
            if (sig.length == 0 || sig.length > MAX_SIGNAL_BITS) {
                return Result<void>::err(Error::structural("signal '" + sig.name + "' length " +
                                                           dp::String(std::to_string(sig.length)) + " not in 1..64"));
            }
            if ((sig.kind == ValueKind::Float && sig.length != 32) || (sig.kind == ValueKind::Double && sig.length != 64)) {
                return Result<void>::err(Error::structural("signal '" + sig.name + "' has a float length of " +
                                                           dp::String(std::to_string(sig.length))));
            }
            if (bitfield::required_bits(sig.start_bit, sig.length, sig.is_big_endian()) > payload_bits) {
                return Result<void>::err(Error::bit_range_exceeded(sig.name, payload_bits));
            }
            return {};
        }

        // ─── Decode ──────────────────────────────────────────────────────────────
        Result<DecodedSignal> decode(const Signal &sig, const u8 *data, usize size) const {
            auto span = check_span(sig, size * 8);
            if (!span.is_ok()) {
                return Result<DecodedSignal>::err(span.error());
            }

            DecodedSignal out;
            out.name = sig.name;
            out.raw_bits = sig.is_big_endian() ? bitfield::extract_be(data, sig.start_bit, sig.length)
                                               : bitfield::extract_le(data, sig.start_bit, sig.length);

            switch (sig.kind) {
            case ValueKind::Float:
                out.raw = static_cast<i64>(out.raw_bits);
                out.value = static_cast<f64>(bitfield::bits_to_f32(out.raw_bits));
                break;
            case ValueKind::Double:
                out.raw = static_cast<i64>(out.raw_bits);
                out.value = bitfield::bits_to_f64(out.raw_bits);
                break;
            case ValueKind::Signed:
                out.raw = bitfield::sign_extend(out.raw_bits, sig.length);
                out.value = scale(sig, static_cast<f64>(out.raw));
                break;
            case ValueKind::Unsigned:
                out.raw = static_cast<i64>(out.raw_bits);
                out.value = scale(sig, static_cast<f64>(out.raw_bits));
                break;
            }

            if (options_.decode_choices && !sig.is_float()) {
                if (const auto *table = choices_of(sig)) {
                    out.label = table->label(out.raw);
                }
            }
            return Result<DecodedSignal>::ok(std::move(out));
        }

        Result<DecodedSignal> decode(const Signal &sig, const dp::Vector<u8> &payload) const {
            return decode(sig, payload.data(), payload.size());
        }

        // ─── Encode ──────────────────────────────────────────────────────────────
        // Physical value to the raw bits of the signal, masked to its length
        Result<u64> encode(const Signal &sig, f64 physical) const {
            if (!std::isfinite(physical) && !sig.is_float()) {
                return Result<u64>::err(Error::value_out_of_range("signal '" + sig.name + "' value is not finite"));
            }
            if (options_.strict) {
                f64 checked = physical;
                if (!options_.scaling && !sig.is_float()) {
                    checked = physical * sig.factor + sig.offset;
                }
                if ((sig.minimum.has_value() && checked < *sig.minimum) ||
                    (sig.maximum.has_value() && checked > *sig.maximum)) {
                    return Result<u64>::err(Error::value_out_of_range(
                        "signal '" + sig.name + "' value " + dp::String(std::to_string(checked)) + " outside its range"));
                }
            }

            if (sig.kind == ValueKind::Float) {
                return Result<u64>::ok(bitfield::f32_to_bits(static_cast<f32>(physical)));
            }
            if (sig.kind == ValueKind::Double) {
                return Result<u64>::ok(bitfield::f64_to_bits(physical));
            }

            f64 raw = physical;
            if (options_.scaling) {
                if (sig.factor == 0.0) {
                    return Result<u64>::err(Error::structural("signal '" + sig.name + "' has factor 0"));
                }
                raw = (physical - sig.offset) / sig.factor;
            }
            return raw_to_bits(sig, std::round(raw));
        }

        // Label of the signal's value table to raw bits
        Result<u64> encode_label(const Signal &sig, const dp::String &label) const {
            const auto *table = choices_of(sig);
            auto raw = table != nullptr ? table->value_of(label) : dp::Optional<i64>{};
            if (!raw.has_value()) {
                return Result<u64>::err(
                    Error::value_out_of_range("signal '" + sig.name + "' has no choice '" + label + "'"));
            }
            return raw_to_bits(sig, static_cast<f64>(*raw));
        }

        // Writes the signal span only; bits outside it are left as they are
        Result<void> inject(const Signal &sig, u64 raw_bits, u8 *data, usize size) const {
            auto span = check_span(sig, size * 8);
            if (!span.is_ok()) {
                return span;
            }
            raw_bits &= bitfield::mask<u64>(sig.length);
            if (sig.is_big_endian())
                bitfield::inject_be(data, sig.start_bit, sig.length, raw_bits);
            else
                bitfield::inject_le(data, sig.start_bit, sig.length, raw_bits);
            return {};
        }

        Result<void> inject(const Signal &sig, u64 raw_bits, dp::Vector<u8> &payload) const {
            return inject(sig, raw_bits, payload.data(), payload.size());
        }

        // encode + inject; the payload is unchanged when either step fails
        Result<void> encode_into(const Signal &sig, f64 physical, dp::Vector<u8> &payload) const {
            auto span = check_span(sig, payload.size() * 8);
            if (!span.is_ok()) {
                return span;
            }
            auto bits = encode(sig, physical);
            if (!bits.is_ok()) {
                return Result<void>::err(bits.error());
            }
            return inject(sig, bits.value(), payload);
        }

        Result<void> encode_label_into(const Signal &sig, const dp::String &label, dp::Vector<u8> &payload) const {
            auto span = check_span(sig, payload.size() * 8);
            if (!span.is_ok()) {
                return span;
            }
            auto bits = encode_label(sig, label);
            if (!bits.is_ok()) {
                return Result<void>::err(bits.error());
            }
            return inject(sig, bits.value(), payload);
        }

        const model::ValueTable *choices_of(const Signal &sig) const {
            if (db_ != nullptr)
                return db_->choices_of(sig);
            if (!sig.choices.empty())
                return &sig.choices;
            return nullptr;
        }

        // `raw` is already rounded; rejects anything the signal width cannot hold
        static Result<u64> raw_to_bits(const Signal &sig, f64 raw) {
            if (sig.is_signed()) {
                f64 half = std::ldexp(1.0, sig.length - 1);
                if (raw < -half || raw >= half) {
                    return Result<u64>::err(overflow(sig, raw));
                }
                return Result<u64>::ok(bitfield::truncate_signed(static_cast<i64>(raw), sig.length));
            }
            if (raw < 0.0 || raw >= std::ldexp(1.0, sig.length)) {
                return Result<u64>::err(overflow(sig, raw));
            }
            return Result<u64>::ok(static_cast<u64>(raw));
        }

      private:
        f64 scale(const Signal &sig, f64 raw) const noexcept {
            if (!options_.scaling)
                return raw;
            return raw * sig.factor + sig.offset;
        }

        static Error overflow(const Signal &sig, f64 raw) {
            return Error::value_out_of_range("signal '" + sig.name + "' raw value " + dp::String(std::to_string(raw)) +
                                             " does not fit in " + dp::String(std::to_string(sig.length)) + " bits");
        }
    };

} // namespace vdbc::codec
