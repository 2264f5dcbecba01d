#pragma once

#include "../attribute/well_known.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../model/database.hpp"
#include "../model/message.hpp"
#include "options.hpp"
#include "signal_codec.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>

namespace vdbc::codec {

    using model::Message;

    // ─── Decoded message ────────────────────────────────────────────────────────
    struct DecodedMessage {
        dp::String message;
        dp::Vector<DecodedSignal> signals; // in message signal order
        dp::Optional<i64> mux_value;       // raw multiplexor value, if multiplexed

        const DecodedSignal *find(const dp::String &name) const {
            for (const auto &s : signals) {
                if (s.name == name)
                    return &s;
            }
            return nullptr;
        }

        bool contains(const dp::String &name) const { return find(name) != nullptr; }
        usize size() const noexcept { return signals.size(); }
        bool empty() const noexcept { return signals.empty(); }

        dp::Map<dp::String, f64> values() const {
            dp::Map<dp::String, f64> out;
            for (const auto &s : signals) {
                out[s.name] = s.value;
            }
            return out;
        }
    };

    // ─── Whole-message codec with multiplexing ──────────────────────────────────
    class MessageCodec {
        const model::Database &db_;
        CodecOptions options_;
        SignalCodec signals_;

      public:
        explicit MessageCodec(const model::Database &db, CodecOptions options = {})
            : db_(db), options_(options), signals_(&db, options) {}

        const SignalCodec &signal_codec() const noexcept { return signals_; }
        const CodecOptions &options() const noexcept { return options_; }

        // Bytes past the DLC are ignored. Multiplexed signals whose selector does
        // not match the multiplexor value are left out of the result.
        Result<DecodedMessage> decode(const Message &msg, const u8 *data, usize size) const {
            usize used = std::min<usize>(size, msg.length);

            DecodedMessage out;
            out.message = msg.name;

            if (const auto *mux = msg.multiplexor()) {
                auto selector = signals_.decode(*mux, data, used);
                if (!selector.is_ok()) {
                    return Result<DecodedMessage>::err(selector.error());
                }
                out.mux_value = selector.value().raw;
            }

            for (const auto &sig : msg.signals) {
                if (out.mux_value.has_value() && !sig.mux.matches(*out.mux_value)) {
                    continue;
                }
                auto decoded = signals_.decode(sig, data, used);
                if (!decoded.is_ok()) {
                    return Result<DecodedMessage>::err(decoded.error());
                }
                out.signals.push_back(std::move(decoded.value()));
            }
            return Result<DecodedMessage>::ok(std::move(out));
        }

        Result<DecodedMessage> decode(const Message &msg, const dp::Vector<u8> &payload) const {
            return decode(msg, payload.data(), payload.size());
        }

        Result<DecodedMessage> decode(const dp::String &message_name, const dp::Vector<u8> &payload) const {
            const auto *msg = db_.find_message(message_name);
            if (msg == nullptr) {
                return Result<DecodedMessage>::err(Error::unknown_message(message_name));
            }
            return decode(*msg, payload);
        }

        Result<DecodedMessage> decode_frame(FrameId frame_id, bool is_extended, const dp::Vector<u8> &payload) const {
            const auto *msg = db_.find_message_by_frame_id(frame_id, is_extended);
            if (msg == nullptr) {
                return Result<DecodedMessage>::err(
                    Error::unknown_message(id::hex_string(frame_id & ~DBC_EXTENDED_FLAG, is_extended)));
            }
            return decode(*msg, payload);
        }

        // Signals without a supplied value take their GenSigStartValue (raw), or
        // zero when none resolves. A start value wider than the signal fails.
        Result<dp::Vector<u8>> encode(const Message &msg, const dp::Map<dp::String, f64> &values) const {
            for (const auto &[name, value] : values) {
                if (msg.signal(name) == nullptr) {
                    return Result<dp::Vector<u8>>::err(Error::unknown_signal(name));
                }
            }

            dp::Vector<u8> payload(msg.length, options_.padding ? 0xFF : 0x00);

            dp::Optional<i64> selector;
            if (const auto *mux = msg.multiplexor()) {
                auto raw = selector_of(*mux, values);
                if (!raw.is_ok()) {
                    return Result<dp::Vector<u8>>::err(raw.error());
                }
                selector = raw.value();
            }

            for (const auto &sig : msg.signals) {
                auto it = values.find(sig.name);
                bool supplied = it != values.end();
                if (selector.has_value() && !sig.mux.matches(*selector)) {
                    if (supplied) {
                        return Result<dp::Vector<u8>>::err(Error::multiplexer_mismatch(sig.name, *selector));
                    }
                    continue;
                }

                if (supplied) {
                    auto written = signals_.encode_into(sig, it->second, payload);
                    if (!written.is_ok()) {
                        return Result<dp::Vector<u8>>::err(written.error());
                    }
                    continue;
                }
                auto start = start_bits(sig);
                if (!start.is_ok()) {
                    return Result<dp::Vector<u8>>::err(start.error());
                }
                auto written = signals_.inject(sig, start.value(), payload);
                if (!written.is_ok()) {
                    return Result<dp::Vector<u8>>::err(written.error());
                }
            }
            return Result<dp::Vector<u8>>::ok(std::move(payload));
        }

        Result<dp::Vector<u8>> encode(const dp::String &message_name, const dp::Map<dp::String, f64> &values) const {
            const auto *msg = db_.find_message(message_name);
            if (msg == nullptr) {
                return Result<dp::Vector<u8>>::err(Error::unknown_message(message_name));
            }
            return encode(*msg, values);
        }

      private:
        Result<u64> start_bits(const model::Signal &sig) const {
            auto start = attribute::start_value(db_, sig);
            if (!start.is_ok()) {
                if (attribute::is_absent(start.error()))
                    return Result<u64>::ok(0);
                return Result<u64>::err(start.error());
            }
            return SignalCodec::raw_to_bits(sig, static_cast<f64>(start.value()));
        }

        // Raw multiplexor value that the encoded frame will carry
        Result<i64> selector_of(const model::Signal &mux, const dp::Map<dp::String, f64> &values) const {
            u64 bits = 0;
            auto it = values.find(mux.name);
            if (it != values.end()) {
                auto encoded = signals_.encode(mux, it->second);
                if (!encoded.is_ok()) {
                    return Result<i64>::err(encoded.error());
                }
                bits = encoded.value();
            } else {
                auto start = start_bits(mux);
                if (!start.is_ok()) {
                    return Result<i64>::err(start.error());
                }
                bits = start.value();
            }
            if (mux.is_signed()) {
                return Result<i64>::ok(bitfield::sign_extend(bits, mux.length));
            }
            return Result<i64>::ok(static_cast<i64>(bits));
        }
    };

} // namespace vdbc::codec
