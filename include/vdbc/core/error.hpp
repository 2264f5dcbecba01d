#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace vdbc {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        InvalidIdentifier,
        BitRangeExceeded,
        ValueOutOfRange,
        SignalNotOwnedByNode,
        NoAttributeValue,
        TypeMismatch,
        StructuralInvariantViolation,
        UnknownMessage,
        UnknownSignal,
        UnknownNode,
        UnknownAttribute,
        MultiplexerMismatch,
    };

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error invalid_identifier(u64 raw, bool extended) noexcept {
            return Error(ErrorCode::InvalidIdentifier, "frame id " + dp::String(std::to_string(raw)) +
                                                           " exceeds " + (extended ? "29" : "11") + " bits");
        }
        static Error invalid_identifier(dp::String msg) noexcept {
            return Error(ErrorCode::InvalidIdentifier, std::move(msg));
        }
        static Error bit_range_exceeded(const dp::String &signal, usize payload_bits) noexcept {
            return Error(ErrorCode::BitRangeExceeded, "signal '" + signal + "' does not fit in " +
                                                          dp::String(std::to_string(payload_bits)) + " bits");
        }
        static Error value_out_of_range(dp::String msg) noexcept {
            return Error(ErrorCode::ValueOutOfRange, std::move(msg));
        }
        static Error not_owned(const dp::String &node, const dp::String &signal) noexcept {
            return Error(ErrorCode::SignalNotOwnedByNode, "node '" + node + "' does not transmit '" + signal + "'");
        }
        static Error no_attribute_value(const dp::String &attribute) noexcept {
            return Error(ErrorCode::NoAttributeValue, "no value or default for attribute '" + attribute + "'");
        }
        static Error type_mismatch(dp::String msg) noexcept { return Error(ErrorCode::TypeMismatch, std::move(msg)); }
        static Error structural(dp::String msg) noexcept {
            return Error(ErrorCode::StructuralInvariantViolation, std::move(msg));
        }
        static Error unknown_message(const dp::String &name) noexcept {
            return Error(ErrorCode::UnknownMessage, "unknown message '" + name + "'");
        }
        static Error unknown_signal(const dp::String &name) noexcept {
            return Error(ErrorCode::UnknownSignal, "unknown signal '" + name + "'");
        }
        static Error unknown_node(const dp::String &name) noexcept {
            return Error(ErrorCode::UnknownNode, "unknown node '" + name + "'");
        }
        static Error unknown_attribute(const dp::String &name) noexcept {
            return Error(ErrorCode::UnknownAttribute, "unknown attribute '" + name + "'");
        }
        static Error multiplexer_mismatch(const dp::String &signal, i64 selector) noexcept {
            return Error(ErrorCode::MultiplexerMismatch, "signal '" + signal + "' is not active for multiplexer value " +
                                                             dp::String(std::to_string(selector)));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace vdbc
