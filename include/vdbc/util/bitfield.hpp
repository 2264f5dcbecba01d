#pragma once

#include "../core/types.hpp"
#include <cstring>
#include <type_traits>

namespace vdbc {
    namespace util {

        // ─── Bit-level access helpers ────────────────────────────────────────────────
        namespace bitfield {

            // Constrain to unsigned integer types to avoid UB with signed shifts
            template <typename T>
            concept UnsignedInt = std::is_unsigned_v<T>;

            template <UnsignedInt T> constexpr T mask(u8 length) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0) {
                    return 0;
                }
                if (length >= bit_width) {
                    return static_cast<T>(~static_cast<T>(0));
                }
                return static_cast<T>((static_cast<T>(1) << length) - 1);
            }

            template <UnsignedInt T> constexpr T get_bits(T value, u8 start_bit, u8 length) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0 || start_bit >= bit_width) {
                    return 0;
                }
                return (value >> start_bit) & mask<T>(length);
            }

            template <UnsignedInt T> constexpr T set_bits(T value, u8 start_bit, u8 length, T field_value) noexcept {
                constexpr u8 bit_width = sizeof(T) * 8;
                if (length == 0 || start_bit >= bit_width) {
                    return value;
                }
                if (length >= bit_width) {
                    return field_value;
                }
                T m = mask<T>(length);
                value &= ~(m << start_bit);
                value |= (field_value & m) << start_bit;
                return value;
            }

            // Sign-extend the low `length` bits of `raw` to 64 bits
            constexpr i64 sign_extend(u64 raw, u8 length) noexcept {
                if (length == 0) {
                    return 0;
                }
                if (length >= 64) {
                    return static_cast<i64>(raw);
                }
                raw &= mask<u64>(length);
                u64 sign = static_cast<u64>(1) << (length - 1);
                if (raw & sign) {
                    raw |= ~mask<u64>(length);
                }
                return static_cast<i64>(raw);
            }

            // Two's complement of `value` truncated to `length` bits
            constexpr u64 truncate_signed(i64 value, u8 length) noexcept {
                return static_cast<u64>(value) & mask<u64>(length);
            }

            // ─── IEEE-754 reinterpretation ───────────────────────────────────────────
            inline f32 bits_to_f32(u64 raw) noexcept {
                u32 bits = static_cast<u32>(raw & 0xFFFFFFFF);
                f32 out;
                std::memcpy(&out, &bits, sizeof(out));
                return out;
            }

            inline f64 bits_to_f64(u64 raw) noexcept {
                f64 out;
                std::memcpy(&out, &raw, sizeof(out));
                return out;
            }

            inline u64 f32_to_bits(f32 value) noexcept {
                u32 bits;
                std::memcpy(&bits, &value, sizeof(bits));
                return bits;
            }

            inline u64 f64_to_bits(f64 value) noexcept {
                u64 bits;
                std::memcpy(&bits, &value, sizeof(bits));
                return bits;
            }

            // ─── DBC payload bit numbering ───────────────────────────────────────────
            // Payload bit b lives in byte b / 8 at bit position b % 8 (bit 0 = LSB).
            //
            //   Byte:       0        1        2        3
            //          +--------+--------+--------+--- - -
            //   Bit:    7      0 15     8 23    16 31    24
            //
            // Intel: start bit is the LSB, following bits ascend across bytes.
            // Motorola: start bit is the MSB, bits descend within a byte and continue
            // at bit 7 of the next byte (sawtooth order).

            inline bool payload_bit(const u8 *data, usize bit) noexcept { return (data[bit / 8] >> (bit % 8)) & 0x01; }

            inline void set_payload_bit(u8 *data, usize bit, bool on) noexcept {
                u8 m = static_cast<u8>(1u << (bit % 8));
                if (on)
                    data[bit / 8] |= m;
                else
                    data[bit / 8] &= static_cast<u8>(~m);
            }

            // Next lower-significance position of a Motorola signal
            constexpr usize motorola_next(usize bit) noexcept { return (bit % 8 == 0) ? bit + 15 : bit - 1; }

            // Position of a Motorola start bit when the payload is read MSB-first as one
            // big-endian bit string (byte 0 bit 7 = 0)
            constexpr usize motorola_linear(usize start_bit) noexcept {
                return 8 * (start_bit / 8) + (7 - (start_bit % 8));
            }

            // Number of payload bits a signal needs for its span to fit
            constexpr usize required_bits(usize start_bit, u8 length, bool big_endian) noexcept {
                if (big_endian) {
                    return motorola_linear(start_bit) + length;
                }
                return start_bit + length;
            }

            // Caller guarantees the span fits (see required_bits)
            inline u64 extract_le(const u8 *data, usize start_bit, u8 length) noexcept {
                u64 raw = 0;
                for (u8 i = 0; i < length; ++i) {
                    if (payload_bit(data, start_bit + i)) {
                        raw |= static_cast<u64>(1) << i;
                    }
                }
                return raw;
            }

            inline u64 extract_be(const u8 *data, usize start_bit, u8 length) noexcept {
                u64 raw = 0;
                usize pos = start_bit;
                for (u8 i = 0; i < length; ++i) {
                    raw = (raw << 1) | (payload_bit(data, pos) ? 1u : 0u);
                    pos = motorola_next(pos);
                }
                return raw;
            }

            inline void inject_le(u8 *data, usize start_bit, u8 length, u64 raw) noexcept {
                for (u8 i = 0; i < length; ++i) {
                    set_payload_bit(data, start_bit + i, (raw >> i) & 0x01);
                }
            }

            inline void inject_be(u8 *data, usize start_bit, u8 length, u64 raw) noexcept {
                usize pos = start_bit;
                for (u8 i = 0; i < length; ++i) {
                    set_payload_bit(data, pos, (raw >> (length - 1 - i)) & 0x01);
                    pos = motorola_next(pos);
                }
            }

        } // namespace bitfield
    } // namespace util
    using namespace util;
} // namespace vdbc
