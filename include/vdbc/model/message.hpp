#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../id/arbitration_id.hpp"
#include "../util/bitfield.hpp"
#include "attribute.hpp"
#include "signal.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <string>

namespace vdbc::model {

    // ─── Signal group (SIG_GROUP_) ──────────────────────────────────────────────
    struct SignalGroup {
        dp::String name;
        u32 repetitions = 1;
        dp::Vector<dp::String> signal_names;
    };

    // ─── Message (BO_) ──────────────────────────────────────────────────────────
    struct Message {
        dp::String name;
        FrameId frame_id = 0;
        bool is_extended = false;
        u8 length = CAN_DATA_LENGTH; // DLC in bytes
        dp::Optional<dp::String> transmitter; // nullopt = Vector__XXX
        dp::Vector<dp::String> senders;       // additional senders (BO_TX_BU_)
        dp::Vector<Signal> signals;
        dp::Vector<SignalGroup> signal_groups;
        AttributeSet attributes;
        dp::Optional<dp::String> comment;
        dp::Optional<id::IdScheme> id_scheme; // overrides the database scheme

        Message() = default;
        Message(dp::String n, FrameId id, u8 dlc, bool extended = false)
            : name(std::move(n)), frame_id(id), is_extended(extended), length(dlc) {}

        const Signal *signal(const dp::String &signal_name) const {
            for (const auto &s : signals) {
                if (s.name == signal_name)
                    return &s;
            }
            return nullptr;
        }

        Signal *signal_mut(const dp::String &signal_name) {
            for (auto &s : signals) {
                if (s.name == signal_name)
                    return &s;
            }
            return nullptr;
        }

        // The first signal with role IsMultiplexor
        const Signal *multiplexor() const {
            for (const auto &s : signals) {
                if (s.is_multiplexor())
                    return &s;
            }
            return nullptr;
        }

        bool is_multiplexed() const { return multiplexor() != nullptr; }

        bool is_sent_by(const dp::String &node) const {
            if (transmitter.has_value() && *transmitter == node)
                return true;
            for (const auto &s : senders) {
                if (s == node)
                    return true;
            }
            return false;
        }

        // Union of the receivers of all signals, in first-seen order
        dp::Vector<dp::String> receivers() const {
            dp::Vector<dp::String> out;
            for (const auto &s : signals) {
                for (const auto &r : s.receivers) {
                    if (std::find(out.begin(), out.end(), r) == out.end())
                        out.push_back(r);
                }
            }
            return out;
        }

        // Names of the signals present in a frame whose multiplexor carries `mux_value`
        dp::Vector<dp::String> active_signals(i64 mux_value) const {
            dp::Vector<dp::String> out;
            for (const auto &s : signals) {
                if (s.mux.matches(mux_value))
                    out.push_back(s.name);
            }
            return out;
        }

        // BO_ form of the frame id: extended frames carry bit 31
        u32 dbc_frame_id() const noexcept { return is_extended ? (frame_id | DBC_EXTENDED_FLAG) : frame_id; }

        usize payload_bits() const noexcept { return static_cast<usize>(length) * 8; }

        void sort_signals() {
            std::stable_sort(signals.begin(), signals.end(),
                             [](const Signal &a, const Signal &b) { return a.sort_key() < b.sort_key(); });
        }

        // ─── Fluent API ──────────────────────────────────────────────────────────
        Message &with_signal(Signal s) {
            signals.push_back(std::move(s));
            return *this;
        }
        Message &with_transmitter(dp::String node) {
            transmitter = std::move(node);
            return *this;
        }
        Message &with_group(SignalGroup group) {
            signal_groups.push_back(std::move(group));
            return *this;
        }

        // ─── Structural checks ───────────────────────────────────────────────────
        Result<void> validate() const {
            auto id_ok = id::check_width(frame_id, is_extended);
            if (!id_ok.is_ok()) {
                return id_ok;
            }
            if (length > CANFD_DATA_LENGTH) {
                return Result<void>::err(Error::structural("message '" + name + "' DLC exceeds 64 bytes"));
            }

            usize multiplexors = 0;
            for (usize i = 0; i < signals.size(); ++i) {
                const auto &s = signals[i];
                auto where = "signal '" + s.name + "' in message '" + name + "'";

                for (usize j = i + 1; j < signals.size(); ++j) {
                    if (signals[j].name == s.name) {
                        return Result<void>::err(Error::structural("duplicate " + where));
                    }
                }
                if (s.length == 0 || s.length > MAX_SIGNAL_BITS) {
                    return Result<void>::err(Error::structural(where + " length must be 1..64"));
                }
                if (s.kind == ValueKind::Float && s.length != 32) {
                    return Result<void>::err(Error::structural(where + " is float but not 32 bits"));
                }
                if (s.kind == ValueKind::Double && s.length != 64) {
                    return Result<void>::err(Error::structural(where + " is double but not 64 bits"));
                }
                if (!s.is_float() && s.factor == 0.0) {
                    return Result<void>::err(Error::structural(where + " has factor 0"));
                }
                if (!s.is_big_endian() && s.start_bit >= payload_bits()) {
                    return Result<void>::err(Error::structural(where + " starts outside the payload"));
                }
                if (bitfield::required_bits(s.start_bit, s.length, s.is_big_endian()) > payload_bits()) {
                    return Result<void>::err(Error::structural(where + " does not fit in " +
                                                               dp::String(std::to_string(length)) + " bytes"));
                }
                if (s.is_multiplexor()) {
                    ++multiplexors;
                }
            }

            if (multiplexors > 1) {
                return Result<void>::err(Error::structural("message '" + name + "' has more than one multiplexor"));
            }
            const Signal *mux = multiplexor();
            for (const auto &s : signals) {
                if (!s.is_multiplexed())
                    continue;
                if (mux == nullptr) {
                    return Result<void>::err(Error::structural("signal '" + s.name + "' is multiplexed but message '" +
                                                               name + "' has no multiplexor"));
                }
                if (s.mux.kind == MuxKind::MultiplexedByRange) {
                    if (!s.mux.switch_name.empty() && s.mux.switch_name != mux->name) {
                        return Result<void>::err(Error::structural("signal '" + s.name + "' is switched by '" +
                                                                   s.mux.switch_name + "', not the multiplexor"));
                    }
                    if (s.mux.ranges.empty()) {
                        return Result<void>::err(Error::structural("signal '" + s.name + "' has no mux ranges"));
                    }
                }
            }

            for (const auto &group : signal_groups) {
                for (const auto &member : group.signal_names) {
                    if (signal(member) == nullptr) {
                        return Result<void>::err(Error::structural("signal group '" + group.name +
                                                                   "' references unknown signal '" + member + "'"));
                    }
                }
            }
            return {};
        }
    };

} // namespace vdbc::model
