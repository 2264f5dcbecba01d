#pragma once

#include "../attribute/well_known.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../id/arbitration_id.hpp"
#include "../model/database.hpp"
#include "message_codec.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace vdbc::codec {

    using model::Node;

    // ─── Message codec seen from one node ───────────────────────────────────────
    // A node may write the signals of messages it sends and observes only the
    // signals listed with it as a receiver.
    class NodeScopedCodec {
        const model::Database &db_;
        MessageCodec codec_;

      public:
        explicit NodeScopedCodec(const model::Database &db, CodecOptions options = {})
            : db_(db), codec_(db, options) {}

        const MessageCodec &message_codec() const noexcept { return codec_; }

        // ─── Transmit side ───────────────────────────────────────────────────────
        Result<dp::Vector<u8>> encode_for_node(const Node &node, const model::Message &msg,
                                               const dp::Map<dp::String, f64> &values) const {
            if (!msg.is_sent_by(node.name)) {
                dp::String first = values.empty() ? msg.name : values.begin()->first;
                return Result<dp::Vector<u8>>::err(Error::not_owned(node.name, first));
            }
            echo::category("vdbc.codec.node").trace(node.name, " encodes ", msg.name, " (", values.size(), " values)");
            return codec_.encode(msg, values);
        }

        Result<dp::Vector<u8>> encode_for_node(const dp::String &node_name, const dp::String &message_name,
                                               const dp::Map<dp::String, f64> &values) const {
            const auto *node = db_.find_node(node_name);
            if (node == nullptr) {
                return Result<dp::Vector<u8>>::err(Error::unknown_node(node_name));
            }
            const auto *msg = db_.find_message(message_name);
            if (msg == nullptr) {
                return Result<dp::Vector<u8>>::err(Error::unknown_message(message_name));
            }
            return encode_for_node(*node, *msg, values);
        }

        // Frame id with the node's TpTxIdentifier in the J1939 source address or
        // GM source id; other schemes keep the message frame id
        Result<FrameId> frame_id_for_node(const Node &node, const model::Message &msg) const {
            if (!msg.is_sent_by(node.name)) {
                return Result<FrameId>::err(Error::not_owned(node.name, msg.name));
            }
            auto tp_tx = attribute::tp_tx_identifier(db_, node);
            if (!tp_tx.is_ok()) {
                if (attribute::is_absent(tp_tx.error()))
                    return Result<FrameId>::ok(msg.frame_id);
                return Result<FrameId>::err(tp_tx.error());
            }
            auto variant = attribute::arbitration_id(db_, msg);
            if (!variant.is_ok()) {
                return Result<FrameId>::err(variant.error());
            }
            auto sourced = id::with_source(variant.value(), static_cast<u32>(tp_tx.value()));
            if (!sourced.is_ok()) {
                return Result<FrameId>::err(sourced.error());
            }
            return id::encode(sourced.value());
        }

        // ─── Receive side ────────────────────────────────────────────────────────
        // Signals the node does not receive are dropped, not reported
        Result<DecodedMessage> decode_for_node(const Node &node, const model::Message &msg,
                                               const dp::Vector<u8> &payload) const {
            auto decoded = codec_.decode(msg, payload);
            if (!decoded.is_ok()) {
                return decoded;
            }
            DecodedMessage out;
            out.message = decoded.value().message;
            out.mux_value = decoded.value().mux_value;
            for (const auto &sig : decoded.value().signals) {
                const auto *def = msg.signal(sig.name);
                if (def != nullptr && def->is_received_by(node.name)) {
                    out.signals.push_back(sig);
                }
            }
            echo::category("vdbc.codec.node")
                .trace(node.name, " observes ", out.signals.size(), "/", decoded.value().signals.size(), " signals of ",
                       msg.name);
            return Result<DecodedMessage>::ok(std::move(out));
        }

        Result<DecodedMessage> decode_for_node(const dp::String &node_name, const dp::String &message_name,
                                               const dp::Vector<u8> &payload) const {
            const auto *node = db_.find_node(node_name);
            if (node == nullptr) {
                return Result<DecodedMessage>::err(Error::unknown_node(node_name));
            }
            const auto *msg = db_.find_message(message_name);
            if (msg == nullptr) {
                return Result<DecodedMessage>::err(Error::unknown_message(message_name));
            }
            return decode_for_node(*node, *msg, payload);
        }

        // Looks the message up by frame id. The node must receive it, and when the
        // node has a TpTxIdentifier the frame's J1939/GM source must equal it.
        Result<DecodedMessage> decode_frame_for_node(const Node &node, FrameId frame_id, bool is_extended,
                                                     const dp::Vector<u8> &payload) const {
            const auto *msg = db_.find_message_by_frame_id(frame_id, is_extended);
            if (msg == nullptr) {
                return Result<DecodedMessage>::err(Error::unknown_message(id::hex_string(frame_id, is_extended)));
            }
            if (!db_.receives(node.name, *msg)) {
                return Result<DecodedMessage>::err(
                    Error(ErrorCode::UnknownMessage, "node '" + node.name + "' does not receive '" + msg->name + "'"));
            }

            auto tp_tx = attribute::tp_tx_identifier(db_, node);
            if (tp_tx.is_ok()) {
                auto scheme = attribute::id_scheme(db_, *msg);
                if (!scheme.is_ok()) {
                    return Result<DecodedMessage>::err(scheme.error());
                }
                auto variant = id::decode(frame_id, is_extended, scheme.value());
                if (!variant.is_ok()) {
                    return Result<DecodedMessage>::err(variant.error());
                }
                auto source = id::source_of(variant.value());
                if (source.has_value() && static_cast<i64>(*source) != tp_tx.value()) {
                    return Result<DecodedMessage>::err(Error::invalid_identifier(
                        "frame " + id::hex_string(frame_id, is_extended) + " source does not match node '" +
                        node.name + "'"));
                }
            } else if (!attribute::is_absent(tp_tx.error())) {
                return Result<DecodedMessage>::err(tp_tx.error());
            }
            return decode_for_node(node, *msg, payload);
        }
    };

} // namespace vdbc::codec
