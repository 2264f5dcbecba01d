#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../id/arbitration_id.hpp"
#include "../model/database.hpp"
#include "resolver.hpp"
#include <datapod/datapod.hpp>

namespace vdbc::attribute {

    // ─── Auto-created definitions for the Vector attributes ─────────────────────
    namespace defaults {

        inline dp::Vector<dp::String> msg_send_types() {
            return {"cyclic",
                    "spontaneous",
                    "cyclicIfActive",
                    "spontaneousWithDelay",
                    "cyclicAndSpontaneous",
                    "cyclicAndSpontaneousWithDelay",
                    "spontaneousWithRepetition",
                    "cyclicIfActiveAndSpontaneousWD"};
        }

        inline dp::Vector<dp::String> sig_send_types() {
            return {"Cyclic",   "OnWrite",         "OnWriteWithRepetition",  "OnChange", "OnChangeWithRepetition",
                    "IfActive", "IfActiveWithRepetition", "NoSigSendType"};
        }

        inline AttributeDefinition definition_for(const dp::String &name) {
            if (name == attr::PROTOCOL_TYPE || name == attr::BUS_TYPE || name == attr::DB_NAME)
                return AttributeDefinition::string(name, ObjectKind::Database, dp::String(""));
            if (name == attr::USE_GM_PARAMETER_IDS)
                return AttributeDefinition::integer(name, ObjectKind::Database, 0, 1, 0);
            if (name == attr::MULTIPLEX_EXT_ENABLED)
                return AttributeDefinition::yes_no(name, ObjectKind::Database);
            if (name == attr::GEN_MSG_IL_SUPPORT)
                return AttributeDefinition::yes_no(name, ObjectKind::Message);
            if (name == attr::GEN_MSG_SEND_TYPE)
                return AttributeDefinition::enumeration(name, ObjectKind::Message, msg_send_types(), dp::String("cyclic"));
            if (name == attr::GEN_SIG_SEND_TYPE)
                return AttributeDefinition::enumeration(name, ObjectKind::Signal, sig_send_types(), dp::String("Cyclic"));
            if (name == attr::GEN_MSG_CYCLE_TIME || name == attr::GEN_MSG_DELAY_TIME ||
                name == attr::GEN_MSG_START_DELAY_TIME)
                return AttributeDefinition::integer(name, ObjectKind::Message, 0, ATTR_INT_MAX);
            if (name == attr::SPN)
                return AttributeDefinition::integer(name, ObjectKind::Signal, 0, 524287);
            if (name == attr::GEN_SIG_START_VALUE || name == attr::GEN_SIG_INACTIVE_VALUE)
                return AttributeDefinition::integer(name, ObjectKind::Signal, 0, ATTR_INT_MAX);
            if (name == attr::TP_TX_IDENTIFIER || name == attr::TP_RX_IDENTIFIER)
                return AttributeDefinition::hex(name, ObjectKind::Node, 0, 0x7FFFFFF);
            // NmStationAddress and anything else unknown here
            return AttributeDefinition::hex(name, ObjectKind::Node, 0, ATTR_INT_MAX);
        }

    } // namespace defaults

    // Defines `name` with its built-in shape unless the database already has it
    inline Result<const AttributeDefinition *> ensure_definition(Database &db, const dp::String &name) {
        if (const auto *existing = db.definition(name)) {
            return Result<const AttributeDefinition *>::ok(existing);
        }
        auto defined = db.define_attribute(defaults::definition_for(name));
        if (!defined.is_ok()) {
            return Result<const AttributeDefinition *>::err(defined.error());
        }
        return Result<const AttributeDefinition *>::ok(db.definition(name));
    }

    // Absent attributes are reported as UnknownAttribute or NoAttributeValue
    inline bool is_absent(const Error &err) noexcept {
        return err.code == ErrorCode::UnknownAttribute || err.code == ErrorCode::NoAttributeValue;
    }

    namespace detail {

        inline Result<i64> as_integer(Result<Value> r) {
            if (!r.is_ok())
                return Result<i64>::err(r.error());
            const auto &v = r.value();
            if (v.type == AttributeType::String || v.type == AttributeType::Float) {
                return Result<i64>::err(
                    Error::type_mismatch(dp::String("expected an integer attribute, got ") + attribute_type_name(v.type)));
            }
            return Result<i64>::ok(v.integer);
        }

        inline Result<dp::String> as_text(Result<Value> r) {
            if (!r.is_ok())
                return Result<dp::String>::err(r.error());
            if (r.value().type != AttributeType::String) {
                return Result<dp::String>::err(Error::type_mismatch("expected a string attribute"));
            }
            return Result<dp::String>::ok(r.value().text);
        }

        inline Result<dp::String> as_label(const Database &db, const dp::String &name, Result<Value> r) {
            if (!r.is_ok())
                return Result<dp::String>::err(r.error());
            const auto *def = db.definition(name);
            auto label = def->label_of(r.value());
            if (!label.has_value()) {
                return Result<dp::String>::err(Error::type_mismatch("attribute '" + name + "' is not an enumeration"));
            }
            return Result<dp::String>::ok(*label);
        }

        inline Result<bool> as_yes_no(Result<Value> r) {
            auto i = as_integer(std::move(r));
            if (!i.is_ok())
                return Result<bool>::err(i.error());
            return Result<bool>::ok(i.value() != 0);
        }

        inline Result<Value> enum_value(const AttributeDefinition &def, const dp::String &label) {
            auto index = def.index_of(label);
            if (!index.has_value()) {
                return Result<Value>::err(
                    Error::value_out_of_range("'" + label + "' is not a choice of attribute '" + def.name + "'"));
            }
            return Result<Value>::ok(Value::of_enum(*index));
        }

        inline Value typed(const AttributeDefinition &def, i64 v) {
            if (def.type == AttributeType::Hex)
                return Value::of_hex(v);
            if (def.type == AttributeType::Float)
                return Value::of_float(static_cast<f64>(v));
            if (def.type == AttributeType::Enum)
                return Value::of_enum(v);
            return Value::of_int(v);
        }

    } // namespace detail

    // ─── Database ────────────────────────────────────────────────────────────────
    inline Result<dp::String> protocol_type(const Database &db) {
        return detail::as_text(AttributeResolver(db).resolve_database(attr::PROTOCOL_TYPE));
    }
    inline Result<dp::String> bus_type(const Database &db) {
        return detail::as_text(AttributeResolver(db).resolve_database(attr::BUS_TYPE));
    }
    inline Result<dp::String> db_name(const Database &db) {
        return detail::as_text(AttributeResolver(db).resolve_database(attr::DB_NAME));
    }
    inline Result<bool> uses_gm_parameter_ids(const Database &db) {
        return detail::as_yes_no(AttributeResolver(db).resolve_database(attr::USE_GM_PARAMETER_IDS));
    }
    inline Result<bool> multiplex_ext_enabled(const Database &db) {
        return detail::as_yes_no(AttributeResolver(db).resolve_database(attr::MULTIPLEX_EXT_ENABLED));
    }

    inline Result<void> set_string(Database &db, const char *name, dp::String value) {
        auto def = ensure_definition(db, name);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        return db.set_database_attribute(name, Value::of_string(std::move(value)));
    }
    inline Result<void> set_protocol_type(Database &db, dp::String value) {
        return set_string(db, attr::PROTOCOL_TYPE, std::move(value));
    }
    inline Result<void> set_bus_type(Database &db, dp::String value) {
        return set_string(db, attr::BUS_TYPE, std::move(value));
    }
    inline Result<void> set_db_name(Database &db, dp::String value) {
        return set_string(db, attr::DB_NAME, std::move(value));
    }
    inline Result<void> set_use_gm_parameter_ids(Database &db, bool on) {
        auto def = ensure_definition(db, attr::USE_GM_PARAMETER_IDS);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        return db.set_database_attribute(attr::USE_GM_PARAMETER_IDS, detail::typed(*def.value(), on ? 1 : 0));
    }
    inline Result<void> set_multiplex_ext_enabled(Database &db, bool on) {
        auto def = ensure_definition(db, attr::MULTIPLEX_EXT_ENABLED);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        return db.set_database_attribute(attr::MULTIPLEX_EXT_ENABLED, detail::typed(*def.value(), on ? 1 : 0));
    }

    // ─── Message ─────────────────────────────────────────────────────────────────
    inline Result<i64> cycle_time(const Database &db, const model::Message &msg) {
        return detail::as_integer(AttributeResolver(db).resolve(msg, dp::String(attr::GEN_MSG_CYCLE_TIME)));
    }
    inline Result<i64> delay_time(const Database &db, const model::Message &msg) {
        return detail::as_integer(AttributeResolver(db).resolve(msg, dp::String(attr::GEN_MSG_DELAY_TIME)));
    }
    inline Result<i64> start_delay_time(const Database &db, const model::Message &msg) {
        return detail::as_integer(AttributeResolver(db).resolve(msg, dp::String(attr::GEN_MSG_START_DELAY_TIME)));
    }
    inline Result<dp::String> send_type(const Database &db, const model::Message &msg) {
        return detail::as_label(db, attr::GEN_MSG_SEND_TYPE,
                                AttributeResolver(db).resolve(msg, dp::String(attr::GEN_MSG_SEND_TYPE)));
    }
    inline Result<bool> il_support(const Database &db, const model::Message &msg) {
        return detail::as_yes_no(AttributeResolver(db).resolve(msg, dp::String(attr::GEN_MSG_IL_SUPPORT)));
    }

    inline Result<void> set_message_integer(Database &db, const dp::String &message, const char *name, i64 value) {
        auto def = ensure_definition(db, name);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        return db.set_message_attribute(message, name, detail::typed(*def.value(), value));
    }
    inline Result<void> set_cycle_time(Database &db, const dp::String &message, i64 ms) {
        return set_message_integer(db, message, attr::GEN_MSG_CYCLE_TIME, ms);
    }
    inline Result<void> set_delay_time(Database &db, const dp::String &message, i64 ms) {
        return set_message_integer(db, message, attr::GEN_MSG_DELAY_TIME, ms);
    }
    inline Result<void> set_start_delay_time(Database &db, const dp::String &message, i64 ms) {
        return set_message_integer(db, message, attr::GEN_MSG_START_DELAY_TIME, ms);
    }
    inline Result<void> set_il_support(Database &db, const dp::String &message, bool on) {
        return set_message_integer(db, message, attr::GEN_MSG_IL_SUPPORT, on ? 1 : 0);
    }
    inline Result<void> set_send_type(Database &db, const dp::String &message, const dp::String &label) {
        auto def = ensure_definition(db, attr::GEN_MSG_SEND_TYPE);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        auto value = detail::enum_value(*def.value(), label);
        if (!value.is_ok())
            return Result<void>::err(value.error());
        return db.set_message_attribute(message, attr::GEN_MSG_SEND_TYPE, value.value());
    }

    // ─── Signal ──────────────────────────────────────────────────────────────────
    inline Result<i64> start_value(const Database &db, const model::Signal &sig) {
        return detail::as_integer(AttributeResolver(db).resolve(sig, dp::String(attr::GEN_SIG_START_VALUE)));
    }
    inline Result<i64> inactive_value(const Database &db, const model::Signal &sig) {
        return detail::as_integer(AttributeResolver(db).resolve(sig, dp::String(attr::GEN_SIG_INACTIVE_VALUE)));
    }
    inline Result<i64> spn(const Database &db, const model::Signal &sig) {
        return detail::as_integer(AttributeResolver(db).resolve(sig, dp::String(attr::SPN)));
    }
    inline Result<dp::String> signal_send_type(const Database &db, const model::Signal &sig) {
        return detail::as_label(db, attr::GEN_SIG_SEND_TYPE,
                                AttributeResolver(db).resolve(sig, dp::String(attr::GEN_SIG_SEND_TYPE)));
    }

    inline Result<void> set_signal_integer(Database &db, const dp::String &message, const dp::String &signal,
                                           const char *name, i64 value) {
        auto def = ensure_definition(db, name);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        return db.set_signal_attribute(message, signal, name, detail::typed(*def.value(), value));
    }
    inline Result<void> set_start_value(Database &db, const dp::String &message, const dp::String &signal, i64 raw) {
        return set_signal_integer(db, message, signal, attr::GEN_SIG_START_VALUE, raw);
    }
    inline Result<void> set_inactive_value(Database &db, const dp::String &message, const dp::String &signal,
                                           i64 raw) {
        return set_signal_integer(db, message, signal, attr::GEN_SIG_INACTIVE_VALUE, raw);
    }
    inline Result<void> set_spn(Database &db, const dp::String &message, const dp::String &signal, i64 value) {
        return set_signal_integer(db, message, signal, attr::SPN, value);
    }
    inline Result<void> set_signal_send_type(Database &db, const dp::String &message, const dp::String &signal,
                                             const dp::String &label) {
        auto def = ensure_definition(db, attr::GEN_SIG_SEND_TYPE);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        auto value = detail::enum_value(*def.value(), label);
        if (!value.is_ok())
            return Result<void>::err(value.error());
        return db.set_signal_attribute(message, signal, attr::GEN_SIG_SEND_TYPE, value.value());
    }

    // ─── Node ────────────────────────────────────────────────────────────────────
    inline Result<i64> tp_tx_identifier(const Database &db, const model::Node &node) {
        return detail::as_integer(AttributeResolver(db).resolve(node, dp::String(attr::TP_TX_IDENTIFIER)));
    }
    inline Result<i64> tp_rx_identifier(const Database &db, const model::Node &node) {
        return detail::as_integer(AttributeResolver(db).resolve(node, dp::String(attr::TP_RX_IDENTIFIER)));
    }
    inline Result<i64> nm_station_address(const Database &db, const model::Node &node) {
        return detail::as_integer(AttributeResolver(db).resolve(node, dp::String(attr::NM_STATION_ADDRESS)));
    }

    inline Result<void> set_node_integer(Database &db, const dp::String &node, const char *name, i64 value) {
        auto def = ensure_definition(db, name);
        if (!def.is_ok())
            return Result<void>::err(def.error());
        return db.set_node_attribute(node, name, detail::typed(*def.value(), value));
    }
    inline Result<void> set_tp_tx_identifier(Database &db, const dp::String &node, i64 id) {
        return set_node_integer(db, node, attr::TP_TX_IDENTIFIER, id);
    }
    inline Result<void> set_tp_rx_identifier(Database &db, const dp::String &node, i64 id) {
        return set_node_integer(db, node, attr::TP_RX_IDENTIFIER, id);
    }
    inline Result<void> set_nm_station_address(Database &db, const dp::String &node, i64 address) {
        return set_node_integer(db, node, attr::NM_STATION_ADDRESS, address);
    }

    // First node whose TpTxIdentifier or TpRxIdentifier equals `id`
    inline const model::Node *find_node_by_tp_identifier(const Database &db, i64 id) {
        for (const auto &node : db.nodes()) {
            auto rx = tp_rx_identifier(db, node);
            if (rx.is_ok() && rx.value() == id)
                return &node;
            auto tx = tp_tx_identifier(db, node);
            if (tx.is_ok() && tx.value() == id)
                return &node;
        }
        return nullptr;
    }

    // ─── Arbitration-ID scheme ───────────────────────────────────────────────────
    // UseGMParameterIDs wins over ProtocolType "J1939"; neither set means plain
    inline Result<id::IdScheme> id_scheme(const Database &db) {
        auto gm = uses_gm_parameter_ids(db);
        if (gm.is_ok() && gm.value()) {
            return Result<id::IdScheme>::ok(id::IdScheme::GMParameterId);
        }
        if (!gm.is_ok() && !is_absent(gm.error())) {
            return Result<id::IdScheme>::err(gm.error());
        }
        auto protocol = protocol_type(db);
        if (protocol.is_ok() && protocol.value() == "J1939") {
            return Result<id::IdScheme>::ok(id::IdScheme::J1939);
        }
        if (!protocol.is_ok() && !is_absent(protocol.error())) {
            return Result<id::IdScheme>::err(protocol.error());
        }
        return Result<id::IdScheme>::ok(id::IdScheme::Plain);
    }

    inline Result<id::IdScheme> id_scheme(const Database &db, const model::Message &msg) {
        if (msg.id_scheme.has_value()) {
            return Result<id::IdScheme>::ok(*msg.id_scheme);
        }
        return id_scheme(db);
    }

    inline Result<id::IdVariant> arbitration_id(const Database &db, const model::Message &msg) {
        auto scheme = id_scheme(db, msg);
        if (!scheme.is_ok()) {
            return Result<id::IdVariant>::err(scheme.error());
        }
        return id::decode(msg.frame_id, msg.is_extended, scheme.value());
    }

} // namespace vdbc::attribute
