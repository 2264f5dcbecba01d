#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "attribute.hpp"
#include "environment_variable.hpp"
#include "message.hpp"
#include "node.hpp"
#include "value_table.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace vdbc::model {

    // (message index, signal index) into Database::messages()
    struct SignalRef {
        usize message = 0;
        usize signal = 0;
    };

    // ─── CAN network description ────────────────────────────────────────────────
    class Database {
        dp::String version_;
        FrameId frame_id_mask_ = 0xFFFFFFFF;
        dp::Vector<Node> nodes_;
        dp::Vector<Message> messages_;
        dp::Vector<EnvironmentVariable> env_vars_;
        dp::Vector<Bus> buses_;
        dp::Map<dp::String, ValueTable> value_tables_;
        dp::Vector<AttributeDefinition> definitions_;
        AttributeSet attributes_;
        dp::Optional<dp::String> comment_;

        // Name indices and node back-references, rebuilt by reindex()
        dp::Map<dp::String, usize> node_index_;
        dp::Map<dp::String, usize> message_index_;
        dp::Map<dp::String, dp::Vector<usize>> tx_index_;
        dp::Map<dp::String, dp::Vector<SignalRef>> rx_index_;

      public:
        Database() = default;

        // ─── Construction ────────────────────────────────────────────────────────
        Result<void> add_node(Node node) {
            if (node.name.empty()) {
                return Result<void>::err(Error::structural("node name is required"));
            }
            if (node_index_.find(node.name) != node_index_.end()) {
                return Result<void>::err(Error::structural("duplicate node '" + node.name + "'"));
            }
            node_index_[node.name] = nodes_.size();
            echo::category("vdbc.database").debug("node added: ", node.name);
            nodes_.push_back(std::move(node));
            return {};
        }

        Result<void> add_message(Message msg) {
            if (msg.name.empty()) {
                return Result<void>::err(Error::structural("message name is required"));
            }
            if (message_index_.find(msg.name) != message_index_.end()) {
                return Result<void>::err(Error::structural("duplicate message '" + msg.name + "'"));
            }
            // BO_ ids arrive with bit 31 marking an extended frame
            if (msg.frame_id & DBC_EXTENDED_FLAG) {
                msg.frame_id &= ~DBC_EXTENDED_FLAG;
                msg.is_extended = true;
            }
            auto valid = msg.validate();
            if (!valid.is_ok()) {
                return valid;
            }
            msg.sort_signals();
            echo::category("vdbc.database")
                .debug("message added: ", msg.name, " id=", id::hex_string(msg.frame_id, msg.is_extended),
                       " signals=", msg.signals.size());
            messages_.push_back(std::move(msg));
            reindex();
            return {};
        }

        Result<void> add_signal(const dp::String &message_name, Signal signal) {
            auto it = message_index_.find(message_name);
            if (it == message_index_.end()) {
                return Result<void>::err(Error::unknown_message(message_name));
            }
            Message candidate = messages_[it->second];
            candidate.signals.push_back(std::move(signal));
            auto valid = candidate.validate();
            if (!valid.is_ok()) {
                return valid;
            }
            candidate.sort_signals();
            messages_[it->second] = std::move(candidate);
            reindex();
            return {};
        }

        Result<void> add_receiver(const dp::String &message_name, const dp::String &signal_name,
                                  const dp::String &node) {
            Message *msg = message_mut(message_name);
            if (msg == nullptr) {
                return Result<void>::err(Error::unknown_message(message_name));
            }
            Signal *sig = msg->signal_mut(signal_name);
            if (sig == nullptr) {
                return Result<void>::err(Error::unknown_signal(signal_name));
            }
            if (!sig->is_received_by(node)) {
                sig->receivers.push_back(node);
                reindex();
            }
            return {};
        }

        Result<void> add_environment_variable(EnvironmentVariable ev) {
            if (find_environment_variable(ev.name) != nullptr) {
                return Result<void>::err(Error::structural("duplicate environment variable '" + ev.name + "'"));
            }
            env_vars_.push_back(std::move(ev));
            return {};
        }

        Result<void> add_bus(Bus bus) {
            if (find_bus(bus.name) != nullptr) {
                return Result<void>::err(Error::structural("duplicate bus '" + bus.name + "'"));
            }
            buses_.push_back(std::move(bus));
            return {};
        }

        Result<void> add_value_table(const dp::String &name, ValueTable table) {
            if (value_tables_.find(name) != value_tables_.end()) {
                return Result<void>::err(Error::structural("duplicate value table '" + name + "'"));
            }
            value_tables_[name] = std::move(table);
            return {};
        }

        // ─── Attribute definitions ───────────────────────────────────────────────
        // Replaces an existing definition of the same name
        Result<void> define_attribute(AttributeDefinition def) {
            if (def.name.empty()) {
                return Result<void>::err(Error::structural("attribute name is required"));
            }
            if (def.default_value.has_value()) {
                auto ok = def.check(*def.default_value);
                if (!ok.is_ok()) {
                    return ok;
                }
            }
            for (auto &existing : definitions_) {
                if (existing.name == def.name) {
                    existing = std::move(def);
                    return {};
                }
            }
            echo::category("vdbc.database").trace("attribute defined: ", def.name, " (", object_kind_name(def.owner),
                                                  ")");
            definitions_.push_back(std::move(def));
            return {};
        }

        const AttributeDefinition *definition(const dp::String &name) const {
            for (const auto &def : definitions_) {
                if (def.name == name)
                    return &def;
            }
            return nullptr;
        }

        // ─── Attribute values ────────────────────────────────────────────────────
        Result<void> set_database_attribute(const dp::String &name, Value value) {
            auto def = checked_definition(name, ObjectKind::Database, value);
            if (!def.is_ok())
                return Result<void>::err(def.error());
            attributes_.set(name, std::move(value));
            return {};
        }

        Result<void> set_node_attribute(const dp::String &node, const dp::String &name, Value value) {
            auto def = checked_definition(name, ObjectKind::Node, value);
            if (!def.is_ok())
                return Result<void>::err(def.error());
            Node *target = node_mut(node);
            if (target == nullptr)
                return Result<void>::err(Error::unknown_node(node));
            target->attributes.set(name, std::move(value));
            return {};
        }

        Result<void> set_message_attribute(const dp::String &message, const dp::String &name, Value value) {
            auto def = checked_definition(name, ObjectKind::Message, value);
            if (!def.is_ok())
                return Result<void>::err(def.error());
            Message *target = message_mut(message);
            if (target == nullptr)
                return Result<void>::err(Error::unknown_message(message));
            target->attributes.set(name, std::move(value));
            return {};
        }

        Result<void> set_signal_attribute(const dp::String &message, const dp::String &signal, const dp::String &name,
                                          Value value) {
            auto def = checked_definition(name, ObjectKind::Signal, value);
            if (!def.is_ok())
                return Result<void>::err(def.error());
            Message *msg = message_mut(message);
            if (msg == nullptr)
                return Result<void>::err(Error::unknown_message(message));
            Signal *target = msg->signal_mut(signal);
            if (target == nullptr)
                return Result<void>::err(Error::unknown_signal(signal));
            target->attributes.set(name, std::move(value));
            return {};
        }

        Result<void> set_env_attribute(const dp::String &env_var, const dp::String &name, Value value) {
            auto def = checked_definition(name, ObjectKind::EnvironmentVariable, value);
            if (!def.is_ok())
                return Result<void>::err(def.error());
            for (auto &ev : env_vars_) {
                if (ev.name == env_var) {
                    ev.attributes.set(name, std::move(value));
                    return {};
                }
            }
            return Result<void>::err(Error::structural("unknown environment variable '" + env_var + "'"));
        }

        // ─── Lookup ──────────────────────────────────────────────────────────────
        const Node *find_node(const dp::String &name) const {
            auto it = node_index_.find(name);
            if (it == node_index_.end())
                return nullptr;
            return &nodes_[it->second];
        }

        const Message *find_message(const dp::String &name) const {
            auto it = message_index_.find(name);
            if (it == message_index_.end())
                return nullptr;
            return &messages_[it->second];
        }

        // Accepts the DBC form (bit 31 set) for extended frames; the frame id mask
        // applies to both sides of the comparison
        const Message *find_message_by_frame_id(FrameId frame_id) const {
            return find_message_by_frame_id(frame_id & ~DBC_EXTENDED_FLAG, (frame_id & DBC_EXTENDED_FLAG) != 0);
        }

        const Message *find_message_by_frame_id(FrameId frame_id, bool is_extended) const {
            for (const auto &msg : messages_) {
                if (msg.is_extended != is_extended)
                    continue;
                if ((msg.frame_id & frame_id_mask_) == (frame_id & frame_id_mask_))
                    return &msg;
            }
            return nullptr;
        }

        const EnvironmentVariable *find_environment_variable(const dp::String &name) const {
            for (const auto &ev : env_vars_) {
                if (ev.name == name)
                    return &ev;
            }
            return nullptr;
        }

        const Bus *find_bus(const dp::String &name) const {
            for (const auto &bus : buses_) {
                if (bus.name == name)
                    return &bus;
            }
            return nullptr;
        }

        const ValueTable *value_table(const dp::String &name) const {
            auto it = value_tables_.find(name);
            if (it == value_tables_.end())
                return nullptr;
            return &it->second;
        }

        // Local VAL_ entries win over a named VAL_TABLE_ reference
        const ValueTable *choices_of(const Signal &signal) const {
            if (!signal.choices.empty())
                return &signal.choices;
            if (signal.value_table.has_value())
                return value_table(*signal.value_table);
            return nullptr;
        }

        // Caller must reindex() after changing names, senders or receivers
        Node *node_mut(const dp::String &name) {
            auto it = node_index_.find(name);
            if (it == node_index_.end())
                return nullptr;
            return &nodes_[it->second];
        }

        Message *message_mut(const dp::String &name) {
            auto it = message_index_.find(name);
            if (it == message_index_.end())
                return nullptr;
            return &messages_[it->second];
        }

        // ─── Node back-references ────────────────────────────────────────────────
        dp::Vector<const Message *> transmitted_messages(const dp::String &node) const {
            dp::Vector<const Message *> out;
            auto it = tx_index_.find(node);
            if (it == tx_index_.end())
                return out;
            for (usize idx : it->second) {
                out.push_back(&messages_[idx]);
            }
            return out;
        }

        const dp::Vector<SignalRef> *received_signals(const dp::String &node) const {
            auto it = rx_index_.find(node);
            if (it == rx_index_.end())
                return nullptr;
            return &it->second;
        }

        bool receives(const dp::String &node, const Message &msg) const {
            for (const auto &s : msg.signals) {
                if (s.is_received_by(node))
                    return true;
            }
            return false;
        }

        void reindex() {
            node_index_.clear();
            message_index_.clear();
            tx_index_.clear();
            rx_index_.clear();
            for (usize i = 0; i < nodes_.size(); ++i) {
                node_index_[nodes_[i].name] = i;
            }
            for (usize m = 0; m < messages_.size(); ++m) {
                const auto &msg = messages_[m];
                message_index_[msg.name] = m;
                if (msg.transmitter.has_value()) {
                    tx_index_[*msg.transmitter].push_back(m);
                }
                for (const auto &sender : msg.senders) {
                    if (!msg.transmitter.has_value() || *msg.transmitter != sender)
                        tx_index_[sender].push_back(m);
                }
                for (usize s = 0; s < msg.signals.size(); ++s) {
                    for (const auto &r : msg.signals[s].receivers) {
                        rx_index_[r].push_back(SignalRef{m, s});
                    }
                }
            }
            echo::category("vdbc.database")
                .trace("reindexed: ", nodes_.size(), " nodes, ", messages_.size(), " messages");
        }

        // ─── Validation ──────────────────────────────────────────────────────────
        Result<void> validate() const {
            for (const auto &msg : messages_) {
                auto ok = msg.validate();
                if (!ok.is_ok()) {
                    return ok;
                }
                auto refs = check_node_refs(msg);
                if (!refs.is_ok()) {
                    return refs;
                }
            }
            for (const auto &ev : env_vars_) {
                for (const auto &node : ev.access_nodes) {
                    if (node != VECTOR_XXX && find_node(node) == nullptr) {
                        return Result<void>::err(Error::structural("environment variable '" + ev.name +
                                                                   "' references unknown node '" + node + "'"));
                    }
                }
            }
            echo::category("vdbc.database").debug("validated ", messages_.size(), " messages");
            return {};
        }

        // ─── Accessors ───────────────────────────────────────────────────────────
        const dp::Vector<Node> &nodes() const noexcept { return nodes_; }
        const dp::Vector<Message> &messages() const noexcept { return messages_; }
        const dp::Vector<EnvironmentVariable> &environment_variables() const noexcept { return env_vars_; }
        const dp::Vector<Bus> &buses() const noexcept { return buses_; }
        const dp::Map<dp::String, ValueTable> &value_tables() const noexcept { return value_tables_; }
        const dp::Vector<AttributeDefinition> &definitions() const noexcept { return definitions_; }
        const AttributeSet &attributes() const noexcept { return attributes_; }

        const dp::String &version() const noexcept { return version_; }
        Database &set_version(dp::String v) {
            version_ = std::move(v);
            return *this;
        }

        FrameId frame_id_mask() const noexcept { return frame_id_mask_; }
        Database &set_frame_id_mask(FrameId mask) {
            frame_id_mask_ = mask;
            return *this;
        }

        const dp::Optional<dp::String> &comment() const noexcept { return comment_; }
        Database &set_comment(dp::String c) {
            comment_ = std::move(c);
            return *this;
        }

      private:
        Result<const AttributeDefinition *> checked_definition(const dp::String &name, ObjectKind owner,
                                                               const Value &value) const {
            const AttributeDefinition *def = definition(name);
            if (def == nullptr) {
                return Result<const AttributeDefinition *>::err(Error::unknown_attribute(name));
            }
            if (def->owner != owner) {
                return Result<const AttributeDefinition *>::err(
                    Error::type_mismatch("attribute '" + name + "' belongs to " + object_kind_name(def->owner) +
                                         ", not " + object_kind_name(owner)));
            }
            auto ok = def->check(value);
            if (!ok.is_ok()) {
                return Result<const AttributeDefinition *>::err(ok.error());
            }
            return Result<const AttributeDefinition *>::ok(def);
        }

        Result<void> check_node_refs(const Message &msg) const {
            auto known = [this](const dp::String &node) { return node == VECTOR_XXX || find_node(node) != nullptr; };
            if (msg.transmitter.has_value() && !known(*msg.transmitter)) {
                return Result<void>::err(Error::structural("message '" + msg.name + "' transmitter '" +
                                                           *msg.transmitter + "' is not a node"));
            }
            for (const auto &sender : msg.senders) {
                if (!known(sender)) {
                    return Result<void>::err(
                        Error::structural("message '" + msg.name + "' sender '" + sender + "' is not a node"));
                }
            }
            for (const auto &s : msg.signals) {
                for (const auto &r : s.receivers) {
                    if (!known(r)) {
                        return Result<void>::err(Error::structural("signal '" + s.name + "' receiver '" + r +
                                                                   "' is not a node"));
                    }
                }
                if (s.value_table.has_value() && value_table(*s.value_table) == nullptr) {
                    return Result<void>::err(Error::structural("signal '" + s.name + "' references unknown value table '" +
                                                               *s.value_table + "'"));
                }
            }
            return {};
        }
    };

} // namespace vdbc::model
