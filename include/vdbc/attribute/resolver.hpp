#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../model/attribute.hpp"
#include "../model/database.hpp"
#include <datapod/datapod.hpp>

namespace vdbc::attribute {

    using model::AttributeDefinition;
    using model::AttributeSet;
    using model::AttributeType;
    using model::attribute_type_name;
    using model::Database;
    using model::Value;

    // ─── Effective attribute values ─────────────────────────────────────────────
    // Two-tier lookup: an explicit value attached to the object, otherwise the
    // definition default. The default applies to every object of the owning
    // kind, whether or not the object carries any attribute entries.
    class AttributeResolver {
        const Database &db_;

      public:
        explicit AttributeResolver(const Database &db) : db_(db) {}

        static Result<Value> resolve_in(const AttributeSet &values, ObjectKind kind, const AttributeDefinition &def) {
            if (def.owner != kind) {
                return Result<Value>::err(Error::type_mismatch("attribute '" + def.name + "' belongs to " +
                                                               object_kind_name(def.owner) + ", not " +
                                                               object_kind_name(kind)));
            }
            const auto *entry = values.find(def.name);
            if (entry != nullptr && entry->value.has_value()) {
                // Stored values are checked against the current definition
                auto valid = def.check(*entry->value);
                if (!valid.is_ok()) {
                    return Result<Value>::err(valid.error());
                }
                return Result<Value>::ok(*entry->value);
            }
            if (def.default_value.has_value()) {
                return Result<Value>::ok(*def.default_value);
            }
            return Result<Value>::err(Error::no_attribute_value(def.name));
        }

        // ─── By definition ───────────────────────────────────────────────────────
        Result<Value> resolve(const model::Node &node, const AttributeDefinition &def) const {
            return resolve_in(node.attributes, ObjectKind::Node, def);
        }
        Result<Value> resolve(const model::Message &msg, const AttributeDefinition &def) const {
            return resolve_in(msg.attributes, ObjectKind::Message, def);
        }
        Result<Value> resolve(const model::Signal &sig, const AttributeDefinition &def) const {
            return resolve_in(sig.attributes, ObjectKind::Signal, def);
        }
        Result<Value> resolve(const model::EnvironmentVariable &ev, const AttributeDefinition &def) const {
            return resolve_in(ev.attributes, ObjectKind::EnvironmentVariable, def);
        }
        Result<Value> resolve_database(const AttributeDefinition &def) const {
            return resolve_in(db_.attributes(), ObjectKind::Database, def);
        }

        // ─── By name ─────────────────────────────────────────────────────────────
        Result<Value> resolve(const model::Node &node, const dp::String &name) const {
            return by_name(node.attributes, ObjectKind::Node, name);
        }
        Result<Value> resolve(const model::Message &msg, const dp::String &name) const {
            return by_name(msg.attributes, ObjectKind::Message, name);
        }
        Result<Value> resolve(const model::Signal &sig, const dp::String &name) const {
            return by_name(sig.attributes, ObjectKind::Signal, name);
        }
        Result<Value> resolve(const model::EnvironmentVariable &ev, const dp::String &name) const {
            return by_name(ev.attributes, ObjectKind::EnvironmentVariable, name);
        }
        Result<Value> resolve_database(const dp::String &name) const {
            return by_name(db_.attributes(), ObjectKind::Database, name);
        }

        // ─── Batch ───────────────────────────────────────────────────────────────
        // Definitions with neither an explicit value nor a default are left out
        dp::Map<dp::String, Value> resolve_all(const model::Node &node) const {
            return all_of(node.attributes, ObjectKind::Node);
        }
        dp::Map<dp::String, Value> resolve_all(const model::Message &msg) const {
            return all_of(msg.attributes, ObjectKind::Message);
        }
        dp::Map<dp::String, Value> resolve_all(const model::Signal &sig) const {
            return all_of(sig.attributes, ObjectKind::Signal);
        }
        dp::Map<dp::String, Value> resolve_all(const model::EnvironmentVariable &ev) const {
            return all_of(ev.attributes, ObjectKind::EnvironmentVariable);
        }
        dp::Map<dp::String, Value> resolve_all_database() const {
            return all_of(db_.attributes(), ObjectKind::Database);
        }

        const Database &database() const noexcept { return db_; }

      private:
        Result<Value> by_name(const AttributeSet &values, ObjectKind kind, const dp::String &name) const {
            const auto *def = db_.definition(name);
            if (def == nullptr) {
                return Result<Value>::err(Error::unknown_attribute(name));
            }
            return resolve_in(values, kind, *def);
        }

        dp::Map<dp::String, Value> all_of(const AttributeSet &values, ObjectKind kind) const {
            dp::Map<dp::String, Value> out;
            for (const auto &def : db_.definitions()) {
                if (def.owner != kind)
                    continue;
                auto r = resolve_in(values, kind, def);
                if (r.is_ok()) {
                    out[def.name] = r.value();
                }
            }
            return out;
        }
    };

} // namespace vdbc::attribute
