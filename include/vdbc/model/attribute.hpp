#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <string>

namespace vdbc::model {

    // ─── Attribute value kinds (BA_DEF_ INT / HEX / FLOAT / STRING / ENUM) ──────
    enum class AttributeType : u8 {
        Int = 0,
        Hex,
        Float,
        String,
        Enum,
    };

    inline const char *attribute_type_name(AttributeType type) noexcept {
        switch (type) {
        case AttributeType::Int:
            return "INT";
        case AttributeType::Hex:
            return "HEX";
        case AttributeType::Float:
            return "FLOAT";
        case AttributeType::String:
            return "STRING";
        case AttributeType::Enum:
            return "ENUM";
        }
        return "?";
    }

    // ─── A single attribute value ───────────────────────────────────────────────
    // Enum values hold the choice index in `integer`.
    struct Value {
        AttributeType type = AttributeType::Int;
        i64 integer = 0;
        f64 real = 0.0;
        dp::String text;

        static Value of_int(i64 v) {
            Value out;
            out.type = AttributeType::Int;
            out.integer = v;
            return out;
        }
        static Value of_hex(i64 v) {
            Value out;
            out.type = AttributeType::Hex;
            out.integer = v;
            return out;
        }
        static Value of_float(f64 v) {
            Value out;
            out.type = AttributeType::Float;
            out.real = v;
            return out;
        }
        static Value of_string(dp::String v) {
            Value out;
            out.type = AttributeType::String;
            out.text = std::move(v);
            return out;
        }
        static Value of_enum(i64 index) {
            Value out;
            out.type = AttributeType::Enum;
            out.integer = index;
            return out;
        }

        bool is_numeric() const noexcept { return type != AttributeType::String; }

        f64 as_number() const noexcept {
            if (type == AttributeType::Float)
                return real;
            return static_cast<f64>(integer);
        }

        bool operator==(const Value &other) const noexcept {
            if (type != other.type)
                return false;
            switch (type) {
            case AttributeType::Float:
                return real == other.real;
            case AttributeType::String:
                return text == other.text;
            default:
                return integer == other.integer;
            }
        }
        bool operator!=(const Value &other) const noexcept { return !(*this == other); }
    };

    // ─── Attribute definition (BA_DEF_ + BA_DEF_DEF_) ───────────────────────────
    struct AttributeDefinition {
        dp::String name;
        ObjectKind owner = ObjectKind::Database;
        AttributeType type = AttributeType::Int;
        dp::Optional<f64> minimum;
        dp::Optional<f64> maximum;
        dp::Vector<dp::String> choices; // Enum labels, index = stored value
        dp::Optional<Value> default_value;

        static AttributeDefinition integer(dp::String name, ObjectKind owner, i64 min, i64 max,
                                           dp::Optional<i64> def = dp::nullopt) {
            AttributeDefinition d;
            d.name = std::move(name);
            d.owner = owner;
            d.type = AttributeType::Int;
            d.minimum = static_cast<f64>(min);
            d.maximum = static_cast<f64>(max);
            if (def.has_value())
                d.default_value = Value::of_int(*def);
            return d;
        }

        static AttributeDefinition hex(dp::String name, ObjectKind owner, i64 min, i64 max,
                                       dp::Optional<i64> def = dp::nullopt) {
            AttributeDefinition d = integer(std::move(name), owner, min, max);
            d.type = AttributeType::Hex;
            if (def.has_value())
                d.default_value = Value::of_hex(*def);
            return d;
        }

        static AttributeDefinition real(dp::String name, ObjectKind owner, f64 min, f64 max,
                                        dp::Optional<f64> def = dp::nullopt) {
            AttributeDefinition d;
            d.name = std::move(name);
            d.owner = owner;
            d.type = AttributeType::Float;
            d.minimum = min;
            d.maximum = max;
            if (def.has_value())
                d.default_value = Value::of_float(*def);
            return d;
        }

        static AttributeDefinition string(dp::String name, ObjectKind owner,
                                          dp::Optional<dp::String> def = dp::nullopt) {
            AttributeDefinition d;
            d.name = std::move(name);
            d.owner = owner;
            d.type = AttributeType::String;
            if (def.has_value())
                d.default_value = Value::of_string(*def);
            return d;
        }

        // The DBC default of an ENUM attribute is written as a label
        static AttributeDefinition enumeration(dp::String name, ObjectKind owner, dp::Vector<dp::String> labels,
                                               dp::Optional<dp::String> default_label = dp::nullopt) {
            AttributeDefinition d;
            d.name = std::move(name);
            d.owner = owner;
            d.type = AttributeType::Enum;
            d.choices = std::move(labels);
            if (default_label.has_value()) {
                auto index = d.index_of(*default_label);
                if (index.has_value())
                    d.default_value = Value::of_enum(*index);
            }
            return d;
        }

        // Yes/No enumeration used by many Vector attributes
        static AttributeDefinition yes_no(dp::String name, ObjectKind owner, bool def = false) {
            return enumeration(std::move(name), owner, dp::Vector<dp::String>{"No", "Yes"},
                               dp::String(def ? "Yes" : "No"));
        }

        dp::Optional<i64> index_of(const dp::String &label) const {
            for (usize i = 0; i < choices.size(); ++i) {
                if (choices[i] == label)
                    return static_cast<i64>(i);
            }
            return dp::nullopt;
        }

        dp::Optional<dp::String> label_of(const Value &value) const {
            if (type != AttributeType::Enum || value.integer < 0 ||
                static_cast<usize>(value.integer) >= choices.size()) {
                return dp::nullopt;
            }
            return choices[static_cast<usize>(value.integer)];
        }

        // Kind and bounds of a value attached under this definition
        Result<void> check(const Value &value) const {
            if (value.type != type) {
                return Result<void>::err(Error::type_mismatch("attribute '" + name + "' is " +
                                                              attribute_type_name(type) + ", got " +
                                                              attribute_type_name(value.type)));
            }
            if (type == AttributeType::Enum) {
                if (value.integer < 0 || static_cast<usize>(value.integer) >= choices.size()) {
                    return Result<void>::err(Error::value_out_of_range(
                        "attribute '" + name + "' has no choice " + dp::String(std::to_string(value.integer))));
                }
                return {};
            }
            if (type == AttributeType::String) {
                return {};
            }
            // DBC writes 0/0 bounds to mean "unbounded"
            if (minimum.has_value() && maximum.has_value() && *minimum == 0.0 && *maximum == 0.0) {
                return {};
            }
            f64 v = value.as_number();
            if ((minimum.has_value() && v < *minimum) || (maximum.has_value() && v > *maximum)) {
                return Result<void>::err(Error::value_out_of_range("attribute '" + name + "' value " +
                                                                   dp::String(std::to_string(v)) + " out of bounds"));
            }
            return {};
        }
    };

    // ─── An attribute attached to an object (BA_) ───────────────────────────────
    // An absent value means "no override": the definition default applies.
    struct AttributeValue {
        dp::String definition;
        dp::Optional<Value> value;
    };

    // ─── Ordered attribute values of one object ─────────────────────────────────
    class AttributeSet {
        dp::Vector<AttributeValue> entries_;

      public:
        const AttributeValue *find(const dp::String &name) const {
            for (const auto &entry : entries_) {
                if (entry.definition == name)
                    return &entry;
            }
            return nullptr;
        }

        void set(const dp::String &name, dp::Optional<Value> value) {
            for (auto &entry : entries_) {
                if (entry.definition == name) {
                    entry.value = std::move(value);
                    return;
                }
            }
            entries_.push_back(AttributeValue{name, std::move(value)});
        }

        bool erase(const dp::String &name) {
            for (auto it = entries_.begin(); it != entries_.end(); ++it) {
                if (it->definition == name) {
                    entries_.erase(it);
                    return true;
                }
            }
            return false;
        }

        usize size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }
        const dp::Vector<AttributeValue> &entries() const noexcept { return entries_; }
    };

} // namespace vdbc::model
