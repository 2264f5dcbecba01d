#include <doctest/doctest.h>
#include <vdbc/attribute/resolver.hpp>
#include <vdbc/attribute/well_known.hpp>

using namespace vdbc;
using namespace vdbc::model;
using namespace vdbc::attribute;

namespace {

    Database network() {
        Database db;
        db.add_node(Node("ECU1"));
        db.add_node(Node("ECU2"));
        Message engine("Engine", 0x100, 8);
        engine.with_transmitter("ECU1").with_signal(Signal("Rpm", 0, 16).add_receiver("ECU2"));
        db.add_message(engine);
        Message brake("Brake", 0x200, 8);
        brake.with_transmitter("ECU2").with_signal(Signal("Pressure", 0, 8));
        db.add_message(brake);
        return db;
    }

} // namespace

TEST_CASE("Attribute definitions") {
    SUBCASE("integer bounds") {
        auto def = AttributeDefinition::integer("GenMsgCycleTime", ObjectKind::Message, 0, 1000, 100);
        CHECK(def.check(Value::of_int(50)).is_ok());
        CHECK(def.check(Value::of_int(1000)).is_ok());

        auto high = def.check(Value::of_int(1001));
        CHECK(high.is_err());
        CHECK(high.error().code == ErrorCode::ValueOutOfRange);

        auto wrong = def.check(Value::of_string("fast"));
        CHECK(wrong.is_err());
        CHECK(wrong.error().code == ErrorCode::TypeMismatch);
    }

    SUBCASE("zero bounds mean unbounded") {
        auto def = AttributeDefinition::integer("Counter", ObjectKind::Node, 0, 0);
        CHECK(def.check(Value::of_int(123456)).is_ok());
        CHECK(def.check(Value::of_int(-5)).is_ok());
    }

    SUBCASE("hex and float kinds are distinct") {
        auto hex = AttributeDefinition::hex("TpTxIdentifier", ObjectKind::Node, 0, 0x7FF);
        CHECK(hex.check(Value::of_hex(0x17)).is_ok());
        CHECK(hex.check(Value::of_int(0x17)).error().code == ErrorCode::TypeMismatch);

        auto real = AttributeDefinition::real("Gain", ObjectKind::Signal, -1.0, 1.0, 0.5);
        CHECK(real.check(Value::of_float(0.25)).is_ok());
        CHECK(real.check(Value::of_float(1.5)).error().code == ErrorCode::ValueOutOfRange);
        REQUIRE(real.default_value.has_value());
        CHECK(real.default_value->real == doctest::Approx(0.5));
    }

    SUBCASE("enumerations store choice indices") {
        auto def = AttributeDefinition::enumeration("Mode", ObjectKind::Message, {"Off", "Slow", "Fast"},
                                                       dp::String("Slow"));
        REQUIRE(def.default_value.has_value());
        CHECK(def.default_value->integer == 1);
        CHECK(*def.label_of(Value::of_enum(2)) == "Fast");
        CHECK_FALSE(def.label_of(Value::of_enum(3)).has_value());
        CHECK(*def.index_of("Off") == 0);
        CHECK(def.check(Value::of_enum(3)).error().code == ErrorCode::ValueOutOfRange);

        auto yes_no = AttributeDefinition::yes_no("GenMsgILSupport", ObjectKind::Message, true);
        CHECK(yes_no.default_value->integer == 1);
        CHECK(yes_no.choices.size() == 2);
    }

    SUBCASE("value equality follows the kind") {
        CHECK(Value::of_int(5) == Value::of_int(5));
        CHECK(Value::of_int(5) != Value::of_hex(5));
        CHECK(Value::of_string("a") == Value::of_string("a"));
        CHECK(Value::of_float(1.5).as_number() == doctest::Approx(1.5));
        CHECK(Value::of_enum(2).as_number() == doctest::Approx(2.0));
    }
}

TEST_CASE("Setting attribute values") {
    Database db = network();
    REQUIRE(db.define_attribute(AttributeDefinition::integer("GenMsgCycleTime", ObjectKind::Message, 0, 10000, 100))
                .is_ok());

    SUBCASE("explicit value") {
        CHECK(db.set_message_attribute("Engine", "GenMsgCycleTime", Value::of_int(50)).is_ok());
        const auto *entry = db.find_message("Engine")->attributes.find("GenMsgCycleTime");
        REQUIRE(entry != nullptr);
        CHECK(entry->value->integer == 50);
    }

    SUBCASE("owner kind must match") {
        auto r = db.set_node_attribute("ECU1", "GenMsgCycleTime", Value::of_int(50));
        CHECK(r.is_err());
        CHECK(r.error().code == ErrorCode::TypeMismatch);
    }

    SUBCASE("value kind and bounds are checked") {
        CHECK(db.set_message_attribute("Engine", "GenMsgCycleTime", Value::of_float(5.0)).error().code ==
              ErrorCode::TypeMismatch);
        CHECK(db.set_message_attribute("Engine", "GenMsgCycleTime", Value::of_int(20000)).error().code ==
              ErrorCode::ValueOutOfRange);
    }

    SUBCASE("unknown targets") {
        CHECK(db.set_message_attribute("Nope", "GenMsgCycleTime", Value::of_int(5)).error().code ==
              ErrorCode::UnknownMessage);
        CHECK(db.set_message_attribute("Engine", "NoSuchAttr", Value::of_int(5)).error().code ==
              ErrorCode::UnknownAttribute);
    }

    SUBCASE("definition default is checked") {
        auto bad = AttributeDefinition::integer("Limit", ObjectKind::Signal, 0, 10, 11);
        CHECK(db.define_attribute(bad).error().code == ErrorCode::ValueOutOfRange);
    }
}

TEST_CASE("Default propagation") {
    Database db = network();
    REQUIRE(db.define_attribute(AttributeDefinition::integer("GenMsgCycleTime", ObjectKind::Message, 0, 10000, 100))
                .is_ok());
    AttributeResolver resolver(db);

    SUBCASE("default applies to a message without any entries") {
        const auto *msg = db.find_message("Engine");
        REQUIRE(msg->attributes.empty());
        auto r = resolver.resolve(*msg, dp::String("GenMsgCycleTime"));
        REQUIRE(r.is_ok());
        CHECK(r.value().integer == 100);
    }

    SUBCASE("explicit value overrides the default") {
        REQUIRE(db.set_message_attribute("Engine", "GenMsgCycleTime", Value::of_int(50)).is_ok());
        CHECK(resolver.resolve(*db.find_message("Engine"), dp::String("GenMsgCycleTime")).value().integer == 50);
        CHECK(resolver.resolve(*db.find_message("Brake"), dp::String("GenMsgCycleTime")).value().integer == 100);
    }

    SUBCASE("an entry without a value is not an override") {
        db.message_mut("Engine")->attributes.set("GenMsgCycleTime", dp::nullopt);
        CHECK(resolver.resolve(*db.find_message("Engine"), dp::String("GenMsgCycleTime")).value().integer == 100);
    }

    SUBCASE("stored values are checked against a redefinition") {
        REQUIRE(db.set_message_attribute("Engine", "GenMsgCycleTime", Value::of_int(50)).is_ok());

        REQUIRE(db.define_attribute(AttributeDefinition::string("GenMsgCycleTime", ObjectKind::Message)).is_ok());
        auto kind = resolver.resolve(*db.find_message("Engine"), dp::String("GenMsgCycleTime"));
        CHECK(kind.is_err());
        CHECK(kind.error().code == ErrorCode::TypeMismatch);
        CHECK(cycle_time(db, *db.find_message("Engine")).error().code == ErrorCode::TypeMismatch);
        auto all = resolver.resolve_all(*db.find_message("Engine"));
        CHECK(all.find("GenMsgCycleTime") == all.end());

        REQUIRE(db.define_attribute(AttributeDefinition::integer("GenMsgCycleTime", ObjectKind::Message, 0, 10, 5))
                    .is_ok());
        auto bounds = resolver.resolve(*db.find_message("Engine"), dp::String("GenMsgCycleTime"));
        CHECK(bounds.error().code == ErrorCode::ValueOutOfRange);
        CHECK(resolver.resolve(*db.find_message("Brake"), dp::String("GenMsgCycleTime")).value().integer == 5);
    }

    SUBCASE("no value and no default") {
        REQUIRE(db.define_attribute(AttributeDefinition::string("Owner", ObjectKind::Node)).is_ok());
        auto r = resolver.resolve(*db.find_node("ECU1"), dp::String("Owner"));
        CHECK(r.is_err());
        CHECK(r.error().code == ErrorCode::NoAttributeValue);
    }

    SUBCASE("owner mismatch and unknown names") {
        const auto *def = db.definition("GenMsgCycleTime");
        REQUIRE(def != nullptr);
        CHECK(resolver.resolve(*db.find_node("ECU1"), *def).error().code == ErrorCode::TypeMismatch);
        CHECK(resolver.resolve(*db.find_node("ECU1"), dp::String("Missing")).error().code ==
              ErrorCode::UnknownAttribute);
    }

    SUBCASE("signals, nodes and the database resolve the same way") {
        REQUIRE(db.define_attribute(AttributeDefinition::integer("SPN", ObjectKind::Signal, 0, 524287, 0)).is_ok());
        REQUIRE(db.define_attribute(AttributeDefinition::string("BusType", ObjectKind::Database, dp::String("CAN")))
                    .is_ok());
        REQUIRE(db.define_attribute(AttributeDefinition::hex("NmStationAddress", ObjectKind::Node, 0, 0xFF, 0x10))
                    .is_ok());

        REQUIRE(db.set_signal_attribute("Engine", "Rpm", "SPN", Value::of_int(190)).is_ok());
        CHECK(resolver.resolve(*db.find_message("Engine")->signal("Rpm"), dp::String("SPN")).value().integer == 190);
        CHECK(resolver.resolve(*db.find_message("Brake")->signal("Pressure"), dp::String("SPN")).value().integer == 0);
        CHECK(resolver.resolve_database(dp::String("BusType")).value().text == "CAN");
        CHECK(resolver.resolve(*db.find_node("ECU2"), dp::String("NmStationAddress")).value().integer == 0x10);
    }

    SUBCASE("batch resolution covers every definition of the kind") {
        REQUIRE(db.define_attribute(AttributeDefinition::yes_no("GenMsgILSupport", ObjectKind::Message)).is_ok());
        REQUIRE(db.define_attribute(AttributeDefinition::integer("NoDefault", ObjectKind::Message, 0, 10)).is_ok());
        REQUIRE(db.define_attribute(AttributeDefinition::string("Owner", ObjectKind::Node, dp::String("me"))).is_ok());

        auto all = resolver.resolve_all(*db.find_message("Brake"));
        CHECK(all.size() == 2);
        CHECK(all.find("GenMsgCycleTime") != all.end());
        CHECK(all.find("GenMsgILSupport") != all.end());
        CHECK(all.find("NoDefault") == all.end());
        CHECK(all["GenMsgCycleTime"].integer == 100);

        auto nodes = resolver.resolve_all(*db.find_node("ECU1"));
        CHECK(nodes.size() == 1);
    }

    SUBCASE("environment variables") {
        EnvironmentVariable ev;
        ev.name = "EnvGear";
        REQUIRE(db.add_environment_variable(ev).is_ok());
        REQUIRE(db.define_attribute(
                      AttributeDefinition::integer("EnvPriority", ObjectKind::EnvironmentVariable, 0, 9, 3))
                    .is_ok());
        REQUIRE(db.set_env_attribute("EnvGear", "EnvPriority", Value::of_int(7)).is_ok());
        CHECK(resolver.resolve(*db.find_environment_variable("EnvGear"), dp::String("EnvPriority")).value().integer ==
              7);
    }
}

TEST_CASE("Well-known attributes") {
    Database db = network();

    SUBCASE("message timing is auto-defined on first use") {
        CHECK(cycle_time(db, *db.find_message("Engine")).error().code == ErrorCode::UnknownAttribute);
        REQUIRE(set_cycle_time(db, "Engine", 20).is_ok());
        CHECK(cycle_time(db, *db.find_message("Engine")).value() == 20);
        CHECK(cycle_time(db, *db.find_message("Brake")).error().code == ErrorCode::NoAttributeValue);
        REQUIRE(db.definition("GenMsgCycleTime") != nullptr);
        CHECK(*db.definition("GenMsgCycleTime")->maximum == doctest::Approx(2147483647.0));

        REQUIRE(set_delay_time(db, "Engine", 5).is_ok());
        REQUIRE(set_start_delay_time(db, "Engine", 7).is_ok());
        CHECK(delay_time(db, *db.find_message("Engine")).value() == 5);
        CHECK(start_delay_time(db, *db.find_message("Engine")).value() == 7);
    }

    SUBCASE("send types resolve to labels") {
        REQUIRE(set_send_type(db, "Engine", "spontaneous").is_ok());
        CHECK(send_type(db, *db.find_message("Engine")).value() == "spontaneous");
        CHECK(send_type(db, *db.find_message("Brake")).value() == "cyclic");
        CHECK(set_send_type(db, "Engine", "sometimes").error().code == ErrorCode::ValueOutOfRange);

        REQUIRE(set_signal_send_type(db, "Engine", "Rpm", "OnChange").is_ok());
        CHECK(signal_send_type(db, *db.find_message("Engine")->signal("Rpm")).value() == "OnChange");
    }

    SUBCASE("yes/no attributes") {
        REQUIRE(set_il_support(db, "Engine", true).is_ok());
        CHECK(il_support(db, *db.find_message("Engine")).value());
        CHECK_FALSE(il_support(db, *db.find_message("Brake")).value());
    }

    SUBCASE("signal attributes") {
        REQUIRE(set_start_value(db, "Engine", "Rpm", 800).is_ok());
        REQUIRE(set_inactive_value(db, "Engine", "Rpm", 0).is_ok());
        REQUIRE(set_spn(db, "Engine", "Rpm", 190).is_ok());
        const auto *rpm = db.find_message("Engine")->signal("Rpm");
        CHECK(start_value(db, *rpm).value() == 800);
        CHECK(inactive_value(db, *rpm).value() == 0);
        CHECK(spn(db, *rpm).value() == 190);
        CHECK(set_spn(db, "Engine", "Rpm", 600000).error().code == ErrorCode::ValueOutOfRange);
    }

    SUBCASE("node transport identifiers") {
        REQUIRE(set_tp_tx_identifier(db, "ECU1", 0x17).is_ok());
        REQUIRE(set_tp_rx_identifier(db, "ECU2", 0x28).is_ok());
        REQUIRE(set_nm_station_address(db, "ECU2", 0x42).is_ok());
        CHECK(tp_tx_identifier(db, *db.find_node("ECU1")).value() == 0x17);
        CHECK(nm_station_address(db, *db.find_node("ECU2")).value() == 0x42);
        CHECK(db.definition("TpTxIdentifier")->type == AttributeType::Hex);

        REQUIRE(find_node_by_tp_identifier(db, 0x17) != nullptr);
        CHECK(find_node_by_tp_identifier(db, 0x17)->name == "ECU1");
        CHECK(find_node_by_tp_identifier(db, 0x28)->name == "ECU2");
        CHECK(find_node_by_tp_identifier(db, 0x99) == nullptr);
        CHECK(set_tp_tx_identifier(db, "Ghost", 1).error().code == ErrorCode::UnknownNode);
    }

    SUBCASE("database strings") {
        REQUIRE(set_db_name(db, "Powertrain").is_ok());
        REQUIRE(set_bus_type(db, "CAN FD").is_ok());
        REQUIRE(set_multiplex_ext_enabled(db, true).is_ok());
        CHECK(db_name(db).value() == "Powertrain");
        CHECK(bus_type(db).value() == "CAN FD");
        CHECK(multiplex_ext_enabled(db).value());
    }
}

TEST_CASE("Arbitration-ID scheme selection") {
    Database db = network();

    SUBCASE("plain when nothing is declared") {
        CHECK(id_scheme(db).value() == id::IdScheme::Plain);
    }

    SUBCASE("ProtocolType J1939") {
        REQUIRE(set_protocol_type(db, "J1939").is_ok());
        CHECK(protocol_type(db).value() == "J1939");
        CHECK(id_scheme(db).value() == id::IdScheme::J1939);
    }

    SUBCASE("UseGMParameterIDs wins") {
        REQUIRE(set_protocol_type(db, "J1939").is_ok());
        REQUIRE(set_use_gm_parameter_ids(db, true).is_ok());
        CHECK(uses_gm_parameter_ids(db).value());
        CHECK(id_scheme(db).value() == id::IdScheme::GMParameterId);

        REQUIRE(set_use_gm_parameter_ids(db, false).is_ok());
        CHECK(id_scheme(db).value() == id::IdScheme::J1939);
    }

    SUBCASE("other protocols stay plain") {
        REQUIRE(set_protocol_type(db, "NMEA2000").is_ok());
        CHECK(id_scheme(db).value() == id::IdScheme::Plain);
    }

    SUBCASE("message override") {
        REQUIRE(set_protocol_type(db, "J1939").is_ok());
        Message gm("GmMsg", 0x0C246045, 8, true);
        gm.id_scheme = id::IdScheme::GMParameterId;
        REQUIRE(db.add_message(gm).is_ok());

        auto variant = arbitration_id(db, *db.find_message("GmMsg"));
        REQUIRE(variant.is_ok());
        CHECK(std::holds_alternative<id::GMParameterId>(variant.value()));

        Message eec1("EEC1", 0x0CF00400, 8, true);
        REQUIRE(db.add_message(eec1).is_ok());
        auto j1939 = arbitration_id(db, *db.find_message("EEC1"));
        REQUIRE(std::holds_alternative<id::J1939Id>(j1939.value()));
        CHECK(std::get<id::J1939Id>(j1939.value()).pgn() == 0xF004);
    }

    SUBCASE("wrongly typed ProtocolType is reported") {
        REQUIRE(db.define_attribute(AttributeDefinition::integer("ProtocolType", ObjectKind::Database, 0, 5, 1))
                    .is_ok());
        CHECK(id_scheme(db).error().code == ErrorCode::TypeMismatch);
    }
}
