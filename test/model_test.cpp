#include <doctest/doctest.h>
#include <vdbc/model/database.hpp>

using namespace vdbc;
using namespace vdbc::model;

namespace {

    Message engine_message() {
        Message msg("Engine", 0x100, 8);
        msg.with_transmitter("ECU1")
            .with_signal(Signal("Temp", 16, 8).add_receiver("ECU2").add_receiver("ECU3"))
            .with_signal(Signal("Rpm", 0, 16).add_receiver("ECU2"));
        return msg;
    }

    Database engine_database() {
        Database db;
        db.add_node(Node("ECU1"));
        db.add_node(Node("ECU2"));
        db.add_node(Node("ECU3"));
        db.add_message(engine_message());
        return db;
    }

} // namespace

TEST_CASE("Message structural checks") {
    SUBCASE("valid message") {
        CHECK(engine_message().validate().is_ok());
    }

    SUBCASE("signal past the DLC") {
        Message msg("Short", 0x10, 2);
        msg.with_signal(Signal("Wide", 8, 16));
        auto r = msg.validate();
        CHECK(r.is_err());
        CHECK(r.error().code == ErrorCode::StructuralInvariantViolation);
    }

    SUBCASE("motorola span is measured in sawtooth order") {
        Message fits("Fits", 0x10, 2);
        fits.with_signal(Signal("Word", 7, 16, ByteOrder::BigEndian));
        CHECK(fits.validate().is_ok());

        Message overflows("Overflows", 0x10, 2);
        overflows.with_signal(Signal("Word", 0, 16, ByteOrder::BigEndian));
        CHECK(overflows.validate().is_err());
    }

    SUBCASE("signal length and float width") {
        Message zero("Zero", 0x10, 8);
        zero.with_signal(Signal("Nothing", 0, 0));
        CHECK(zero.validate().is_err());

        Message bad_float("BadFloat", 0x10, 8);
        bad_float.with_signal(Signal("F", 0, 16, ByteOrder::LittleEndian, ValueKind::Float));
        CHECK(bad_float.validate().is_err());

        Message good_double("GoodDouble", 0x10, 8);
        good_double.with_signal(Signal("D", 0, 64, ByteOrder::LittleEndian, ValueKind::Double));
        CHECK(good_double.validate().is_ok());
    }

    SUBCASE("zero factor") {
        Message msg("Scaled", 0x10, 8);
        msg.with_signal(Signal("S", 0, 8).set_scaling(0.0, 1.0));
        CHECK(msg.validate().is_err());
    }

    SUBCASE("duplicate signal names") {
        Message msg("Dup", 0x10, 8);
        msg.with_signal(Signal("A", 0, 8)).with_signal(Signal("A", 8, 8));
        CHECK(msg.validate().is_err());
    }

    SUBCASE("multiplexor rules") {
        Message two("Two", 0x10, 8);
        two.with_signal(Signal("M1", 0, 4).set_mux(MultiplexerRole::multiplexor()))
            .with_signal(Signal("M2", 4, 4).set_mux(MultiplexerRole::multiplexor()));
        CHECK(two.validate().is_err());

        Message orphan("Orphan", 0x10, 8);
        orphan.with_signal(Signal("A", 8, 8).set_mux(MultiplexerRole::multiplexed_by(1)));
        CHECK(orphan.validate().is_err());

        Message wrong_switch("WrongSwitch", 0x10, 8);
        wrong_switch.with_signal(Signal("Sel", 0, 8).set_mux(MultiplexerRole::multiplexor()))
            .with_signal(Signal("A", 8, 8).set_mux(MultiplexerRole::multiplexed_by_range("Other", 1, 3)));
        CHECK(wrong_switch.validate().is_err());
    }

    SUBCASE("signal groups reference existing signals") {
        Message msg = engine_message();
        msg.with_group(SignalGroup{"Dyn", 1, {"Rpm", "Temp"}});
        CHECK(msg.validate().is_ok());
        msg.with_group(SignalGroup{"Bad", 1, {"Missing"}});
        CHECK(msg.validate().is_err());
    }

    SUBCASE("extended frame id width") {
        Message msg("Ext", 0x18FEF100, 8, true);
        CHECK(msg.validate().is_ok());
        CHECK(msg.dbc_frame_id() == 0x98FEF100);

        Message std_msg("Std", 0x800, 8);
        auto r = std_msg.validate();
        CHECK(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidIdentifier);
    }
}

TEST_CASE("Message queries") {
    Message msg("Mux", 0x200, 8);
    msg.with_signal(Signal("Sel", 0, 8).set_mux(MultiplexerRole::multiplexor()))
        .with_signal(Signal("A", 8, 8).set_mux(MultiplexerRole::multiplexed_by(1)).add_receiver("ECU2"))
        .with_signal(Signal("B", 8, 8).set_mux(MultiplexerRole::multiplexed_by(2)).add_receiver("ECU3"))
        .with_signal(Signal("R", 16, 8).set_mux(MultiplexerRole::multiplexed_by_range("Sel", 3, 5).add_range(9, 9)))
        .with_signal(Signal("Common", 24, 8).add_receiver("ECU2"));

    CHECK(msg.is_multiplexed());
    REQUIRE(msg.multiplexor() != nullptr);
    CHECK(msg.multiplexor()->name == "Sel");

    auto one = msg.active_signals(1);
    CHECK(one.size() == 3);
    CHECK(one[1] == "A");

    auto four = msg.active_signals(4);
    CHECK(four.size() == 3);
    CHECK(four[1] == "R");

    CHECK(msg.active_signals(9).size() == 3);
    CHECK(msg.active_signals(7).size() == 2);

    auto receivers = msg.receivers();
    CHECK(receivers.size() == 2);
    CHECK(receivers[0] == "ECU2");
}

TEST_CASE("Database construction") {
    SUBCASE("duplicate names are rejected") {
        Database db = engine_database();
        CHECK(db.add_node(Node("ECU1")).is_err());
        auto r = db.add_message(engine_message());
        CHECK(r.is_err());
        CHECK(r.error().code == ErrorCode::StructuralInvariantViolation);
    }

    SUBCASE("signals are kept in start-bit order") {
        Database db = engine_database();
        const auto *msg = db.find_message("Engine");
        REQUIRE(msg != nullptr);
        CHECK(msg->signals[0].name == "Rpm");
        CHECK(msg->signals[1].name == "Temp");
    }

    SUBCASE("DBC frame ids carry the extended flag") {
        Database db;
        REQUIRE(db.add_message(Message("EEC1", 0x8CF00400, 8)).is_ok());
        const auto *msg = db.find_message("EEC1");
        REQUIRE(msg != nullptr);
        CHECK(msg->is_extended);
        CHECK(msg->frame_id == 0x0CF00400);
        CHECK(db.find_message_by_frame_id(0x8CF00400) == msg);
        CHECK(db.find_message_by_frame_id(0x0CF00400, true) == msg);
        CHECK(db.find_message_by_frame_id(0x0CF00400, false) == nullptr);
    }

    SUBCASE("frame id mask applies to lookup") {
        Database db;
        db.add_message(Message("EEC1", 0x0CF00400, 8, true));
        CHECK(db.find_message_by_frame_id(0x0CF00417, true) == nullptr);
        db.set_frame_id_mask(0x1FFFFF00);
        REQUIRE(db.find_message_by_frame_id(0x0CF00417, true) != nullptr);
        CHECK(db.find_message_by_frame_id(0x0CF00417, true)->name == "EEC1");
    }

    SUBCASE("add_signal validates before changing the message") {
        Database db = engine_database();
        auto r = db.add_signal("Engine", Signal("Huge", 60, 8));
        CHECK(r.is_err());
        CHECK(db.find_message("Engine")->signals.size() == 2);

        CHECK(db.add_signal("Engine", Signal("Oil", 24, 8)).is_ok());
        CHECK(db.find_message("Engine")->signals.size() == 3);
        CHECK(db.add_signal("Missing", Signal("X", 0, 1)).error().code == ErrorCode::UnknownMessage);
    }
}

TEST_CASE("Node back-references") {
    Database db = engine_database();

    auto tx = db.transmitted_messages("ECU1");
    REQUIRE(tx.size() == 1);
    CHECK(tx[0]->name == "Engine");
    CHECK(db.transmitted_messages("ECU2").empty());

    const auto *rx = db.received_signals("ECU2");
    REQUIRE(rx != nullptr);
    CHECK(rx->size() == 2);
    const auto *rx3 = db.received_signals("ECU3");
    REQUIRE(rx3 != nullptr);
    REQUIRE(rx3->size() == 1);
    const auto &ref = (*rx3)[0];
    CHECK(db.messages()[ref.message].signals[ref.signal].name == "Temp");

    CHECK(db.receives("ECU3", *db.find_message("Engine")));
    CHECK_FALSE(db.receives("ECU1", *db.find_message("Engine")));

    SUBCASE("additional senders") {
        db.message_mut("Engine")->senders.push_back("ECU3");
        db.reindex();
        CHECK(db.transmitted_messages("ECU3").size() == 1);
    }

    SUBCASE("adding a receiver") {
        REQUIRE(db.add_receiver("Engine", "Rpm", "ECU3").is_ok());
        CHECK(db.received_signals("ECU3")->size() == 2);
        CHECK(db.add_receiver("Engine", "Nope", "ECU3").error().code == ErrorCode::UnknownSignal);
    }
}

TEST_CASE("Value tables") {
    Database db = engine_database();
    ValueTable gears;
    gears.add(0, "Neutral").add(1, "First");
    REQUIRE(db.add_value_table("Gears", gears).is_ok());
    CHECK(db.add_value_table("Gears", gears).is_err());

    Signal named("Gear", 32, 4);
    named.set_value_table("Gears");
    CHECK(db.choices_of(named) != nullptr);
    CHECK(*db.choices_of(named)->label(1) == "First");
    CHECK(*db.choices_of(named)->value_of("Neutral") == 0);

    Signal local("Gear", 32, 4);
    local.add_choice(1, "Low").set_value_table("Gears");
    CHECK(*db.choices_of(local)->label(1) == "Low");

    Signal bare("Bare", 0, 1);
    CHECK(db.choices_of(bare) == nullptr);
}

TEST_CASE("Database validation") {
    SUBCASE("well formed") {
        Database db = engine_database();
        CHECK(db.validate().is_ok());
    }

    SUBCASE("transmitter must be a node") {
        Database db;
        db.add_node(Node("ECU2"));
        db.add_node(Node("ECU3"));
        db.add_message(engine_message());
        auto r = db.validate();
        CHECK(r.is_err());
        CHECK(r.error().code == ErrorCode::StructuralInvariantViolation);
    }

    SUBCASE("Vector__XXX is always a valid node reference") {
        Database db;
        Message msg("Orphan", 0x10, 8);
        msg.with_transmitter(VECTOR_XXX).with_signal(Signal("S", 0, 8).add_receiver(VECTOR_XXX));
        db.add_message(msg);
        CHECK(db.validate().is_ok());
    }

    SUBCASE("named value table must exist") {
        Database db = engine_database();
        Message msg("Gearbox", 0x20, 1);
        msg.with_signal(Signal("Gear", 0, 4).set_value_table("Gears"));
        db.add_message(msg);
        CHECK(db.validate().is_err());
    }

    SUBCASE("environment variable access nodes") {
        Database db = engine_database();
        EnvironmentVariable ev;
        ev.name = "EnvSpeed";
        ev.access_nodes.push_back("ECU9");
        REQUIRE(db.add_environment_variable(ev).is_ok());
        CHECK(db.add_environment_variable(ev).is_err());
        CHECK(db.validate().is_err());
    }

    SUBCASE("buses") {
        Database db;
        Bus bus;
        bus.name = "Powertrain";
        bus.baudrate = 500000;
        REQUIRE(db.add_bus(bus).is_ok());
        CHECK(db.add_bus(bus).is_err());
        REQUIRE(db.find_bus("Powertrain") != nullptr);
        CHECK(*db.find_bus("Powertrain")->baudrate == 500000);
    }
}
