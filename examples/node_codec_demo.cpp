#include <vdbc.hpp>
#include <echo/echo.hpp>

using namespace vdbc;
using namespace vdbc::model;
using namespace vdbc::codec;

namespace {

    Result<Database> build_network() {
        Database db;
        for (const char *name : {"EMS", "Dash", "Logger"}) {
            if (auto r = db.add_node(Node(name)); !r.is_ok())
                return Result<Database>::err(r.error());
        }

        Message eec1("EEC1", 0x0CF00400, 8, true);
        eec1.with_transmitter("EMS")
            .with_signal(Signal("EngineSpeed", 24, 16).set_scaling(0.125, 0.0).set_unit("rpm").add_receiver("Dash"))
            .with_signal(Signal("TorqueMode", 0, 4).add_receiver("Logger"));
        if (auto r = db.add_message(eec1); !r.is_ok())
            return Result<Database>::err(r.error());

        if (auto r = attribute::set_protocol_type(db, "J1939"); !r.is_ok())
            return Result<Database>::err(r.error());
        if (auto r = attribute::set_tp_tx_identifier(db, "EMS", 0x00); !r.is_ok())
            return Result<Database>::err(r.error());
        if (auto r = attribute::set_cycle_time(db, "EEC1", 10); !r.is_ok())
            return Result<Database>::err(r.error());
        db.set_frame_id_mask(0x1FFFFF00);
        return Result<Database>::ok(std::move(db));
    }

} // namespace

int main() {
    echo::info("=== Node-Scoped Codec Demo ===");

    auto built = build_network();
    if (!built.is_ok()) {
        echo::error("Network setup failed: ", built.error().message);
        return 1;
    }
    Database db = std::move(built.value());
    if (auto v = db.validate(); !v.is_ok()) {
        echo::error("Invalid network: ", v.error().message);
        return 1;
    }

    NodeScopedCodec codec(db);
    const auto &ems = *db.find_node("EMS");
    const auto &eec1 = *db.find_message("EEC1");

    dp::Map<dp::String, f64> values;
    values["EngineSpeed"] = 1450.0;
    values["TorqueMode"] = 3;

    auto payload = codec.encode_for_node(ems, eec1, values);
    if (!payload.is_ok()) {
        echo::error("Encode failed: ", payload.error().message);
        return 1;
    }
    auto frame_id = codec.frame_id_for_node(ems, eec1);
    echo::info("EMS sends ", id::hex_string(frame_id.value(), true), " every ",
               attribute::cycle_time(db, eec1).value(), " ms");

    // Dash may not write EEC1
    auto denied = codec.encode_for_node("Dash", "EEC1", values);
    echo::info("Dash encoding EEC1: ", denied.error().message);

    // Each receiver sees only its own signals
    for (const char *name : {"Dash", "Logger"}) {
        auto decoded = codec.decode_frame_for_node(*db.find_node(name), frame_id.value(), true, payload.value());
        if (!decoded.is_ok()) {
            echo::error(name, ": ", decoded.error().message);
            continue;
        }
        echo::info("\n", name, " observes ", decoded.value().size(), " signal(s):");
        for (const auto &sig : decoded.value().signals) {
            echo::info("  ", sig.name, " = ", sig.value);
        }
    }

    // Back-references
    echo::info("\nEMS transmits ", db.transmitted_messages("EMS").size(), " message(s)");
    if (const auto *rx = db.received_signals("Dash")) {
        echo::info("Dash receives ", rx->size(), " signal(s)");
    }

    echo::info("\n=== Demo Complete ===");
    return 0;
}
