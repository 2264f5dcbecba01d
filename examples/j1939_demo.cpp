#include <vdbc.hpp>
#include <echo/echo.hpp>

using namespace vdbc;
using namespace vdbc::model;

int main() {
    echo::info("=== J1939 Arbitration ID Demo ===");

    // Decode the same frame id under every scheme
    FrameId raw = 0x18FEF100;
    for (auto scheme : {id::IdScheme::Plain, id::IdScheme::J1939, id::IdScheme::GMParameterId}) {
        auto decoded = id::decode(raw, true, scheme);
        if (!decoded.is_ok()) {
            echo::error(decoded.error().message);
            continue;
        }
        const auto &v = decoded.value();
        if (const auto *j = std::get_if<id::J1939Id>(&v)) {
            echo::info("J1939: priority ", static_cast<int>(j->priority), " PGN ", id::hex_string(j->pgn(), false),
                       " source ", id::hex_string(j->source_address, false));
        } else if (const auto *gm = std::get_if<id::GMParameterId>(&v)) {
            echo::info("GM: priority ", static_cast<int>(gm->priority), " parameter ",
                       id::hex_string(gm->parameter_id, false), " source ", id::hex_string(gm->source_id, false));
        } else if (const auto *ext = std::get_if<id::ExtendedId>(&v)) {
            echo::info("Plain extended: ", id::hex_string(ext->id, true));
        }
    }

    // Database-level scheme selection
    Database db;
    for (const char *name : {"EMS", "Cluster"}) {
        if (auto r = db.add_node(Node(name)); !r.is_ok()) {
            echo::error(r.error().message);
            return 1;
        }
    }

    Message eec1("EEC1", 0x0CF00400, 8, true);
    eec1.with_transmitter("EMS").with_signal(
        Signal("EngineSpeed", 24, 16).set_scaling(0.125, 0.0).set_unit("rpm").add_receiver("Cluster"));
    if (auto r = db.add_message(eec1); !r.is_ok()) {
        echo::error(r.error().message);
        return 1;
    }

    if (auto r = attribute::set_protocol_type(db, "J1939"); !r.is_ok()) {
        echo::error(r.error().message);
        return 1;
    }
    auto scheme = attribute::id_scheme(db);
    echo::info("\nProtocolType J1939 -> scheme ", id::id_scheme_name(scheme.value()));

    auto arb = attribute::arbitration_id(db, *db.find_message("EEC1"));
    if (arb.is_ok()) {
        const auto &j = std::get<id::J1939Id>(arb.value());
        echo::info("EEC1 PGN ", id::hex_string(j.pgn(), false), " (", j.is_pdu2() ? "PDU2" : "PDU1", ")");
    }

    // Build an id from a PGN and a source address
    auto request = id::J1939Id::from_pgn(0xEA00);
    if (request.is_ok()) {
        auto req = request.value();
        req.priority = 6;
        req.pdu_specific = 0x00;
        req.source_address = 0xF9;
        echo::info("Request to 0x00 from 0xF9: ", id::hex_string(req.encode().value(), true));
    }

    echo::info("\n=== Demo Complete ===");
    return 0;
}
