#include <vdbc.hpp>
#include <echo/echo.hpp>

using namespace vdbc;
using namespace vdbc::model;
using namespace vdbc::codec;

int main() {
    echo::info("=== Signal Codec Demo ===");

    // Coolant temperature: 1 degC/bit, -40 offset, Intel byte order
    Signal coolant("CoolantTemp", 0, 8);
    coolant.set_scaling(1.0, -40.0).set_range(-40.0, 215.0).set_unit("degC");

    // Vehicle speed: Motorola word starting at bit 15
    Signal speed("VehicleSpeed", 15, 16, ByteOrder::BigEndian);
    speed.set_scaling(0.01, 0.0).set_range(0.0, 655.35).set_unit("km/h");

    // Gear position with a local value table
    Signal gear("Gear", 28, 4);
    gear.add_choice(0, "Park").add_choice(1, "Reverse").add_choice(2, "Neutral").add_choice(3, "Drive");

    SignalCodec codec;
    dp::Vector<u8> payload(8, 0);

    auto r = codec.encode_into(coolant, 90.0, payload);
    if (!r.is_ok()) {
        echo::error("CoolantTemp: ", r.error().message);
        return 1;
    }
    r = codec.encode_into(speed, 87.35, payload);
    if (!r.is_ok()) {
        echo::error("VehicleSpeed: ", r.error().message);
        return 1;
    }
    r = codec.encode_label_into(gear, "Drive", payload);
    if (!r.is_ok()) {
        echo::error("Gear: ", r.error().message);
        return 1;
    }

    echo::info("\nPayload:");
    for (usize i = 0; i < payload.size(); ++i) {
        echo::info("  [", i, "] ", static_cast<int>(payload[i]));
    }

    echo::info("\nDecoded:");
    for (const auto *sig : {&coolant, &speed, &gear}) {
        auto decoded = codec.decode(*sig, payload);
        if (!decoded.is_ok()) {
            echo::error(sig->name, ": ", decoded.error().message);
            continue;
        }
        const auto &d = decoded.value();
        if (d.label.has_value()) {
            echo::info("  ", d.name, " = ", *d.label, " (raw ", d.raw, ")");
        } else {
            echo::info("  ", d.name, " = ", d.value, " ", sig->unit, " (raw ", d.raw, ")");
        }
    }

    // Out-of-range values are rejected and leave the payload untouched
    auto bad = codec.encode_into(coolant, 300.0, payload);
    echo::info("\nCoolantTemp 300 degC: ", bad.is_ok() ? "accepted" : bad.error().message);

    // Raw mode skips factor and offset
    SignalCodec raw(nullptr, CodecOptions{}.set_scaling(false));
    echo::info("CoolantTemp raw: ", raw.decode(coolant, payload).value().value);

    echo::info("\n=== Demo Complete ===");
    return 0;
}
