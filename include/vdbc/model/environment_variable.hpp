#pragma once

#include "../core/types.hpp"
#include "attribute.hpp"
#include <datapod/datapod.hpp>

namespace vdbc::model {

    enum class EnvVarType : u8 {
        Integer = 0,
        Float = 1,
        String = 2,
    };

    // ─── Environment variable (EV_) ─────────────────────────────────────────────
    struct EnvironmentVariable {
        dp::String name;
        EnvVarType type = EnvVarType::Integer;
        f64 minimum = 0.0;
        f64 maximum = 0.0;
        dp::String unit;
        f64 initial_value = 0.0;
        u32 id = 0;
        dp::String access_type; // DUMMY_NODE_VECTOR0..3, 8000..8003
        dp::Vector<dp::String> access_nodes;
        dp::Optional<dp::String> comment;
        AttributeSet attributes;
    };

} // namespace vdbc::model
