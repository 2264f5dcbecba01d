#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "vdbc/core/constants.hpp"
#include "vdbc/core/error.hpp"
#include "vdbc/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "vdbc/util/bitfield.hpp"
#include "vdbc/util/units.hpp"

// ─── Arbitration IDs (plain, J1939, GM Parameter ID) ────────────────────────
#include "vdbc/id/arbitration_id.hpp"
#include "vdbc/id/gm_parameter_id.hpp"
#include "vdbc/id/j1939.hpp"

// ─── Object model ────────────────────────────────────────────────────────────
#include "vdbc/model/attribute.hpp"
#include "vdbc/model/database.hpp"
#include "vdbc/model/environment_variable.hpp"
#include "vdbc/model/message.hpp"
#include "vdbc/model/multiplexer.hpp"
#include "vdbc/model/node.hpp"
#include "vdbc/model/signal.hpp"
#include "vdbc/model/value_table.hpp"

// ─── Attributes ──────────────────────────────────────────────────────────────
#include "vdbc/attribute/resolver.hpp"
#include "vdbc/attribute/well_known.hpp"

// ─── Codec ───────────────────────────────────────────────────────────────────
#include "vdbc/codec/message_codec.hpp"
#include "vdbc/codec/node_codec.hpp"
#include "vdbc/codec/options.hpp"
#include "vdbc/codec/signal_codec.hpp"
