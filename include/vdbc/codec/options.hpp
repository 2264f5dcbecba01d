#pragma once

#include "../core/types.hpp"

namespace vdbc::codec {

    // ─── Codec behavior switches ────────────────────────────────────────────────
    struct CodecOptions {
        bool scaling = true;        // apply factor/offset; off = values are raw integers
        bool decode_choices = true; // attach the value-table label on decode
        bool strict = true;         // reject physical values outside [minimum, maximum]
        bool padding = false;       // unused bits encode as 1 on whole-message encode

        // Fluent API
        CodecOptions &set_scaling(bool s) {
            scaling = s;
            return *this;
        }
        CodecOptions &set_decode_choices(bool d) {
            decode_choices = d;
            return *this;
        }
        CodecOptions &set_strict(bool s) {
            strict = s;
            return *this;
        }
        CodecOptions &set_padding(bool p) {
            padding = p;
            return *this;
        }
    };

} // namespace vdbc::codec
