#pragma once

#include "types.hpp"

namespace vdbc {

    // ─── Arbitration ID widths ───────────────────────────────────────────────────
    inline constexpr FrameId STANDARD_ID_MAX = 0x7FF;
    inline constexpr FrameId EXTENDED_ID_MAX = 0x1FFFFFFF;
    inline constexpr u32 DBC_EXTENDED_FLAG = 0x80000000; // BO_ ids of extended frames carry bit 31

    // ─── J1939 (SAE J1939-21) ────────────────────────────────────────────────────
    inline constexpr u8 J1939_PDU2_THRESHOLD = 240; // PF >= 240: PS is a group extension
    inline constexpr PGN J1939_PGN_MAX = 0x3FFFF;
    inline constexpr Address J1939_GLOBAL_ADDRESS = 0xFF;

    // ─── Payload limits ──────────────────────────────────────────────────────────
    inline constexpr u32 CAN_DATA_LENGTH = 8;
    inline constexpr u32 CANFD_DATA_LENGTH = 64;
    inline constexpr u32 MAX_SIGNAL_BITS = 64;

    // ─── Node reference meaning "no sender / no receiver" ───────────────────────
    inline constexpr const char *VECTOR_XXX = "Vector__XXX";

    // ─── Well-known attribute names ──────────────────────────────────────────────
    namespace attr {
        inline constexpr const char *PROTOCOL_TYPE = "ProtocolType";
        inline constexpr const char *USE_GM_PARAMETER_IDS = "UseGMParameterIDs";
        inline constexpr const char *MULTIPLEX_EXT_ENABLED = "MultiplexExtEnabled";
        inline constexpr const char *BUS_TYPE = "BusType";
        inline constexpr const char *DB_NAME = "DBName";

        inline constexpr const char *GEN_MSG_CYCLE_TIME = "GenMsgCycleTime";
        inline constexpr const char *GEN_MSG_DELAY_TIME = "GenMsgDelayTime";
        inline constexpr const char *GEN_MSG_START_DELAY_TIME = "GenMsgStartDelayTime";
        inline constexpr const char *GEN_MSG_SEND_TYPE = "GenMsgSendType";
        inline constexpr const char *GEN_MSG_IL_SUPPORT = "GenMsgILSupport";

        inline constexpr const char *GEN_SIG_START_VALUE = "GenSigStartValue";
        inline constexpr const char *GEN_SIG_SEND_TYPE = "GenSigSendType";
        inline constexpr const char *GEN_SIG_INACTIVE_VALUE = "GenSigInactiveValue";
        inline constexpr const char *SPN = "SPN";

        inline constexpr const char *TP_TX_IDENTIFIER = "TpTxIdentifier";
        inline constexpr const char *TP_RX_IDENTIFIER = "TpRxIdentifier";
        inline constexpr const char *NM_STATION_ADDRESS = "NmStationAddress";
    } // namespace attr

    inline constexpr i64 ATTR_INT_MAX = 2147483647;

} // namespace vdbc
