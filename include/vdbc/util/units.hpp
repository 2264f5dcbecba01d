#pragma once

#include "../core/types.hpp"

namespace vdbc {
    namespace util {

        // ─── Physical unit conversions for signal values ─────────────────────────
        namespace units {

            // Pressure
            inline constexpr f64 KPA_TO_PSI = 0.145038;
            inline constexpr f64 BAR_TO_PSI = 14.5038;
            inline constexpr f64 PSI_TO_KPA = 6.89476;
            inline constexpr f64 PSI_TO_BAR = 0.0689476;
            inline constexpr f64 PSI_TO_PA = 6894.76;
            inline constexpr f64 PA_TO_PSI = 0.000145038;

            // Speed
            inline constexpr f64 KPH_TO_MPH = 0.621371;
            inline constexpr f64 KPH_TO_FTSEC = 0.911344;
            inline constexpr f64 KPH_TO_MSEC = 0.277778;
            inline constexpr f64 MPH_TO_KPH = 1.60934;
            inline constexpr f64 MPH_TO_FTSEC = 1.46667;
            inline constexpr f64 MPH_TO_MSEC = 0.44704;
            inline constexpr f64 FTSEC_TO_MPH = 0.681818;
            inline constexpr f64 FTSEC_TO_KPH = 1.09728;
            inline constexpr f64 FTSEC_TO_MSEC = 0.3048;
            inline constexpr f64 MSEC_TO_KPH = 3.6;
            inline constexpr f64 MSEC_TO_MPH = 2.23694;
            inline constexpr f64 MSEC_TO_FTSEC = 3.28084;

            // Volume and mass flow
            inline constexpr f64 LH_TO_GH = 0.26;
            inline constexpr f64 GH_TO_LH = 3.78541178;
            inline constexpr f64 GSEC_TO_LBM = 0.132277;
            inline constexpr f64 LBM_TO_GSEC = 7.5599;
            inline constexpr f64 AIR_DENSITY_FACTOR = 29.92; // g/s per 4 CFM/60

            // Distance
            inline constexpr f64 KM_TO_MI = 0.621371;
            inline constexpr f64 MI_TO_KM = 1.60934;

            // ─── Pressure ────────────────────────────────────────────────────────────
            constexpr f64 kpa_to_psi(f64 v) noexcept { return v * KPA_TO_PSI; }
            constexpr f64 kpa_to_bar(f64 v) noexcept { return v * 0.01; }
            constexpr f64 kpa_to_pa(f64 v) noexcept { return v * 1000.0; }
            constexpr f64 bar_to_psi(f64 v) noexcept { return v * BAR_TO_PSI; }
            constexpr f64 bar_to_kpa(f64 v) noexcept { return v * 100.0; }
            constexpr f64 bar_to_pa(f64 v) noexcept { return v * 100000.0; }
            constexpr f64 psi_to_kpa(f64 v) noexcept { return v * PSI_TO_KPA; }
            constexpr f64 psi_to_bar(f64 v) noexcept { return v * PSI_TO_BAR; }
            constexpr f64 psi_to_pa(f64 v) noexcept { return v * PSI_TO_PA; }
            constexpr f64 pa_to_psi(f64 v) noexcept { return v * PA_TO_PSI; }
            constexpr f64 pa_to_kpa(f64 v) noexcept { return v * 0.001; }
            constexpr f64 pa_to_bar(f64 v) noexcept { return v * 1e-5; }

            // ─── Speed ───────────────────────────────────────────────────────────────
            constexpr f64 kph_to_mph(f64 v) noexcept { return v * KPH_TO_MPH; }
            constexpr f64 kph_to_ftsec(f64 v) noexcept { return v * KPH_TO_FTSEC; }
            constexpr f64 kph_to_msec(f64 v) noexcept { return v * KPH_TO_MSEC; }
            constexpr f64 mph_to_kph(f64 v) noexcept { return v * MPH_TO_KPH; }
            constexpr f64 mph_to_ftsec(f64 v) noexcept { return v * MPH_TO_FTSEC; }
            constexpr f64 mph_to_msec(f64 v) noexcept { return v * MPH_TO_MSEC; }
            constexpr f64 ftsec_to_mph(f64 v) noexcept { return v * FTSEC_TO_MPH; }
            constexpr f64 ftsec_to_kph(f64 v) noexcept { return v * FTSEC_TO_KPH; }
            constexpr f64 ftsec_to_msec(f64 v) noexcept { return v * FTSEC_TO_MSEC; }
            constexpr f64 msec_to_kph(f64 v) noexcept { return v * MSEC_TO_KPH; }
            constexpr f64 msec_to_mph(f64 v) noexcept { return v * MSEC_TO_MPH; }
            constexpr f64 msec_to_ftsec(f64 v) noexcept { return v * MSEC_TO_FTSEC; }

            // ─── Temperature ─────────────────────────────────────────────────────────
            constexpr f64 c_to_f(f64 v) noexcept { return (v * 9.0 / 5.0) + 32.0; }
            constexpr f64 f_to_c(f64 v) noexcept { return (v - 32.0) * 5.0 / 9.0; }

            // ─── Volume / mass flow ──────────────────────────────────────────────────
            constexpr f64 lh_to_gh(f64 v) noexcept { return v * LH_TO_GH; }
            constexpr f64 gh_to_lh(f64 v) noexcept { return v * GH_TO_LH; }
            constexpr f64 gsec_to_lbm(f64 v) noexcept { return v * GSEC_TO_LBM; }
            constexpr f64 lbm_to_gsec(f64 v) noexcept { return v * LBM_TO_GSEC; }
            constexpr f64 gsec_to_cfm(f64 v) noexcept { return (v * 4.0 * 60.0) / AIR_DENSITY_FACTOR; }
            constexpr f64 cfm_to_gsec(f64 v) noexcept { return ((v * AIR_DENSITY_FACTOR) / 60.0) / 4.0; }
            constexpr f64 cfm_to_lbm(f64 v) noexcept { return gsec_to_lbm(cfm_to_gsec(v)); }
            constexpr f64 lbm_to_cfm(f64 v) noexcept { return gsec_to_cfm(lbm_to_gsec(v)); }

            // ─── Distance ────────────────────────────────────────────────────────────
            constexpr f64 km_to_mi(f64 v) noexcept { return v * KM_TO_MI; }
            constexpr f64 mi_to_km(f64 v) noexcept { return v * MI_TO_KM; }

        } // namespace units
    } // namespace util
} // namespace vdbc
