#pragma once
// observatory/telescope.hpp - Telescope optics as seen by the planet renderer
//
// Field of view, aperture and obstructions drive the disk scale and the
// diffraction pattern; inversion flags mirror the texture lookup like an
// erecting or diagonal-equipped instrument would.

#include <algorithm>
#include <cmath>
#include <numbers>
#include <string>

namespace planetrender {

// -----------------------------------------------------------------------
// Telescope
// -----------------------------------------------------------------------
struct Telescope {
    std::string name{"Generic Refractor"};

    double aperture_mm{100.0};         ///< Clear aperture diameter [mm]
    double focal_length_mm{1000.0};    ///< Effective focal length [mm]
    double central_obstruction{0.0};   ///< Fractional obstruction diameter (0..1)
    double spider_mm{0.0};             ///< Width of the secondary support vanes [mm]
    double chromatism_arcsec{0.0};     ///< Red/blue focus offset on the sky [arcsec]
    double field_arcsec{600.0};        ///< Field of view across the canvas width [arcsec]
    bool   invert_horizontal{false};
    bool   invert_vertical{false};

    bool operator==(const Telescope&) const = default;

    // -----------------------------------------------------------------------
    // Derived optical properties
    // -----------------------------------------------------------------------

    /// F-ratio
    double fRatio() const { return focal_length_mm / aperture_mm; }

    /// Field of view [radians]
    double field_rad() const {
        return field_arcsec * std::numbers::pi / (180.0 * 3600.0);
    }

    /// Diffraction limit (Rayleigh criterion) [arcsec]
    double diffractionLimit_arcsec(double wavelength_nm = 560.0) const {
        // θ = 1.22 λ/D  (radians) → arcsec
        return 1.22 * (wavelength_nm * 1e-9) / (aperture_mm * 1e-3)
               * (180.0 / std::numbers::pi) * 3600.0;
    }

    /// Angular extent of the simulated diffraction pattern [arcsec], at least 1.
    int diffractionPatternField_arcsec() const {
        if (aperture_mm <= 0.0) return 1;
        return std::max(1, static_cast<int>(1500.0 / aperture_mm));
    }

    double aperture_cm() const { return aperture_mm / 10.0; }
    double obstruction_cm() const { return aperture_cm() * central_obstruction; }
    double spider_cm() const { return spider_mm / 10.0; }
};

// -----------------------------------------------------------------------
// Factory helpers
// -----------------------------------------------------------------------

/// 100 mm f/10 apochromatic refractor, 10 arcmin field.
inline Telescope makeRefractor100mm() {
    Telescope t;
    t.name            = "100 mm Refractor";
    t.aperture_mm     = 100.0;
    t.focal_length_mm = 1000.0;
    t.field_arcsec    = 600.0;
    return t;
}

/// Typical amateur 8" Schmidt-Cassegrain with a star diagonal.
inline Telescope makeSchCas8inch() {
    Telescope t;
    t.name                = "8\" Schmidt-Cassegrain";
    t.aperture_mm         = 203.2;
    t.focal_length_mm     = 2032.0;
    t.central_obstruction = 0.34;
    t.field_arcsec        = 180.0;
    t.invert_horizontal   = true;
    return t;
}

/// 10" Newtonian reflector: obstructed, four-vane spider.
inline Telescope makeNewtonian10inch() {
    Telescope t;
    t.name                = "10\" Newtonian";
    t.aperture_mm         = 254.0;
    t.focal_length_mm     = 1200.0;
    t.central_obstruction = 0.22;
    t.spider_mm           = 1.5;
    t.field_arcsec        = 240.0;
    t.invert_horizontal   = true;
    t.invert_vertical     = true;
    return t;
}

} // namespace planetrender
