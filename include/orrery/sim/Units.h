#pragma once

// Internal units: light-seconds, hours, Jupiter masses.
namespace orrery::sim::units {

// Gravitational constant in ls^3 / (MJ h^2).
inline constexpr double kGravitationalConstant = 0.0609109;

inline constexpr double kLsPerAu = 499.0;
inline constexpr double kJupiterMassesPerSolarMass = 1048.0;
inline constexpr double kJupiterMassesPerEarthMass = 0.003146;
inline constexpr double kLsPerEarthRadius = 0.021251398;
inline constexpr double kLsPerSolarRadius = 2.32;
inline constexpr double kLsPerParsec = 1.029e8;
inline constexpr double kLsPerKm = 3.336e-6;

constexpr double auToLs(double au) { return au * kLsPerAu; }
constexpr double solarToJupiterMasses(double solar) { return solar * kJupiterMassesPerSolarMass; }
constexpr double earthToJupiterMasses(double earth) { return earth * kJupiterMassesPerEarthMass; }
constexpr double earthRadiiToLs(double radii) { return radii * kLsPerEarthRadius; }
constexpr double solarRadiiToLs(double radii) { return radii * kLsPerSolarRadius; }
constexpr double parsecToLs(double pc) { return pc * kLsPerParsec; }
constexpr double lsToParsec(double ls) { return ls / kLsPerParsec; }
constexpr double kmToLs(double km) { return km * kLsPerKm; }

} // namespace orrery::sim::units
