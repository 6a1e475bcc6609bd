#pragma once

#include "spectra.hpp"
#include <vector>

namespace specfact {
namespace spectra {

// Minimum distance between two kept peaks sharing a label (cm-1).
constexpr double kIRDuplicateDistance = 15.0;
// Minimum distance between any two kept UV maxima (nm).
constexpr double kUVDuplicateDistance = 10.0;

constexpr const char* kGenericTransitionLabel = "Electronic transition";

// Transmittance minima near each characteristic band. A band is reported when
// its minimum dips below baseline - 2.5 * noise; ascending wavenumber.
std::vector<LabeledPeak> extractIRPeaks(const Curve& curve, const std::vector<CharacteristicPeak>& specs,
                                        const AxisWindow& window = kInfraredWindow);

// Local absorbance maxima above baseline + 3 * noise, labeled after the
// closest transition within twice its width; ascending wavelength.
std::vector<LabeledPeak> extractUVPeaks(const Curve& curve, const std::vector<CharacteristicPeak>& specs,
                                        const AxisWindow& window = kUltravioletWindow);

} // namespace spectra
} // namespace specfact
