#pragma once

#include "spectra.hpp"
#include <vector>

namespace specfact {
namespace spectra {

// Infrared transmittance spectrum built from Lorentzian absorption bands.
class IRSynthesizer : public SpectrumSynthesizer {
public:
    IRSynthesizer() : SpectrumSynthesizer("ir", "Infrared transmittance, 400-4000 cm-1") {}

    Modality getModality() const override { return Modality::IR; }
    SpectrumResult emptyResult() const override { return IRSpectrum{}; }
    SpectrumResult synthesize(const FeatureFlags& flags, const std::string& descriptor,
                              RandomSource& rng) const override;

    // Characteristic bands for the flagged groups, fingerprint scatter
    // included and curated bands applied.
    static std::vector<CharacteristicPeak> buildPeaks(const FeatureFlags& flags, const std::string& descriptor,
                                                      RandomSource& rng);
    static void addFingerprintPeaks(std::vector<CharacteristicPeak>& peaks, RandomSource& rng);
    static Curve renderCurve(const std::vector<CharacteristicPeak>& peaks, RandomSource& rng);
};

} // namespace spectra
} // namespace specfact
