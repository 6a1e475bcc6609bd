#pragma once

#include "spectra.hpp"
#include <vector>

namespace specfact {
namespace spectra {

// UV-Vis absorbance spectrum built from Gaussian electronic transitions.
class UVSynthesizer : public SpectrumSynthesizer {
public:
    UVSynthesizer() : SpectrumSynthesizer("uv", "UV-Vis absorbance, 200-800 nm") {}

    Modality getModality() const override { return Modality::UV_VIS; }
    SpectrumResult emptyResult() const override { return UVSpectrum{}; }
    SpectrumResult synthesize(const FeatureFlags& flags, const std::string& descriptor,
                              RandomSource& rng) const override;

    static std::vector<CharacteristicPeak> buildTransitions(const FeatureFlags& flags, RandomSource& rng);
    static Curve renderCurve(const std::vector<CharacteristicPeak>& transitions, RandomSource& rng);
};

} // namespace spectra
} // namespace specfact
