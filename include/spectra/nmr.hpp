#pragma once

#include "spectra.hpp"
#include <vector>

namespace specfact {
namespace spectra {

// Chemical-shift peak list for one nucleus. No curve is rendered here; the
// CLI draws a display envelope on request.
class NMRSynthesizer : public SpectrumSynthesizer {
private:
    Nucleus nucleus;

public:
    explicit NMRSynthesizer(Nucleus nucleus);

    Modality getModality() const override { return Modality::NMR; }
    Nucleus getNucleus() const { return nucleus; }
    SpectrumResult emptyResult() const override;
    SpectrumResult synthesize(const FeatureFlags& flags, const std::string& descriptor,
                              RandomSource& rng) const override;

    static std::vector<NMRPeak> protonPeaks(const FeatureFlags& flags, const std::string& descriptor,
                                            RandomSource& rng);
    static std::vector<NMRPeak> carbonPeaks(const FeatureFlags& flags, RandomSource& rng);
};

} // namespace spectra
} // namespace specfact
