#include "spectra/nmr.hpp"
#include "spectra/overrides.hpp"
#include <algorithm>

namespace specfact {
namespace spectra {

namespace {

// Hands out simulated atom ids 1, 2, 3, ... in the order peaks are added.
class PeakList {
private:
    std::vector<NMRPeak> peaks;
    int nextAtomId = 1;

public:
    void add(RandomSource& rng, double shift, double shiftSpan,
             double intensity, double intensitySpan,
             const std::string& multiplicity, const std::string& label) {
        NMRPeak peak;
        peak.shift = rng.jitter(shift, shiftSpan);
        peak.intensity = rng.jitter(intensity, intensitySpan);
        peak.multiplicity = multiplicity;
        peak.label = label;
        peak.atomIds.push_back(nextAtomId++);
        peaks.push_back(peak);
    }

    std::vector<NMRPeak> release() { return std::move(peaks); }
};

} // namespace

NMRSynthesizer::NMRSynthesizer(Nucleus nucleus)
    : SpectrumSynthesizer(nucleus == Nucleus::H1 ? "nmr_1h" : "nmr_13c",
                          nucleus == Nucleus::H1 ? "1H NMR chemical shifts, ppm"
                                                 : "13C NMR chemical shifts (decoupled), ppm"),
      nucleus(nucleus) {}

SpectrumResult NMRSynthesizer::emptyResult() const {
    NMRSpectrum spectrum;
    spectrum.nucleus = nucleus;
    return spectrum;
}

std::vector<NMRPeak> NMRSynthesizer::protonPeaks(const FeatureFlags& f, const std::string& descriptor,
                                                 RandomSource& rng) {
    PeakList list;
    if (f.hasAromatic) list.add(rng, 7.2, 1.3, 0.5, 0.5, "m", "Aromatic H");
    if (f.hasAlkene) list.add(rng, 5.5, 1.0, 0.4, 0.4, "m", "Alkene H");
    if (f.hasKetoneAldehyde && SmilesPatternDetector::hasAldehydeMotif(descriptor)) {
        list.add(rng, 9.5, 0.5, 0.3, 0.3, "s", "Aldehyde H");
    }
    // Exchangeable protons: broad, variable shift
    if (f.hasCOOH) list.add(rng, 10.0, 2.0, 0.2, 0.2, "bs", "Acid OH");
    if (f.hasOH) list.add(rng, 3.0, 2.5, 0.2, 0.3, "bs", "Alcohol/Phenol OH");
    if (f.hasNH) list.add(rng, 2.0, 3.0, 0.2, 0.3, "bs", "Amine NH");
    if (f.hasAmideNH) list.add(rng, 6.0, 2.5, 0.2, 0.3, "bs", "Amide NH");

    if (f.hasCarbonyl || f.hasEther || f.hasOH) {
        list.add(rng, 2.2, 1.8, 0.6, 0.4, "m", "H alpha to heteroatom/C=O");
    }
    if (f.hasSp3CH) {
        list.add(rng, 1.3, 0.8, 0.8, 0.2, "m", "Aliphatic CHx");
        list.add(rng, 0.9, 0.4, 1.0, 0.3, "m", "Aliphatic CHx (upfield)");
    }
    return list.release();
}

std::vector<NMRPeak> NMRSynthesizer::carbonPeaks(const FeatureFlags& f, RandomSource& rng) {
    PeakList list;
    if (f.hasCarbonyl) {
        if (f.hasKetoneAldehyde) {
            list.add(rng, 195, 15, 0.3, 0.2, "s", "C=O (Ketone/Aldehyde)");
        } else if (f.hasEster) {
            list.add(rng, 165, 15, 0.3, 0.2, "s", "C=O (Ester)");
        } else if (f.hasAmide) {
            list.add(rng, 160, 15, 0.3, 0.2, "s", "C=O (Amide)");
        } else if (f.hasCOOH) {
            list.add(rng, 170, 15, 0.3, 0.2, "s", "C=O (Acid)");
        } else {
            list.add(rng, 170, 0, 0.3, 0.2, "s", "Carbonyl C");
        }
    }
    if (f.hasAromatic) {
        list.add(rng, 128, 20, 0.6, 0.3, "s", "Aromatic C");
        list.add(rng, 115, 15, 0.5, 0.3, "s", "Aromatic C");
    }
    if (f.hasAlkene) list.add(rng, 110, 30, 0.5, 0.3, "s", "Alkene C=C");
    if (f.hasAlkyne) list.add(rng, 70, 20, 0.4, 0.3, "s", "Alkyne C#C");
    if (f.hasOH || f.hasEther || f.hasEster) list.add(rng, 55, 25, 0.7, 0.2, "s", "C-O");
    if (f.hasNH || f.hasAmide) list.add(rng, 40, 20, 0.6, 0.2, "s", "C-N");
    if (f.hasSp3CH) {
        list.add(rng, 25, 20, 0.9, 0.1, "s", "Aliphatic C");
        list.add(rng, 15, 10, 1.0, 0.1, "s", "Aliphatic C (upfield)");
    }
    return list.release();
}

SpectrumResult NMRSynthesizer::synthesize(const FeatureFlags& flags, const std::string& descriptor,
                                          RandomSource& rng) const {
    NMRSpectrum spectrum;
    spectrum.nucleus = nucleus;

    if (const CuratedSpectrum* curated = findCuratedSpectrum(descriptor)) {
        spectrum.peaks = curatedNMRPeaks(*curated, nucleus, rng);
    } else if (nucleus == Nucleus::H1) {
        spectrum.peaks = protonPeaks(flags, descriptor, rng);
    } else {
        spectrum.peaks = carbonPeaks(flags, rng);
    }

    std::stable_sort(spectrum.peaks.begin(), spectrum.peaks.end(),
                     [](const NMRPeak& a, const NMRPeak& b) { return a.shift > b.shift; });
    globalLogger.debug(nucleusToString(nucleus) + " NMR: " + std::to_string(spectrum.peaks.size()) +
                       " peaks for '" + descriptor + "'");
    return spectrum;
}

} // namespace spectra
} // namespace specfact
