#include "spectra/ir.hpp"
#include "spectra/lineshapes.hpp"
#include "spectra/overrides.hpp"
#include "spectra/peaks.hpp"
#include <algorithm>
#include <cmath>

namespace specfact {
namespace spectra {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kNoiseFrequency = 0.08;
constexpr double kFingerprintMin = 600.0;
constexpr double kFingerprintSpan = 750.0;
// Fingerprint peaks stay clear of strong bands (target below 50 %T) by this much.
constexpr double kFingerprintClearance = 40.0;
constexpr double kStrongBandTarget = 50.0;

// Draws center, target and width in that order.
void addBand(std::vector<CharacteristicPeak>& peaks, RandomSource& rng,
             double center, double centerSpan,
             double target, double targetSpan,
             double width, double widthSpan,
             const std::string& label) {
    CharacteristicPeak peak;
    peak.center = rng.jitter(center, centerSpan);
    peak.targetAmplitude = rng.jitter(target, targetSpan);
    peak.width = rng.jitter(width, widthSpan);
    peak.label = label;
    peaks.push_back(peak);
}

bool hasLabel(const std::vector<CharacteristicPeak>& peaks, const std::string& label) {
    return std::any_of(peaks.begin(), peaks.end(),
                       [&label](const CharacteristicPeak& p) { return p.label == label; });
}

} // namespace

std::vector<CharacteristicPeak> IRSynthesizer::buildPeaks(const FeatureFlags& f, const std::string& smiles,
                                                          RandomSource& rng) {
    std::vector<CharacteristicPeak> peaks;
    const bool nitrile = SmilesPatternDetector::hasNitrileMotif(smiles);

    if (f.hasOH) {
        addBand(peaks, rng, 3350, 250, 30, 40, 100, 200, "O-H stretch (Alcohol/Phenol)");
    }
    if (f.hasCOOH) {
        addBand(peaks, rng, 2800, 400, 40, 40, 300, 300, "O-H stretch (Carboxylic Acid)");
        addBand(peaks, rng, 1710, 20, 10, 20, 25, 15, "C=O stretch (Carboxylic Acid)");
    }
    if (f.hasNH) {
        addBand(peaks, rng, 3350, 150, 45, 35, 50, 50, "N-H stretch");
        // Unsubstituted nitrogen: primary amine doublet
        if (!SmilesPatternDetector::hasSubstitutedNitrogen(smiles)) {
            addBand(peaks, rng, 3400, 100, 50, 30, 40, 40, "N-H stretch");
        }
    }
    if (f.hasAmideNH) {
        addBand(peaks, rng, 3200, 200, 40, 30, 60, 60, "N-H stretch (Amide)");
    }
    if (f.hasSp3CH) {
        addBand(peaks, rng, 2960, 40, 40, 30, 25, 15, "C-H stretch (sp3)");
        addBand(peaks, rng, 2870, 40, 50, 30, 30, 15, "C-H stretch (sp3)");
        addBand(peaks, rng, 1450, 30, 50, 30, 20, 10, "C-H bend (sp3)");
        addBand(peaks, rng, 1375, 15, 55, 25, 15, 10, "C-H bend (sp3)"); // CH3 symmetric
    }
    if (f.hasSp2CH) {
        addBand(peaks, rng, 3050, 70, 70, 20, 15, 10, "C-H stretch (sp2)");
    }
    if (f.hasAlkyne && !nitrile) {
        // Terminal C#C-H
        addBand(peaks, rng, 3300, 30, 50, 20, 20, 10, "C-H stretch (sp)");
        addBand(peaks, rng, 2120, 40, 70, 20, 15, 10, "C#C stretch");
    } else if (f.hasAlkyne) {
        addBand(peaks, rng, 2200, 60, 85, 10, 15, 10, "C#C stretch (Internal)");
    }
    if (f.hasEster && !f.hasCOOH) {
        addBand(peaks, rng, 1740, 20, 10, 15, 20, 10, "C=O stretch (Ester)");
        addBand(peaks, rng, 1180, 100, 20, 30, 30, 20, "C-O stretch (Ester)");
    }
    if (f.hasAmide) {
        addBand(peaks, rng, 1660, 30, 15, 20, 30, 15, "C=O stretch (Amide I)");
        if (f.hasAmideNH) {
            addBand(peaks, rng, 1550, 50, 40, 30, 30, 20, "N-H bend (Amide II)");
        }
    }
    if (f.hasKetoneAldehyde) {
        addBand(peaks, rng, 1715, 25, 10, 15, 20, 10, "C=O stretch (Ketone/Aldehyde)");
        if (SmilesPatternDetector::hasAldehydeMotif(smiles)) {
            addBand(peaks, rng, 2720, 20, 70, 15, 15, 5, "C-H stretch (Aldehyde)");
            addBand(peaks, rng, 2820, 20, 75, 15, 15, 5, "C-H stretch (Aldehyde)");
        }
    }
    if (f.hasAlkene) {
        addBand(peaks, rng, 1650, 30, 65, 25, 15, 10, "C=C stretch (Alkene)");
        addBand(peaks, rng, 910, 80, 40, 30, 20, 15, "C-H oop bend (Alkene)");
    }
    if (f.hasAromatic) {
        addBand(peaks, rng, 1600, 15, 60, 25, 15, 10, "C=C stretch (Aromatic)");
        addBand(peaks, rng, 1475, 50, 55, 30, 20, 15, "C=C stretch (Aromatic)");
        addBand(peaks, rng, 750, 100, 30, 30, 25, 15, "C-H oop bend (Aromatic)");
    }
    const bool singleBondCO = f.hasEther || (f.hasOH && !f.hasCOOH) || (f.hasEster && !f.hasCOOH);
    if (singleBondCO && !hasLabel(peaks, "C-O stretch (Ester)")) {
        addBand(peaks, rng, 1100, 150, 35, 40, 40, 30, "C-O stretch");
    }
    if (nitrile) {
        addBand(peaks, rng, 2250, 20, 50, 30, 15, 10, "C#N stretch");
    }

    addFingerprintPeaks(peaks, rng);

    if (const CuratedSpectrum* curated = findCuratedSpectrum(smiles)) {
        applyCuratedIR(*curated, peaks, rng);
    }
    return peaks;
}

void IRSynthesizer::addFingerprintPeaks(std::vector<CharacteristicPeak>& peaks, RandomSource& rng) {
    const int fingerprintCount = 3 + static_cast<int>(std::floor(rng.uniform() * 5));
    for (int i = 0; i < fingerprintCount; ++i) {
        const double wavenumber = rng.jitter(kFingerprintMin, kFingerprintSpan);
        bool isTooClose = std::any_of(peaks.begin(), peaks.end(), [wavenumber](const CharacteristicPeak& p) {
            return std::abs(p.center - wavenumber) < kFingerprintClearance && p.targetAmplitude < kStrongBandTarget;
        });
        if (isTooClose) continue;

        CharacteristicPeak peak;
        peak.center = wavenumber;
        peak.targetAmplitude = rng.jitter(45, 45);
        peak.width = rng.jitter(15, 15);
        peak.label = "Fingerprint region";
        peaks.push_back(peak);
    }
}

Curve IRSynthesizer::renderCurve(const std::vector<CharacteristicPeak>& peaks, RandomSource& rng) {
    const AxisWindow& window = kInfraredWindow;
    const Eigen::ArrayXd axis = makeAxis(window.minX, window.maxX, window.step);

    Eigen::ArrayXd transmittance(axis.size());
    for (Eigen::Index i = 0; i < axis.size(); ++i) {
        double noise = (rng.uniform() - 0.5) * 2.0 * window.noiseAmplitude;
        // Slow baseline wander on top of the white noise
        noise += std::sin(axis[i] * kNoiseFrequency + rng.uniform() * kPi) * window.noiseAmplitude * 0.4;
        transmittance[i] = window.baseline + noise;
    }

    for (const auto& peak : peaks) {
        const double amplitude = std::max(0.0, window.baseline - peak.targetAmplitude);
        transmittance -= lorentzianProfile(axis, peak.center, peak.width, amplitude);
    }
    transmittance = transmittance.max(0.1).min(100.0);

    Curve curve;
    curve.reserve(static_cast<size_t>(axis.size()));
    for (Eigen::Index i = 0; i < axis.size(); ++i) {
        curve.push_back({axis[i], transmittance[i]});
    }
    return curve;
}

SpectrumResult IRSynthesizer::synthesize(const FeatureFlags& flags, const std::string& descriptor,
                                         RandomSource& rng) const {
    IRSpectrum spectrum;
    std::vector<CharacteristicPeak> peaks = buildPeaks(flags, descriptor, rng);
    spectrum.curve = renderCurve(peaks, rng);
    spectrum.peaks = extractIRPeaks(spectrum.curve, peaks);

    if (const CuratedSpectrum* curated = findCuratedSpectrum(descriptor)) {
        spectrum.peaks = simplifyCuratedLabels(*curated, spectrum.peaks);
    }
    globalLogger.debug("IR: " + std::to_string(peaks.size()) + " bands, " +
                       std::to_string(spectrum.peaks.size()) + " labeled peaks for '" + descriptor + "'");
    return spectrum;
}

} // namespace spectra
} // namespace specfact
