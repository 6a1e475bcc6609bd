#include "spectra/uv.hpp"
#include "spectra/lineshapes.hpp"
#include "spectra/peaks.hpp"

namespace specfact {
namespace spectra {

namespace {

void addTransition(std::vector<CharacteristicPeak>& transitions, RandomSource& rng,
                   double lambda, double lambdaSpan,
                   double intensity, double intensitySpan,
                   double width, double widthSpan,
                   const std::string& type) {
    CharacteristicPeak transition;
    transition.center = rng.jitter(lambda, lambdaSpan);
    transition.targetAmplitude = rng.jitter(intensity, intensitySpan);
    transition.width = rng.jitter(width, widthSpan);
    transition.label = type;
    transitions.push_back(transition);
}

} // namespace

std::vector<CharacteristicPeak> UVSynthesizer::buildTransitions(const FeatureFlags& f, RandomSource& rng) {
    std::vector<CharacteristicPeak> transitions;
    if (f.hasAromatic) {
        addTransition(transitions, rng, 255, 15, 0.6, 0.4, 15, 10, "π→π* (aromatic, B band)");
        // E band: stronger, shorter wavelength
        addTransition(transitions, rng, 205, 15, 0.8, 0.5, 12, 8, "π→π* (aromatic, E band)");
    }
    if (f.hasCarbonyl) {
        addTransition(transitions, rng, 270, 30, 0.1, 0.2, 20, 10, "n→π* (carbonyl)");
    }
    if (f.hasEster) {
        addTransition(transitions, rng, 205, 10, 0.3, 0.2, 15, 5, "π→π* (ester)");
    }
    if (f.hasAmide) {
        addTransition(transitions, rng, 210, 15, 0.4, 0.3, 18, 7, "π→π* (amide)");
    }
    if (f.hasAlkene) {
        // Usually below 200 nm; only the red tail reaches the window.
        addTransition(transitions, rng, 195, 15, 0.7, 0.4, 10, 5, "π→π* (alkene)");
    }
    return transitions;
}

Curve UVSynthesizer::renderCurve(const std::vector<CharacteristicPeak>& transitions, RandomSource& rng) {
    const AxisWindow& window = kUltravioletWindow;
    const Eigen::ArrayXd axis = makeAxis(window.minX, window.maxX, window.step);

    Eigen::ArrayXd absorbance(axis.size());
    for (Eigen::Index i = 0; i < axis.size(); ++i) {
        absorbance[i] = window.baseline + (rng.uniform() - 0.5) * 2.0 * window.noiseAmplitude;
    }
    for (const auto& transition : transitions) {
        absorbance += gaussianProfile(axis, transition.center, transition.width, transition.targetAmplitude);
    }
    absorbance = absorbance.max(0.0);

    Curve curve;
    curve.reserve(static_cast<size_t>(axis.size()));
    for (Eigen::Index i = 0; i < axis.size(); ++i) {
        curve.push_back({axis[i], absorbance[i]});
    }
    return curve;
}

SpectrumResult UVSynthesizer::synthesize(const FeatureFlags& flags, const std::string& descriptor,
                                         RandomSource& rng) const {
    UVSpectrum spectrum;
    std::vector<CharacteristicPeak> transitions = buildTransitions(flags, rng);
    spectrum.curve = renderCurve(transitions, rng);
    spectrum.peaks = extractUVPeaks(spectrum.curve, transitions);
    globalLogger.debug("UV: " + std::to_string(transitions.size()) + " transitions, " +
                       std::to_string(spectrum.peaks.size()) + " maxima for '" + descriptor + "'");
    return spectrum;
}

} // namespace spectra
} // namespace specfact
