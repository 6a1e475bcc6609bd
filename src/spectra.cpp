#include "spectra.hpp"
#include "spectra/ir.hpp"
#include "spectra/uv.hpp"
#include "spectra/nmr.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace specfact {

const AxisWindow kInfraredWindow = {400.0, 4000.0, 0.5, 98.0, 0.8};
const AxisWindow kUltravioletWindow = {200.0, 800.0, 0.5, 0.03, 0.005};

size_t AxisWindow::numPoints() const {
    if (step <= 0.0 || maxX < minX) return 0;
    return static_cast<size_t>(std::llround((maxX - minX) / step)) + 1;
}

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

std::string modalityToString(Modality modality) {
    switch (modality) {
        case Modality::IR: return "ir";
        case Modality::UV_VIS: return "uv";
        case Modality::NMR: return "nmr";
    }
    return "unknown";
}

std::string nucleusToString(Nucleus nucleus) {
    return nucleus == Nucleus::H1 ? "1H" : "13C";
}

Modality parseModality(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "ir") return Modality::IR;
    if (lower == "uv" || lower == "uv-vis" || lower == "uvvis" || lower == "uv_vis") return Modality::UV_VIS;
    if (lower == "nmr") return Modality::NMR;
    throw SpectrumException("Unknown modality: " + name + " (expected ir, uv or nmr)", ErrorCode::PARSE_ERROR);
}

Nucleus parseNucleus(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "1h" || lower == "h1" || lower == "h") return Nucleus::H1;
    if (lower == "13c" || lower == "c13" || lower == "c") return Nucleus::C13;
    throw SpectrumException("Unknown nucleus: " + name + " (expected 1H or 13C)", ErrorCode::PARSE_ERROR);
}

Modality resultModality(const SpectrumResult& result) {
    switch (result.index()) {
        case 0: return Modality::IR;
        case 1: return Modality::UV_VIS;
        default: return Modality::NMR;
    }
}

size_t peakCount(const SpectrumResult& result) {
    return std::visit([](const auto& spectrum) { return spectrum.peaks.size(); }, result);
}

bool isEmpty(const SpectrumResult& result) {
    if (const auto* ir = std::get_if<IRSpectrum>(&result)) {
        return ir->curve.empty() && ir->peaks.empty();
    }
    if (const auto* uv = std::get_if<UVSpectrum>(&result)) {
        return uv->curve.empty() && uv->peaks.empty();
    }
    return std::get<NMRSpectrum>(result).peaks.empty();
}

// SpectrumFactory implementation
SpectrumFactory::SpectrumFactory()
    : SpectrumFactory(std::make_shared<spectra::SmilesPatternDetector>()) {}

SpectrumFactory::SpectrumFactory(std::shared_ptr<const spectra::IFeatureDetector> detector)
    : detector(std::move(detector)) {
    if (!this->detector) {
        throw SpectrumException("SpectrumFactory requires a feature detector", ErrorCode::CALCULATION_ERROR);
    }
    globalLogger.debug("Initializing spectrum factory with detector '" + this->detector->getName() + "'");
    registerAllSynthesizers();
}

void SpectrumFactory::registerAllSynthesizers() {
    registerSynthesizer(std::make_unique<spectra::IRSynthesizer>());
    registerSynthesizer(std::make_unique<spectra::UVSynthesizer>());
    registerSynthesizer(std::make_unique<spectra::NMRSynthesizer>(Nucleus::H1));
    registerSynthesizer(std::make_unique<spectra::NMRSynthesizer>(Nucleus::C13));
}

void SpectrumFactory::registerSynthesizer(std::unique_ptr<SpectrumSynthesizer> synthesizer) {
    if (synthesizer) {
        synthesizers[synthesizer->getName()] = std::move(synthesizer);
    }
}

const SpectrumSynthesizer* SpectrumFactory::getSynthesizer(const std::string& name) const {
    auto it = synthesizers.find(name);
    if (it != synthesizers.end()) {
        return it->second.get();
    }
    return nullptr;
}

std::vector<std::string> SpectrumFactory::getAvailableSynthesizers() const {
    std::vector<std::string> names;
    names.reserve(synthesizers.size());

    for (const auto& [name, _] : synthesizers) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string SpectrumFactory::synthesizerName(Modality modality, Nucleus nucleus) {
    switch (modality) {
        case Modality::IR: return "ir";
        case Modality::UV_VIS: return "uv";
        case Modality::NMR: return nucleus == Nucleus::H1 ? "nmr_1h" : "nmr_13c";
    }
    return "";
}

SpectrumResult SpectrumFactory::synthesize(const std::string& descriptor, Modality modality,
                                           Nucleus nucleus, spectra::RandomSource& rng) const {
    return calculate(synthesizerName(modality, nucleus), descriptor, rng);
}

SpectrumResult SpectrumFactory::synthesize(const std::string& descriptor, Modality modality,
                                           spectra::RandomSource& rng) const {
    return synthesize(descriptor, modality, Nucleus::H1, rng);
}

SpectrumResult SpectrumFactory::calculate(const std::string& name, const std::string& descriptor,
                                          spectra::RandomSource& rng) const {
    const SpectrumSynthesizer* synthesizer = getSynthesizer(name);
    if (!synthesizer) {
        throw SpectrumException("Unknown synthesizer: " + name, ErrorCode::NOT_IMPLEMENTED);
    }

    if (descriptor.empty()) {
        return synthesizer->emptyResult();
    }

    spectra::FeatureFlags flags = detector->detect(descriptor);
    if (globalLogger.getMinLevel() == LogLevel::DEBUG) {
        std::string detected;
        for (const auto& [flag, present] : flags.toList()) {
            if (present) detected += (detected.empty() ? "" : ",") + flag;
        }
        globalLogger.debug("Features of '" + descriptor + "': " + (detected.empty() ? "none" : detected));
    }
    return synthesizer->synthesize(flags, descriptor, rng);
}

} // namespace specfact
