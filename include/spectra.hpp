#pragma once

#include "utils.hpp"
#include "spectra/features.hpp"
#include "spectra/random.hpp"
#include <string>
#include <vector>
#include <variant>
#include <memory>
#include <unordered_map>


namespace specfact {

enum class Modality {
    IR,
    UV_VIS,
    NMR
};

enum class Nucleus {
    H1,
    C13
};

std::string modalityToString(Modality modality);
std::string nucleusToString(Nucleus nucleus);
Modality parseModality(const std::string& name);
Nucleus parseNucleus(const std::string& name);

// Fixed sampling window of a curve-bearing modality.
struct AxisWindow {
    double minX;
    double maxX;
    double step;
    double baseline;
    double noiseAmplitude;

    size_t numPoints() const;
};

// 400-4000 cm-1 every 0.5 cm-1, transmittance baseline 98 %
extern const AxisWindow kInfraredWindow;
// 200-800 nm every 0.5 nm, absorbance baseline 0.03
extern const AxisWindow kUltravioletWindow;

struct SpectrumPoint {
    double x;
    double y;
};

using Curve = std::vector<SpectrumPoint>;

// A synthesizer-proposed feature before it is rendered into (or extracted
// from) a curve. For IR the amplitude is the target transmittance at the band
// minimum, for UV-Vis the absorbance added at the band center, for NMR the
// relative intensity.
struct CharacteristicPeak {
    double center;
    double targetAmplitude;
    double width;
    std::string label;
};

struct LabeledPeak {
    double x;
    double y;
    std::string label;
};

struct NMRPeak {
    double shift;
    double intensity;
    std::string multiplicity;   // s, d, t, q, m, bs
    double coupling = 0.0;      // J in Hz, 0 when not reported
    std::string label;
    std::vector<int> atomIds;

    bool hasCoupling() const { return coupling > 0.0; }
};

struct IRSpectrum {
    Curve curve;
    std::vector<LabeledPeak> peaks;
};

struct UVSpectrum {
    Curve curve;
    std::vector<LabeledPeak> peaks;
};

struct NMRSpectrum {
    Nucleus nucleus = Nucleus::H1;
    std::vector<NMRPeak> peaks;
};

using SpectrumResult = std::variant<IRSpectrum, UVSpectrum, NMRSpectrum>;

Modality resultModality(const SpectrumResult& result);
size_t peakCount(const SpectrumResult& result);
bool isEmpty(const SpectrumResult& result);

// One strategy per modality (and nucleus for NMR).
class SpectrumSynthesizer {
protected:
    std::string name;
    std::string description;

public:
    SpectrumSynthesizer(const std::string& name, const std::string& description)
        : name(name), description(description) {}
    virtual ~SpectrumSynthesizer() = default;

    const std::string& getName() const { return name; }
    const std::string& getDescription() const { return description; }

    virtual Modality getModality() const = 0;
    // An empty result of the synthesizer's own modality.
    virtual SpectrumResult emptyResult() const = 0;
    virtual SpectrumResult synthesize(const spectra::FeatureFlags& flags,
                                      const std::string& descriptor,
                                      spectra::RandomSource& rng) const = 0;
};

// Registry of synthesizers and the engine's single entry point.
class SpectrumFactory {
private:
    std::unordered_map<std::string, std::unique_ptr<SpectrumSynthesizer>> synthesizers;
    std::shared_ptr<const spectra::IFeatureDetector> detector;

public:
    SpectrumFactory();
    explicit SpectrumFactory(std::shared_ptr<const spectra::IFeatureDetector> detector);
    ~SpectrumFactory() = default;

    void registerSynthesizer(std::unique_ptr<SpectrumSynthesizer> synthesizer);
    const SpectrumSynthesizer* getSynthesizer(const std::string& name) const;
    std::vector<std::string> getAvailableSynthesizers() const;

    const spectra::IFeatureDetector& getDetector() const { return *detector; }

    static std::string synthesizerName(Modality modality, Nucleus nucleus = Nucleus::H1);

    // Total over any descriptor: an empty descriptor gives an empty result.
    SpectrumResult synthesize(const std::string& descriptor, Modality modality,
                              Nucleus nucleus, spectra::RandomSource& rng) const;
    SpectrumResult synthesize(const std::string& descriptor, Modality modality,
                              spectra::RandomSource& rng) const;

    // Throws SpectrumException for an unregistered name.
    SpectrumResult calculate(const std::string& synthesizerName, const std::string& descriptor,
                             spectra::RandomSource& rng) const;

    void registerAllSynthesizers();
};

}  // namespace specfact
