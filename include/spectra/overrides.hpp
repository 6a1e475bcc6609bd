#pragma once

#include "spectra.hpp"
#include <string>
#include <vector>
#include <utility>

namespace specfact {
namespace spectra {

// Curated IR band: center +/- centerJitter/2, amplitude and width drawn as
// base + U * span.
struct IRPeakTemplate {
    double center;
    double centerJitter;
    double target;
    double targetSpan;
    double width;
    double widthSpan;
    std::string label;
};

// Generic peak to drop before the curated bands are added. A rule with
// tolerance <= 0 matches on the label alone.
struct PeakRemovalRule {
    std::string labelFragment;
    bool exactLabel;
    double near;
    double tolerance;

    bool matches(const CharacteristicPeak& peak) const;
};

struct NMRPeakTemplate {
    double shift;
    double shiftJitter;
    double intensity;
    std::string multiplicity;
    std::string label;
    std::vector<int> atomIds;
};

// Hand-checked spectra for specific descriptors, consulted before the generic
// heuristics. Exact string match only.
struct CuratedSpectrum {
    std::vector<PeakRemovalRule> irRemovals;
    std::vector<IRPeakTemplate> irPeaks;
    // Applied in order after peak extraction: label containing first -> second.
    std::vector<std::pair<std::string, std::string>> irLabelSimplifications;
    std::vector<NMRPeakTemplate> protonPeaks;
    std::vector<NMRPeakTemplate> carbonPeaks;
};

const CuratedSpectrum* findCuratedSpectrum(const std::string& descriptor);
std::vector<std::string> curatedDescriptors();

// Filter the generic list and append the curated bands.
void applyCuratedIR(const CuratedSpectrum& curated, std::vector<CharacteristicPeak>& peaks, RandomSource& rng);

// Rename labels and keep only the first peak of each simplified label.
std::vector<LabeledPeak> simplifyCuratedLabels(const CuratedSpectrum& curated, const std::vector<LabeledPeak>& peaks);

std::vector<NMRPeak> curatedNMRPeaks(const CuratedSpectrum& curated, Nucleus nucleus, RandomSource& rng);

} // namespace spectra
} // namespace specfact
