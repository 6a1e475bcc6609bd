#include "spectra/overrides.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_set>

namespace specfact {
namespace spectra {

namespace {

const std::map<std::string, CuratedSpectrum>& curatedTable() {
    static const std::map<std::string, CuratedSpectrum> table = {
        {"CC(=O)C", // acetone
            CuratedSpectrum{
                {
                    {"C=O", false, 1715.0, 50.0},
                    {"C-H stretch (sp3)", false, 0.0, 0.0},
                    {"C-H bend (sp3)", false, 0.0, 0.0},
                    {"Fingerprint region", true, 1220.0, 50.0},
                },
                {
                    {1715.0, 5.0, 5.0, 5.0, 18.0, 5.0, "C=O"},
                    {2965.0, 10.0, 50.0, 10.0, 20.0, 10.0, "C-H"},  // asymmetric
                    {2925.0, 10.0, 55.0, 15.0, 20.0, 10.0, "C-H"},  // symmetric
                    {1430.0, 10.0, 40.0, 10.0, 15.0, 8.0, "CH3 bend"},
                    {1360.0, 5.0, 45.0, 10.0, 12.0, 5.0, "CH3 bend"},
                    {1220.0, 10.0, 40.0, 15.0, 20.0, 8.0, "C-C stretch"},
                },
                {
                    {"C-C", "C-C"},
                    {"CH3 bend", "CH3"},
                    {"C=O", "C=O"},
                    {"C-H", "C-H"},
                },
                {
                    {2.1, 0.1, 1.0, "s", "CH3", {1, 2}},
                },
                {
                    {206.0, 2.0, 0.4, "s", "C=O", {1}},
                    {30.0, 1.0, 1.0, "s", "CH3", {2, 3}},
                },
            }
        },
    };
    return table;
}

} // namespace

bool PeakRemovalRule::matches(const CharacteristicPeak& peak) const {
    bool labelHit = exactLabel ? peak.label == labelFragment
                               : peak.label.find(labelFragment) != std::string::npos;
    if (!labelHit) return false;
    if (tolerance <= 0.0) return true;
    return std::abs(peak.center - near) < tolerance;
}

const CuratedSpectrum* findCuratedSpectrum(const std::string& descriptor) {
    const auto& table = curatedTable();
    auto it = table.find(descriptor);
    return it != table.end() ? &it->second : nullptr;
}

std::vector<std::string> curatedDescriptors() {
    std::vector<std::string> names;
    for (const auto& entry : curatedTable()) {
        names.push_back(entry.first);
    }
    return names;
}

void applyCuratedIR(const CuratedSpectrum& curated, std::vector<CharacteristicPeak>& peaks, RandomSource& rng) {
    peaks.erase(std::remove_if(peaks.begin(), peaks.end(),
                    [&curated](const CharacteristicPeak& peak) {
                        return std::any_of(curated.irRemovals.begin(), curated.irRemovals.end(),
                                           [&peak](const PeakRemovalRule& rule) { return rule.matches(peak); });
                    }),
                peaks.end());

    for (const auto& tpl : curated.irPeaks) {
        double center = rng.around(tpl.center, tpl.centerJitter);
        double target = rng.jitter(tpl.target, tpl.targetSpan);
        double width = rng.jitter(tpl.width, tpl.widthSpan);
        peaks.push_back({center, target, width, tpl.label});
    }
}

std::vector<LabeledPeak> simplifyCuratedLabels(const CuratedSpectrum& curated, const std::vector<LabeledPeak>& peaks) {
    std::vector<LabeledPeak> simplified;
    std::unordered_set<std::string> seen;
    for (const auto& peak : peaks) {
        LabeledPeak renamed = peak;
        for (const auto& rule : curated.irLabelSimplifications) {
            if (peak.label.find(rule.first) != std::string::npos) {
                renamed.label = rule.second;
                break;
            }
        }
        if (seen.insert(renamed.label).second) {
            simplified.push_back(renamed);
        }
    }
    std::stable_sort(simplified.begin(), simplified.end(),
                     [](const LabeledPeak& a, const LabeledPeak& b) { return a.x < b.x; });
    return simplified;
}

std::vector<NMRPeak> curatedNMRPeaks(const CuratedSpectrum& curated, Nucleus nucleus, RandomSource& rng) {
    const auto& templates = (nucleus == Nucleus::H1) ? curated.protonPeaks : curated.carbonPeaks;
    std::vector<NMRPeak> peaks;
    peaks.reserve(templates.size());
    for (const auto& tpl : templates) {
        NMRPeak peak;
        peak.shift = rng.around(tpl.shift, tpl.shiftJitter);
        peak.intensity = tpl.intensity;
        peak.multiplicity = tpl.multiplicity;
        peak.label = tpl.label;
        peak.atomIds = tpl.atomIds;
        peaks.push_back(peak);
    }
    return peaks;
}

} // namespace spectra
} // namespace specfact
