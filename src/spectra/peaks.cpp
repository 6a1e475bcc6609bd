#include "spectra/peaks.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace specfact {
namespace spectra {

namespace {

struct TrackedMinimum {
    std::string label;
    double x;
    double y;
};

bool byAxis(const LabeledPeak& a, const LabeledPeak& b) { return a.x < b.x; }

} // namespace

std::vector<LabeledPeak> extractIRPeaks(const Curve& curve, const std::vector<CharacteristicPeak>& specs,
                                        const AxisWindow& window) {
    // Bands with the same label and the same rounded center share one slot.
    std::vector<TrackedMinimum> minima;
    std::unordered_map<std::string, size_t> slotByKey;

    for (const auto& point : curve) {
        for (const auto& spec : specs) {
            const double checkWindow = std::max(5.0, spec.width / 3.0);
            if (std::abs(point.x - spec.center) >= checkWindow) continue;

            std::string key = spec.label + "_" + std::to_string(std::llround(spec.center));
            auto it = slotByKey.find(key);
            if (it == slotByKey.end()) {
                slotByKey.emplace(key, minima.size());
                minima.push_back({spec.label, point.x, point.y});
            } else if (point.y < minima[it->second].y) {
                minima[it->second].x = point.x;
                minima[it->second].y = point.y;
            }
        }
    }

    const double threshold = window.baseline - window.noiseAmplitude * 2.5;
    std::vector<LabeledPeak> labeled;
    for (const auto& minimum : minima) {
        if (minimum.y >= threshold) continue;
        bool alreadyExists = std::any_of(labeled.begin(), labeled.end(), [&minimum](const LabeledPeak& lp) {
            return std::abs(lp.x - minimum.x) < kIRDuplicateDistance && lp.label == minimum.label;
        });
        if (!alreadyExists) {
            labeled.push_back({minimum.x, minimum.y, minimum.label});
        }
    }
    std::stable_sort(labeled.begin(), labeled.end(), byAxis);
    return labeled;
}

std::vector<LabeledPeak> extractUVPeaks(const Curve& curve, const std::vector<CharacteristicPeak>& specs,
                                        const AxisWindow& window) {
    std::vector<LabeledPeak> identified;
    if (curve.size() < 3) return identified;

    const double threshold = window.baseline + window.noiseAmplitude * 3.0;
    for (size_t i = 1; i + 1 < curve.size(); ++i) {
        const SpectrumPoint& prev = curve[i - 1];
        const SpectrumPoint& curr = curve[i];
        const SpectrumPoint& next = curve[i + 1];
        if (!(curr.y > prev.y && curr.y > next.y && curr.y > threshold)) continue;

        std::string label = kGenericTransitionLabel;
        double minDist = std::numeric_limits<double>::infinity();
        for (const auto& spec : specs) {
            double dist = std::abs(curr.x - spec.center);
            if (dist < minDist && dist < spec.width * 2.0) {
                minDist = dist;
                label = spec.label;
            }
        }

        bool alreadyAdded = std::any_of(identified.begin(), identified.end(), [&curr](const LabeledPeak& p) {
            return std::abs(p.x - curr.x) < kUVDuplicateDistance;
        });
        if (!alreadyAdded) {
            identified.push_back({curr.x, curr.y, label});
        }
    }
    std::stable_sort(identified.begin(), identified.end(), byAxis);
    return identified;
}

} // namespace spectra
} // namespace specfact
