#include "spectra/features.hpp"
#include "utils.hpp"
#include <boost/regex.hpp>
#include <stdexcept>

namespace specfact {
namespace spectra {

namespace {

bool contains(const std::string& text, const char* pattern) {
    return text.find(pattern) != std::string::npos;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Perl syntax, for the negative look-aheads.
const boost::regex& hydroxylPattern() {
    static const boost::regex re(R"(O(?![(=]|\w?C(=O)|\w?O\w))", boost::regex::perl);
    return re;
}

const boost::regex& aminePattern() {
    static const boost::regex re(R"(N(?![(]?=|[#C]))", boost::regex::perl);
    return re;
}

const boost::regex& etherPattern() {
    static const boost::regex re(R"(C(?!=\S)O(?!=\S)C)", boost::regex::perl);
    return re;
}

const boost::regex& lowercasePattern() {
    static const boost::regex re(R"([a-z])", boost::regex::perl);
    return re;
}

const boost::regex& aliphaticCarbonPattern() {
    static const boost::regex re(R"(C(?![=a-z#]))", boost::regex::perl);
    return re;
}

// boost::regex_search throws std::runtime_error when a match exceeds its
// complexity bound; detection treats that as no match.
bool search(const std::string& text, const boost::regex& pattern) {
    try {
        return boost::regex_search(text, pattern);
    } catch (const std::runtime_error& e) {
        globalLogger.warning("Feature pattern gave up on a " + std::to_string(text.size()) +
                             "-character descriptor: " + e.what());
        return false;
    }
}

// "c1" ring opening closed by a later "c1".
bool hasAromaticRingClosure(const std::string& text) {
    const size_t open = text.find("c1");
    return open != std::string::npos && text.find("c1", open + 2) != std::string::npos;
}

} // namespace

bool FeatureFlags::any() const {
    for (const auto& entry : toList()) {
        if (entry.second) return true;
    }
    return false;
}

std::vector<std::pair<std::string, bool>> FeatureFlags::toList() const {
    return {
        {"OH", hasOH},
        {"COOH", hasCOOH},
        {"NH", hasNH},
        {"AmideNH", hasAmideNH},
        {"Carbonyl", hasCarbonyl},
        {"KetoneAldehyde", hasKetoneAldehyde},
        {"Ester", hasEster},
        {"Amide", hasAmide},
        {"Ether", hasEther},
        {"Alkene", hasAlkene},
        {"Alkyne", hasAlkyne},
        {"Aromatic", hasAromatic},
        {"Sp3CH", hasSp3CH},
        {"Sp2CH", hasSp2CH},
    };
}

bool SmilesPatternDetector::hasAldehydeMotif(const std::string& descriptor) {
    return contains(descriptor, "C(=O)H") || contains(descriptor, "C=O)H");
}

bool SmilesPatternDetector::hasNitrileMotif(const std::string& descriptor) {
    return contains(descriptor, "C#N");
}

bool SmilesPatternDetector::hasSubstitutedNitrogen(const std::string& descriptor) {
    return contains(descriptor, "N(");
}

FeatureFlags SmilesPatternDetector::detect(const std::string& smiles) const {
    FeatureFlags flags;
    if (smiles.empty()) {
        return flags;
    }

    flags.hasCarbonyl = contains(smiles, "C=O") || contains(smiles, "C(=O)");
    // Also true for acids; consumers check hasCOOH first where it matters.
    flags.hasEster = contains(smiles, "C(=O)O") || contains(smiles, "OC=O");
    flags.hasAmide = contains(smiles, "C(=O)N") || contains(smiles, "NC=O");
    flags.hasCOOH = contains(smiles, "C(=O)O") &&
                    (contains(smiles, "(=O)OH") || contains(smiles, "O=CO"));

    flags.hasOH = search(smiles, hydroxylPattern()) || endsWith(smiles, "OH");
    if (flags.hasCOOH) flags.hasOH = false;

    flags.hasNH = search(smiles, aminePattern());
    if (flags.hasAmide) {
        flags.hasAmideNH = flags.hasNH;
        flags.hasNH = false;
    }

    flags.hasKetoneAldehyde = flags.hasCarbonyl && !flags.hasEster && !flags.hasAmide && !flags.hasCOOH;
    flags.hasEther = search(smiles, etherPattern()) || contains(smiles, "cOc");
    flags.hasAlkene = contains(smiles, "C=C");
    flags.hasAlkyne = contains(smiles, "C#C");
    flags.hasAromatic = search(smiles, lowercasePattern()) ||
                        hasAromaticRingClosure(smiles) ||
                        contains(smiles, "C1=CC=CC=C1");

    flags.hasSp3CH = search(smiles, aliphaticCarbonPattern()) ||
                     contains(smiles, "CH") || contains(smiles, "C");
    flags.hasSp2CH = flags.hasAlkene || flags.hasAromatic;

    return flags;
}

} // namespace spectra
} // namespace specfact
