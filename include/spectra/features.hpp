#pragma once

#include <string>
#include <vector>
#include <utility>

namespace specfact {
namespace spectra {

// Functional groups flagged for one descriptor. Built once per synthesis call.
struct FeatureFlags {
    bool hasOH = false;             // Alcohol/Phenol O-H
    bool hasCOOH = false;           // Carboxylic acid
    bool hasNH = false;             // Amine N-H (primary/secondary)
    bool hasAmideNH = false;        // Amide N-H
    bool hasCarbonyl = false;       // Any C=O
    bool hasKetoneAldehyde = false; // C=O not part of ester/amide/acid
    bool hasEster = false;          // C(=O)O
    bool hasAmide = false;          // C(=O)N
    bool hasEther = false;          // C-O-C
    bool hasAlkene = false;         // C=C
    bool hasAlkyne = false;         // C#C
    bool hasAromatic = false;       // Aromatic ring
    bool hasSp3CH = false;          // Aliphatic C-H
    bool hasSp2CH = false;          // Alkene/aromatic C-H

    bool any() const;
    // (name, value) pairs in declaration order, for logging and export.
    std::vector<std::pair<std::string, bool>> toList() const;
};

class IFeatureDetector {
public:
    virtual ~IFeatureDetector() = default;
    virtual std::string getName() const = 0;
    virtual FeatureFlags detect(const std::string& descriptor) const = 0;
};

// Substring and regular expression heuristics over an unparsed SMILES string.
// The patterns are approximate on purpose and are kept stable so that a given
// input always flags the same groups, quirks included: the carbonyl oxygen of
// a ketone also satisfies the hydroxyl pattern, and the ether pattern matches
// the alkoxy side of an ester.
class SmilesPatternDetector : public IFeatureDetector {
public:
    std::string getName() const override { return "smiles_patterns"; }
    FeatureFlags detect(const std::string& descriptor) const override;

    static bool hasAldehydeMotif(const std::string& descriptor);
    static bool hasNitrileMotif(const std::string& descriptor);
    static bool hasSubstitutedNitrogen(const std::string& descriptor);
};

} // namespace spectra
} // namespace specfact
