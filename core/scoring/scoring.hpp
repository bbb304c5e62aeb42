#pragma once

#include "item/item.hpp"
#include "tree/decision_node.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace kchoice {

// ─── Behavioural Parameters ────────────────────────────────────

struct ScoringParams {
    double alpha = 0.5;  // search breadth / global optimisation
    double beta  = 0.5;  // density preference
    double gamma = 0.5;  // complexity aversion (preference for heavy items)
    double delta = 0.5;  // rationality; 0 = random, infinity = optimal

    /// Bitwise equality: these values key the distribution cache.
    bool operator==(const ScoringParams& other) const;
    bool operator!=(const ScoringParams& other) const { return !(*this == other); }

    struct Hash {
        size_t operator()(const ScoringParams& p) const noexcept;
    };
};

// ─── Candidate Context ─────────────────────────────────────────
// Everything a scoring function may look at. Only the current node's
// state is exposed, never the path that led to it, which keeps the
// model Markovian and makes node sharing sound.

struct CandidateContext {
    const std::vector<Item>* items = nullptr;
    const DecisionNode* node = nullptr;
    const Item* item = nullptr;     // nullptr = the stop branch
    double candidate_gain = 0.0;    // best value reachable by taking this candidate
    double node_gain = 0.0;         // best value reachable from the node

    bool isStop() const { return item == nullptr; }
};

// ─── Scoring Function ──────────────────────────────────────────
// Maps a candidate to a non-negative attractiveness weight. The engine
// normalises weights across the node's candidates.
//
// Contract:
// - weight is 0 only for candidates the engine never offers;
// - delta -> 0 tends to uniform weights, delta -> infinity puts all
//   weight on candidates with the highest reachable value;
// - weight depends only on the candidate and the node state.

class ScoringFunction {
public:
    virtual ~ScoringFunction() = default;

    virtual std::string name() const = 0;

    /// Throws InvalidParameterError if `params` is outside the domain.
    virtual void validate(const ScoringParams& params) const = 0;

    virtual double score(const CandidateContext& ctx,
                         const ScoringParams& params) const = 0;
};

/// Every candidate is equally attractive.
class UniformScoring : public ScoringFunction {
public:
    std::string name() const override { return "uniform"; }
    void validate(const ScoringParams&) const override {}
    double score(const CandidateContext&, const ScoringParams&) const override { return 1.0; }
};

/// The scoring function used when none is supplied.
std::shared_ptr<ScoringFunction> makeDefaultScoring();

} // namespace kchoice
