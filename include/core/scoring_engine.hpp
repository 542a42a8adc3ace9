#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/detection_profile.hpp"
#include "core/evidence.hpp"

/**
 * @brief One contribution produced by a rule
 */
struct RuleMatch
{
    std::string evidence;
    std::string indicator_key; // empty when the rule records no indicator
    std::string indicator_value;
    std::optional<int> weight; // overrides the rule weight when set
};

/**
 * @brief A scoring rule: a weight plus a condition that yields zero or more matches
 */
struct ScoringRule
{
    std::string name;
    int weight;
    std::function<std::vector<RuleMatch>(const EvidenceBundle &)> evaluate;
};

/**
 * @brief Converts an EvidenceBundle into a confidence score and verdict
 *
 * Pure: the same bundle and kind always produce the same result. Rules are
 * evaluated in table order, base rules first, then the rules for the media kind.
 */
class ScoringEngine
{
public:
    explicit ScoringEngine(const DetectionProfile &profile);

    /**
     * @brief Score a bundle
     * @param evidence Evidence gathered for the file
     * @param kind Scoring path; GENERIC applies only the base rules
     * @return Score, evidence trail, indicators and verdict
     */
    ScoreResult score(const EvidenceBundle &evidence, MediaKind kind) const;

    const std::vector<ScoringRule> &baseRules() const { return base_rules_; }
    const std::vector<ScoringRule> &photoRules() const { return photo_rules_; }
    const std::vector<ScoringRule> &videoRules() const { return video_rules_; }

    /**
     * @brief 36-character name with a 32-digit hex stem and a single dot
     */
    static bool isHashFilename(const std::string &filename);

private:
    bool isCameraPhoto(const EvidenceBundle &evidence) const;
    static void applyRules(const std::vector<ScoringRule> &rules, const EvidenceBundle &evidence, ScoreResult &result);
    static void finalize(ScoreResult &result);

    std::vector<ScoringRule> buildBaseRules() const;
    std::vector<ScoringRule> buildPhotoRules() const;
    std::vector<ScoringRule> buildVideoRules() const;

    const DetectionProfile &profile_;
    std::vector<ScoringRule> base_rules_;
    std::vector<ScoringRule> photo_rules_;
    std::vector<ScoringRule> video_rules_;
};
