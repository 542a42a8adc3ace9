#pragma once

#include <string>

/**
 * @brief Discrete classification outcome, ordered from weakest to strongest
 *
 * Declaration order is significant: comparisons between verdicts follow it.
 */
enum class Verdict
{
    UNLIKELY,
    POSSIBLE,
    LIKELY,
    CONFIRMED
};

// Which scoring path a file takes
enum class MediaKind
{
    GENERIC, // kind-agnostic base rules only
    PHOTO,
    VIDEO
};

class Verdicts
{
public:
    static constexpr int CONFIRMED_THRESHOLD = 70;
    static constexpr int LIKELY_THRESHOLD = 40;
    static constexpr int POSSIBLE_THRESHOLD = 20;

    /**
     * @brief Map a final confidence score onto a verdict
     * @param score Accumulated confidence score
     * @return Verdict for the score
     */
    static Verdict fromScore(int score)
    {
        if (score >= CONFIRMED_THRESHOLD)
            return Verdict::CONFIRMED;
        if (score >= LIKELY_THRESHOLD)
            return Verdict::LIKELY;
        if (score >= POSSIBLE_THRESHOLD)
            return Verdict::POSSIBLE;
        return Verdict::UNLIKELY;
    }

    /**
     * @brief Whether a verdict counts as a positive classification
     */
    static bool isMatch(Verdict verdict)
    {
        return verdict == Verdict::CONFIRMED || verdict == Verdict::LIKELY;
    }

    static std::string getName(Verdict verdict)
    {
        switch (verdict)
        {
        case Verdict::UNLIKELY:
            return "UNLIKELY";
        case Verdict::POSSIBLE:
            return "POSSIBLE";
        case Verdict::LIKELY:
            return "LIKELY";
        case Verdict::CONFIRMED:
            return "CONFIRMED";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Name of the tier folder a verdict is organized into
     */
    static std::string getTierFolder(Verdict verdict)
    {
        switch (verdict)
        {
        case Verdict::CONFIRMED:
            return "confirmed";
        case Verdict::LIKELY:
            return "likely";
        case Verdict::POSSIBLE:
            return "possible";
        case Verdict::UNLIKELY:
        default:
            return "unlikely";
        }
    }

    static std::string getDescription(Verdict verdict)
    {
        switch (verdict)
        {
        case Verdict::CONFIRMED:
            return "High confidence TikTok content";
        case Verdict::LIKELY:
            return "Probably TikTok content";
        case Verdict::POSSIBLE:
            return "Some TikTok indicators present";
        case Verdict::UNLIKELY:
            return "Few or no TikTok indicators";
        default:
            return "Unknown";
        }
    }
};

class MediaKinds
{
public:
    static std::string getName(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::GENERIC:
            return "GENERIC";
        case MediaKind::PHOTO:
            return "PHOTO";
        case MediaKind::VIDEO:
            return "VIDEO";
        default:
            return "UNKNOWN";
        }
    }
};
