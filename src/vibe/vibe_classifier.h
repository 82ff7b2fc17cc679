#pragma once

#include "core/post.h"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace memeseed::vibe
{
// Polarity scorer contract: any text -> [-1, 1]. Empty or unscorable text -> 0.
class ISentimentScorer
{
public:
    virtual ~ISentimentScorer() = default;
    virtual float Score(std::string_view text) const = 0;
};

// Lexicon-and-rule scorer in the VADER family:
// - per-token valence from the lexicon
// - booster/dampener words within 3 tokens before a sentiment word
// - negation within 3 tokens before a sentiment word (x -0.74), "least" inversion
// - ALL-CAPS emphasis when the text mixes caps and lowercase
// - "but" contrast (before x0.5, after x1.5)
// - '!' / '?' punctuation emphasis
// - normalisation x / sqrt(x^2 + 15)
class LexiconScorer final : public ISentimentScorer
{
public:
    // Starts with the built-in lexicon.
    LexiconScorer();

    // Merges a VADER-format lexicon file on top of the current table.
    bool LoadLexiconFile(const std::string& path, std::string& err);

    float Score(std::string_view text) const override;

    size_t LexiconSize() const { return m_lexicon.size(); }

private:
    const float* Lookup(const std::string& lower_word) const;

    float SentimentValence(const std::vector<std::string>& words,
                           const std::vector<std::string>& lower,
                           size_t i,
                           bool cap_diff) const;

    std::unordered_map<std::string, float> m_lexicon;
};

// Mood thresholds on the batch mean. Exclusive: mean must be strictly above `positive_above`
// to be POSITIVE and strictly below `negative_below` to be NEGATIVE.
struct MoodThresholds
{
    float positive_above = 0.2f;
    float negative_below = -0.2f;
};

// Arithmetic mean of post polarities; 0 for an empty batch.
float MeanPolarity(const std::vector<Post>& posts);

MoodState ClassifyMood(float mean_polarity, const MoodThresholds& thresholds = {});

// Scores every post (title + body) and fills `polarity` and `event`.
void ClassifyPosts(std::vector<Post>& posts, const ISentimentScorer& scorer);

// Scores raw texts and classifies their mean.
MoodState ClassifyTexts(const std::vector<std::string>& texts,
                        const ISentimentScorer& scorer,
                        const MoodThresholds& thresholds = {});
} // namespace memeseed::vibe
