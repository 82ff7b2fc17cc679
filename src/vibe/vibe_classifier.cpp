#include "vibe/vibe_classifier.h"

#include "vibe/event_detector.h"
#include "vibe/sentiment_lexicon.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace memeseed::vibe
{
namespace
{
constexpr float kCapsIncrement = 0.733f;
constexpr float kNegationScalar = -0.74f;
constexpr float kNormalizeAlpha = 15.0f;

static std::string ToLowerAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::tolower((unsigned char)c);
    return s;
}

static bool IsPunct(char c)
{
    return std::ispunct((unsigned char)c) != 0;
}

// Whitespace split, then strip leading/trailing punctuation. Single-letter leftovers are dropped
// (articles and stray initials carry no valence).
static std::vector<std::string> Tokenize(std::string_view text)
{
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size())
    {
        while (i < text.size() && std::isspace((unsigned char)text[i]))
            ++i;
        size_t j = i;
        while (j < text.size() && !std::isspace((unsigned char)text[j]))
            ++j;
        if (j > i)
        {
            size_t b = i;
            size_t e = j;
            while (b < e && IsPunct(text[b]))
                ++b;
            while (e > b && IsPunct(text[e - 1]))
                --e;
            if (e - b >= 2)
                out.emplace_back(text.substr(b, e - b));
        }
        i = j;
    }
    return out;
}

static bool IsAllCaps(const std::string& w)
{
    bool any_alpha = false;
    for (char c : w)
    {
        if (std::isalpha((unsigned char)c))
        {
            any_alpha = true;
            if (!std::isupper((unsigned char)c))
                return false;
        }
    }
    return any_alpha;
}

// True when some, but not all, words are ALL-CAPS.
static bool AllCapDifferential(const std::vector<std::string>& words)
{
    size_t caps = 0;
    for (const auto& w : words)
        if (IsAllCaps(w))
            ++caps;
    return caps > 0 && caps < words.size();
}

static bool IsNegated(const std::string& lower_word)
{
    for (std::string_view n : NegationWords())
        if (lower_word == n)
            return true;
    return lower_word.find("n't") != std::string::npos;
}

static float ScalarIncDec(const std::string& word, const std::string& lower_word, float valence, bool cap_diff)
{
    const auto& boosters = BoosterWords();
    auto it = boosters.find(lower_word);
    if (it == boosters.end())
        return 0.0f;

    float scalar = it->second;
    if (valence < 0.0f)
        scalar = -scalar;
    if (IsAllCaps(word) && cap_diff)
        scalar += (valence > 0.0f) ? kCapsIncrement : -kCapsIncrement;
    return scalar;
}

static bool IsSoOrThis(const std::string& w)
{
    return w == "so" || w == "this";
}

static float NegationCheck(float valence, const std::vector<std::string>& lower, size_t start_i, size_t i)
{
    if (start_i == 0)
    {
        if (IsNegated(lower[i - 1]))
            valence *= kNegationScalar;
    }
    else if (start_i == 1)
    {
        // "without doubt" keeps its sign.
        const bool without_doubt = lower[i - 2] == "without" && lower[i - 1] == "doubt";
        if (lower[i - 2] == "never" && IsSoOrThis(lower[i - 1]))
            valence *= 1.25f;
        else if (!without_doubt && IsNegated(lower[i - 2]))
            valence *= kNegationScalar;
    }
    else if (start_i == 2)
    {
        const bool without_doubt = lower[i - 3] == "without" && (lower[i - 2] == "doubt" || lower[i - 1] == "doubt");
        if (lower[i - 3] == "never" && (IsSoOrThis(lower[i - 2]) || IsSoOrThis(lower[i - 1])))
            valence *= 1.25f;
        else if (!without_doubt && IsNegated(lower[i - 3]))
            valence *= kNegationScalar;
    }
    return valence;
}

static float LeastCheck(float valence, const std::vector<std::string>& lower, size_t i)
{
    if (i > 1 && lower[i - 1] == "least" && lower[i - 2] != "at" && lower[i - 2] != "very")
        return valence * kNegationScalar;
    if (i == 1 && lower[0] == "least")
        return valence * kNegationScalar;
    return valence;
}

static float PunctuationEmphasis(std::string_view text)
{
    const auto bangs = std::count(text.begin(), text.end(), '!');
    const float ep = (float)std::min<std::ptrdiff_t>(bangs, 4) * 0.292f;

    const auto qms = std::count(text.begin(), text.end(), '?');
    float qm = 0.0f;
    if (qms > 1)
        qm = (qms <= 3) ? (float)qms * 0.18f : 0.96f;
    return ep + qm;
}
} // namespace

LexiconScorer::LexiconScorer()
{
    const auto builtin = BuiltinLexicon();
    m_lexicon.reserve(builtin.size());
    for (const auto& e : builtin)
        m_lexicon.emplace(std::string(e.word), e.valence);
}

bool LexiconScorer::LoadLexiconFile(const std::string& path, std::string& err)
{
    return vibe::LoadLexiconFile(path, m_lexicon, err);
}

const float* LexiconScorer::Lookup(const std::string& lower_word) const
{
    auto it = m_lexicon.find(lower_word);
    return it == m_lexicon.end() ? nullptr : &it->second;
}

float LexiconScorer::SentimentValence(const std::vector<std::string>& words,
                                      const std::vector<std::string>& lower,
                                      size_t i,
                                      bool cap_diff) const
{
    const std::string& lw = lower[i];
    if (BoosterWords().count(lw) != 0)
        return 0.0f;
    if (lw == "kind" && i + 1 < lower.size() && lower[i + 1] == "of")
        return 0.0f;

    const float* base = Lookup(lw);
    if (!base)
        return 0.0f;

    float valence = *base;
    if (IsAllCaps(words[i]) && cap_diff)
        valence += (valence > 0.0f) ? kCapsIncrement : -kCapsIncrement;

    for (size_t start_i = 0; start_i < 3; ++start_i)
    {
        if (i <= start_i)
            break;
        const size_t prev = i - (start_i + 1);
        if (Lookup(lower[prev]))
            continue;

        float s = ScalarIncDec(words[prev], lower[prev], valence, cap_diff);
        if (start_i == 1)
            s *= 0.95f;
        else if (start_i == 2)
            s *= 0.9f;
        valence += s;
        valence = NegationCheck(valence, lower, start_i, i);
    }

    return LeastCheck(valence, lower, i);
}

float LexiconScorer::Score(std::string_view text) const
{
    const std::vector<std::string> words = Tokenize(text);
    if (words.empty())
        return 0.0f;

    std::vector<std::string> lower;
    lower.reserve(words.size());
    for (const auto& w : words)
        lower.push_back(ToLowerAscii(w));

    const bool cap_diff = AllCapDifferential(words);

    std::vector<float> sentiments;
    sentiments.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i)
        sentiments.push_back(SentimentValence(words, lower, i, cap_diff));

    // "but" shifts the weight to the clause after it.
    auto but_it = std::find(lower.begin(), lower.end(), "but");
    if (but_it != lower.end())
    {
        const size_t but_i = (size_t)(but_it - lower.begin());
        for (size_t i = 0; i < sentiments.size(); ++i)
        {
            if (i < but_i)
                sentiments[i] *= 0.5f;
            else if (i > but_i)
                sentiments[i] *= 1.5f;
        }
    }

    float sum = 0.0f;
    for (float s : sentiments)
        sum += s;
    if (sum == 0.0f)
        return 0.0f;

    const float punct = PunctuationEmphasis(text);
    sum += (sum > 0.0f) ? punct : -punct;

    const float compound = sum / std::sqrt(sum * sum + kNormalizeAlpha);
    return std::clamp(compound, -1.0f, 1.0f);
}

float MeanPolarity(const std::vector<Post>& posts)
{
    if (posts.empty())
        return 0.0f;
    double sum = 0.0;
    for (const auto& p : posts)
        sum += (double)p.polarity;
    return (float)(sum / (double)posts.size());
}

MoodState ClassifyMood(float mean_polarity, const MoodThresholds& thresholds)
{
    if (mean_polarity > thresholds.positive_above)
        return MoodState::Positive;
    if (mean_polarity < thresholds.negative_below)
        return MoodState::Negative;
    return MoodState::Neutral;
}

void ClassifyPosts(std::vector<Post>& posts, const ISentimentScorer& scorer)
{
    for (auto& p : posts)
    {
        const std::string text = PostText(p);
        p.polarity = std::clamp(scorer.Score(text), -1.0f, 1.0f);
        p.event = DetectEvent(text);
    }
}

MoodState ClassifyTexts(const std::vector<std::string>& texts,
                        const ISentimentScorer& scorer,
                        const MoodThresholds& thresholds)
{
    if (texts.empty())
        return ClassifyMood(0.0f, thresholds);
    double sum = 0.0;
    for (const auto& t : texts)
        sum += (double)scorer.Score(t);
    return ClassifyMood((float)(sum / (double)texts.size()), thresholds);
}
} // namespace memeseed::vibe
