#include "vibe/template_selector.h"

#include <cctype>
#include <string_view>

namespace memeseed::vibe
{
namespace
{
// Placeholders: {MOOD} {K1} {K2} {K3} {EV} (event, else topic) {TOPIC}
struct RawTemplate
{
    const char* headline;
    const char* subline;
};

static const RawTemplate kCommon[] = {
    {"LIVE REACTION CHECK", "{MOOD}: {K1} \xE2\x80\xA2 {K2} \xE2\x80\xA2 {K3}"},
    {"EVERYONE RN", "{K1} JUST HIT \xE2\x80\xA2 {MOOD} MODE ACTIVATED"},
    {"POV:", "YOU HEAR '{K1}' AND SUDDENLY IT'S {MOOD}"},
    {"THE GROUP CHAT:", "{K1} {K2} {K3} (VOLUME: MAX)"},
    {"THIS IS FINE", "({MOOD}) {K1} {K2} {K3}"},
};

static const RawTemplate kHype[] = {
    {"WE ARE SO BACK", "{EV} GOT ME LIKE {K1}"},
    {"ENERGY LEVEL:", "{K1} \xE2\x80\xA2 {K2} \xE2\x80\xA2 {K3}"},
    {"I'M UP", "AND IT'S BECAUSE OF {K1}"},
    {"SAY IT WITH ME", "{K1} = {MOOD}"},
};

static const RawTemplate kSalty[] = {
    {"WHO WROTE THIS SCRIPT", "{K1} AGAIN?? I'M {MOOD}"},
    {"I CAN'T BELIEVE", "{EV} DID THAT \xE2\x80\xA2 {K1}"},
    {"ME TRYING TO BE CHILL", "BUT {K1} HAS OTHER PLANS"},
    {"THE VIBES ARE OFF", "{K1} \xE2\x80\xA2 {K2} \xE2\x80\xA2 {MOOD}"},
};

static const RawTemplate kNeutral[] = {
    {"CURRENT STATUS:", "{K1} \xE2\x80\xA2 {K2} \xE2\x80\xA2 {K3}"},
    {"OBSERVING", "{TOPIC} LIKE: {K1}"},
    {"NO THOUGHTS", "JUST {K1}"},
    {"REAL-TIME MOODBOARD", "{K1} \xE2\x80\xA2 {K2} \xE2\x80\xA2 {K3}"},
};

template <size_t N>
static constexpr size_t CountOf(const RawTemplate (&)[N])
{
    return N;
}

static const RawTemplate* MoodCatalog(MoodState mood, size_t& count)
{
    switch (mood)
    {
        case MoodState::Positive: count = CountOf(kHype); return kHype;
        case MoodState::Negative: count = CountOf(kSalty); return kSalty;
        case MoodState::Neutral: break;
    }
    count = CountOf(kNeutral);
    return kNeutral;
}

static std::string ToUpperAscii(std::string s)
{
    for (char& c : s)
        c = (char)std::toupper((unsigned char)c);
    return s;
}

static std::string TrimAscii(const std::string& s)
{
    size_t b = 0;
    while (b < s.size() && std::isspace((unsigned char)s[b]))
        ++b;
    size_t e = s.size();
    while (e > b && std::isspace((unsigned char)s[e - 1]))
        --e;
    return s.substr(b, e - b);
}

struct Slots
{
    std::string mood;
    std::string k1, k2, k3;
    std::string ev;
    std::string topic;
};

static std::string Substitute(const char* pattern, const Slots& s)
{
    std::string out;
    const std::string_view p(pattern);
    size_t i = 0;
    while (i < p.size())
    {
        if (p[i] == '{')
        {
            const size_t close = p.find('}', i);
            if (close != std::string_view::npos)
            {
                const std::string_view name = p.substr(i + 1, close - i - 1);
                const std::string* value = nullptr;
                if (name == "MOOD") value = &s.mood;
                else if (name == "K1") value = &s.k1;
                else if (name == "K2") value = &s.k2;
                else if (name == "K3") value = &s.k3;
                else if (name == "EV") value = &s.ev;
                else if (name == "TOPIC") value = &s.topic;
                if (value)
                {
                    out += *value;
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(p[i]);
        ++i;
    }
    return out;
}

static Slots BuildSlots(const TemplateInputs& in)
{
    auto keyword_at = [&](size_t idx) -> std::string {
        for (size_t i = 0, seen = 0; i < in.keywords.size(); ++i)
        {
            if (in.keywords[i].empty())
                continue;
            if (seen++ == idx)
                return in.keywords[i];
        }
        return {};
    };

    Slots s;
    s.mood = std::string(MoodWord(in.mood));

    std::string topic = ToUpperAscii(TrimAscii(in.topic));
    if (topic.empty())
        topic = "THE GAME";
    s.topic = topic;

    std::string k1 = keyword_at(0);
    std::string k2 = keyword_at(1);
    std::string k3 = keyword_at(2);
    s.k1 = k1.empty() ? topic : ToUpperAscii(k1);
    s.k2 = k2.empty() ? "VIBES" : ToUpperAscii(k2);
    s.k3 = k3.empty() ? "CHAOS" : ToUpperAscii(k3);

    const std::string ev = in.event ? ToUpperAscii(TrimAscii(*in.event)) : std::string();
    s.ev = ev.empty() ? topic : ev;
    return s;
}
} // namespace

std::size_t TemplatePoolSize(MoodState mood)
{
    size_t n = 0;
    (void)MoodCatalog(mood, n);
    return CountOf(kCommon) + n;
}

CaptionTemplate SelectTemplate(const TemplateInputs& in, IRandomSource& rng)
{
    size_t mood_count = 0;
    const RawTemplate* mood_catalog = MoodCatalog(in.mood, mood_count);
    const size_t common_count = CountOf(kCommon);

    const size_t pick = rng.NextIndex(common_count + mood_count);
    const RawTemplate& raw = pick < common_count ? kCommon[pick] : mood_catalog[pick - common_count];

    const Slots slots = BuildSlots(in);
    CaptionTemplate out;
    out.headline = Substitute(raw.headline, slots);
    out.subline = Substitute(raw.subline, slots);

    if (rng.NextUnit() < kOfferTagChance)
        out.subline += " \xE2\x80\xA2 " + ToUpperAscii(in.offer);
    if (rng.NextUnit() < kBusinessTagChance)
        out.headline = ToUpperAscii(out.headline + " @ " + in.business);
    return out;
}
} // namespace memeseed::vibe
