#pragma once

#include "core/post.h"
#include "core/random_source.h"

#include <optional>
#include <string>
#include <vector>

namespace memeseed::vibe
{
struct TemplateInputs
{
    MoodState mood = MoodState::Neutral;
    std::vector<std::string> keywords; // k1..k3 are taken from the front
    std::optional<std::string> event;
    std::string topic;
    std::string business;
    std::string offer;
};

struct CaptionTemplate
{
    std::string headline;
    std::string subline;
};

// Embellishment probabilities: offer appended to the subline, business appended to the headline.
constexpr double kOfferTagChance = 0.25;
constexpr double kBusinessTagChance = 0.10;

// Number of templates a draw chooses from for `mood` (shared catalog + mood catalog).
std::size_t TemplatePoolSize(MoodState mood);

// Picks one (headline, subline) uniformly from the shared + mood catalog, substitutes the
// placeholders, then rolls the two embellishments. Consumes exactly three draws from `rng`:
// NextIndex(pool size), NextUnit() for the offer tag, NextUnit() for the business tag.
CaptionTemplate SelectTemplate(const TemplateInputs& in, IRandomSource& rng);
} // namespace memeseed::vibe
