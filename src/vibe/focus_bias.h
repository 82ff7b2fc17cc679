#pragma once

#include "core/post.h"
#include "core/random_source.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace memeseed::vibe
{
// A label used to steer keyword and image selection. `alias` is the short display form
// (empty when the term is displayed as-is).
struct FocusTerm
{
    std::string label;
    std::string alias;

    const std::string& Display() const { return alias.empty() ? label : alias; }
};

// Maps long labels to short display aliases. Lookup is a case-insensitive substring match on
// the registered key, first registration wins.
class FocusAliasRegistry
{
public:
    // Registry preloaded with the two team anchors.
    static FocusAliasRegistry Defaults();

    void Register(std::string key, std::string alias);

    // Short alias for `label`, or empty when none applies.
    std::string AliasFor(std::string_view label) const;

    FocusTerm Resolve(std::string_view label) const;

private:
    struct Entry
    {
        std::string key_lower;
        std::string alias;
    };
    std::vector<Entry> m_entries;
};

struct FocusPools
{
    // One term is drawn from each pool, in order.
    std::vector<std::vector<std::string>> pools;
    // Always appended after the drawn terms.
    std::vector<std::string> anchors;
};

// Performer pool, one player pool per team, plus the two team anchors.
const FocusPools& DefaultFocusPools();

// Draws one term per non-empty pool, appends the anchors, dedupes case-insensitively
// (first occurrence kept).
std::vector<std::string> PickFocusTerms(const FocusPools& pools, IRandomSource& rng);

// Prepends the display form of each focus term to `keywords`, dedupes case-insensitively
// keeping focus-first order, and truncates to `top_k`.
std::vector<std::string> BiasKeywords(const std::vector<std::string>& keywords,
                                      const std::vector<std::string>& focus_terms,
                                      std::size_t top_k,
                                      const FocusAliasRegistry& aliases = FocusAliasRegistry::Defaults());

// Case-insensitive substring match of any focus term over title + "\n" + body.
// Short terms can over-match (e.g. inside longer words); callers choose terms accordingly.
bool MatchesFocus(const Post& post, const std::vector<std::string>& focus_terms);

// Candidates mentioning a focus term. Returns `candidates` unchanged when none match or
// `focus_terms` is empty.
std::vector<const Post*> FilterByFocus(const std::vector<const Post*>& candidates,
                                       const std::vector<std::string>& focus_terms);
} // namespace memeseed::vibe
