#pragma once

#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace memeseed::vibe
{
struct LexiconEntry
{
    std::string_view word; // lowercase
    float valence = 0.0f;  // roughly [-4, 4]
};

// Compact built-in valence lexicon (VADER scale). Always available, so scoring never depends on
// an asset file being present.
std::span<const LexiconEntry> BuiltinLexicon();

// Booster / dampener words ("very", "barely", ...) and their signed increment.
const std::unordered_map<std::string_view, float>& BoosterWords();

// Negation words ("not", "never", ...). Tokens containing "n't" are also treated as negations.
std::span<const std::string_view> NegationWords();

// Parses a VADER-format lexicon file (`token<TAB>mean[<TAB>...]` per line) into `out`,
// adding or overriding entries. Lines that don't parse are skipped.
// Returns false (and sets err) only when the file cannot be read or yields no entries.
bool LoadLexiconFile(const std::string& path,
                     std::unordered_map<std::string, float>& out,
                     std::string& err);
} // namespace memeseed::vibe
