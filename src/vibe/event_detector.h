#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace memeseed::vibe
{
// Coarse "moment" tag for a post, first match wins:
//   touchdown -> TOUCHDOWN, fumble -> FUMBLE, interception -> INTERCEPTION,
//   halftime -> HALFTIME, commercial | ad -> COMMERCIAL
// Matching is whole-word and case-insensitive. Returns nullopt when nothing matches.
std::optional<std::string> DetectEvent(std::string_view text);
} // namespace memeseed::vibe
