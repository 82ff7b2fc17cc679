#include "vibe/sentiment_lexicon.h"

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace memeseed::vibe
{
namespace
{
// Subset of the VADER valence table, biased towards words that show up in live sports / pop
// culture threads. Values are on VADER's [-4, 4] scale.
static const LexiconEntry kLexicon[] = {
    {"abandon", -1.9f},    {"absurd", -1.3f},      {"abuse", -3.2f},       {"accept", 1.6f},
    {"admire", 2.1f},      {"adorable", 2.2f},     {"afraid", -2.0f},      {"agony", -1.8f},
    {"agree", 1.5f},       {"alive", 1.6f},        {"amazing", 2.8f},      {"amazed", 2.2f},
    {"angry", -2.3f},      {"annoyed", -1.6f},     {"annoying", -1.8f},    {"anxious", -1.0f},
    {"applause", 1.8f},    {"appreciate", 1.7f},   {"ashamed", -2.1f},     {"awesome", 3.1f},
    {"awful", -2.0f},      {"awkward", -0.6f},     {"bad", -2.5f},         {"beautiful", 2.9f},
    {"best", 3.2f},        {"betray", -3.2f},      {"better", 1.9f},       {"bitter", -1.8f},
    {"blame", -1.4f},      {"bless", 1.8f},        {"blessed", 2.9f},      {"bored", -1.1f},
    {"boring", -1.3f},     {"brave", 2.4f},        {"brilliant", 2.8f},    {"broken", -2.1f},
    {"bummer", -1.6f},     {"calm", 1.3f},         {"celebrate", 2.7f},    {"celebration", 2.5f},
    {"champion", 2.9f},    {"champions", 2.4f},    {"chaos", -2.4f},       {"cheer", 2.3f},
    {"cheering", 2.3f},    {"choke", -2.0f},       {"choked", -2.1f},      {"clutch", 1.6f},
    {"confused", -1.3f},   {"cool", 1.3f},         {"crap", -1.6f},        {"crazy", -1.4f},
    {"cried", -1.6f},      {"cringe", -1.5f},      {"crushed", -1.8f},     {"cry", -2.1f},
    {"cute", 2.0f},        {"damn", -1.7f},        {"dead", -3.3f},        {"defeat", -2.0f},
    {"defeated", -2.1f},   {"delight", 2.9f},      {"delighted", 2.9f},    {"depressed", -2.3f},
    {"deserve", 1.2f},     {"destroy", -2.5f},     {"destroyed", -2.4f},   {"disappointed", -1.9f},
    {"disappointing", -2.2f}, {"disaster", -3.1f}, {"disgrace", -2.2f},    {"disgusting", -2.4f},
    {"dominant", 0.9f},    {"dominate", 0.9f},     {"doubt", -1.5f},       {"dumb", -2.3f},
    {"easy", 1.9f},        {"ecstatic", 2.3f},     {"elite", 1.9f},        {"embarrassing", -1.6f},
    {"energy", 1.1f},      {"enjoy", 2.2f},        {"enjoyed", 2.3f},      {"epic", 2.5f},
    {"excellent", 2.7f},   {"excited", 2.4f},      {"exciting", 2.2f},     {"fail", -2.5f},
    {"failed", -2.3f},     {"failure", -2.3f},     {"fair", 1.3f},         {"fake", -2.1f},
    {"fan", 1.3f},         {"fantastic", 2.6f},    {"fault", -1.7f},       {"fear", -2.2f},
    {"fine", 0.8f},        {"fire", -1.4f},        {"flop", -1.4f},        {"fool", -1.9f},
    {"fraud", -2.8f},      {"free", 2.3f},         {"fun", 2.3f},          {"funny", 1.9f},
    {"furious", -2.7f},    {"garbage", -2.0f},     {"glad", 2.0f},         {"glorious", 3.2f},
    {"goat", 1.5f},        {"good", 1.9f},         {"gorgeous", 3.0f},     {"great", 3.1f},
    {"greatest", 3.2f},    {"grief", -2.2f},       {"gross", -2.1f},       {"happy", 2.7f},
    {"hate", -2.7f},       {"hated", -3.2f},       {"heartbreaking", -2.6f}, {"hell", -3.6f},
    {"hero", 2.6f},        {"hilarious", 1.7f},    {"hope", 1.9f},         {"hopeless", -2.0f},
    {"horrible", -2.5f},   {"hurt", -2.4f},        {"hype", 1.8f},         {"hyped", 2.1f},
    {"idiot", -2.3f},      {"incredible", 3.3f},   {"injured", -1.7f},     {"injury", -1.8f},
    {"insane", -1.7f},     {"inspiring", 2.8f},    {"joke", 1.2f},         {"joy", 2.8f},
    {"kill", -3.7f},       {"killed", -3.5f},      {"laugh", 2.6f},        {"laughing", 2.2f},
    {"legend", 2.1f},      {"legendary", 2.5f},    {"like", 1.5f},         {"lit", 1.8f},
    {"lol", 1.8f},         {"lose", -1.6f},        {"loser", -2.4f},       {"losing", -1.6f},
    {"loss", -1.3f},       {"lost", -1.3f},        {"love", 3.2f},         {"loved", 2.9f},
    {"lovely", 2.8f},      {"loving", 2.9f},       {"lucky", 1.8f},        {"mad", -2.2f},
    {"magic", 2.0f},       {"masterpiece", 3.1f},  {"mess", -1.5f},        {"miss", -0.6f},
    {"missed", -1.2f},     {"mistake", -1.8f},     {"nice", 1.8f},         {"nightmare", -2.8f},
    {"offensive", -2.2f},  {"omg", 0.8f},          {"outrage", -2.5f},     {"pain", -2.3f},
    {"pathetic", -2.6f},   {"peace", 2.5f},        {"penalty", -1.0f},     {"perfect", 2.7f},
    {"pissed", -3.2f},     {"pity", -1.2f},        {"pleased", 1.9f},      {"poor", -2.1f},
    {"pretty", 2.2f},      {"pride", 1.4f},        {"proud", 2.1f},        {"rage", -2.6f},
    {"ridiculous", -1.5f}, {"rigged", -1.8f},      {"robbed", -2.1f},      {"ruin", -2.8f},
    {"ruined", -2.4f},     {"sad", -2.1f},         {"scared", -1.9f},      {"shame", -2.1f},
    {"shit", -2.6f},       {"shock", -1.6f},       {"shocked", -1.3f},     {"sick", -2.3f},
    {"smart", 1.7f},       {"smile", 1.5f},        {"sorry", -0.3f},       {"special", 1.7f},
    {"spectacular", 2.6f}, {"strong", 2.3f},       {"stupid", -2.4f},      {"success", 2.7f},
    {"suck", -1.9f},       {"sucks", -1.5f},       {"super", 2.9f},        {"superb", 3.1f},
    {"support", 1.7f},     {"sweet", 2.0f},        {"terrible", -2.1f},    {"thank", 1.5f},
    {"thanks", 1.9f},      {"thrilled", 1.9f},     {"tragic", -3.4f},      {"trash", -1.5f},
    {"triumph", 2.5f},     {"ugly", -2.3f},        {"unbelievable", 0.8f}, {"unfair", -2.1f},
    {"unhappy", -1.8f},    {"upset", -1.6f},       {"useless", -1.8f},     {"victory", 2.8f},
    {"weak", -1.9f},       {"weird", -0.7f},       {"win", 2.8f},          {"winner", 2.8f},
    {"winning", 2.4f},     {"wins", 2.7f},         {"won", 2.7f},          {"wonderful", 2.7f},
    {"worried", -1.2f},    {"worse", -2.1f},       {"worst", -3.1f},       {"wow", 2.8f},
    {"wrong", -2.1f},      {"yay", 2.4f},          {"yes", 1.7f},          {"yikes", -1.2f},
};

static const std::string_view kNegations[] = {
    "aint",    "arent",   "cannot",  "cant",     "couldnt", "darent",  "didnt",   "doesnt",
    "dont",    "hadnt",   "hasnt",   "havent",   "isnt",    "mightnt", "mustnt",  "neither",
    "never",   "none",    "nope",    "nor",      "not",     "nothing", "nowhere", "shouldnt",
    "uhuh",    "wasnt",   "werent",  "without",  "wont",    "wouldnt", "rarely",  "seldom",
    "despite",
};

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
} // namespace

std::span<const LexiconEntry> BuiltinLexicon()
{
    return std::span<const LexiconEntry>(kLexicon);
}

const std::unordered_map<std::string_view, float>& BoosterWords()
{
    static const float kIncr = 0.293f;
    static const float kDecr = -0.293f;
    static const std::unordered_map<std::string_view, float> map = {
        {"absolutely", kIncr}, {"amazingly", kIncr},  {"completely", kIncr}, {"considerably", kIncr},
        {"deeply", kIncr},     {"enormously", kIncr}, {"entirely", kIncr},   {"especially", kIncr},
        {"exceptionally", kIncr}, {"extremely", kIncr}, {"fabulously", kIncr}, {"fully", kIncr},
        {"greatly", kIncr},    {"hella", kIncr},      {"highly", kIncr},     {"hugely", kIncr},
        {"incredibly", kIncr}, {"intensely", kIncr},  {"majorly", kIncr},    {"more", kIncr},
        {"most", kIncr},       {"particularly", kIncr}, {"purely", kIncr},   {"quite", kIncr},
        {"really", kIncr},     {"remarkably", kIncr}, {"so", kIncr},         {"substantially", kIncr},
        {"thoroughly", kIncr}, {"totally", kIncr},    {"tremendously", kIncr}, {"uber", kIncr},
        {"unbelievably", kIncr}, {"unusually", kIncr}, {"utterly", kIncr},   {"very", kIncr},
        {"almost", kDecr},     {"barely", kDecr},     {"hardly", kDecr},     {"kinda", kDecr},
        {"less", kDecr},       {"little", kDecr},     {"marginally", kDecr}, {"occasionally", kDecr},
        {"partly", kDecr},     {"scarcely", kDecr},   {"slightly", kDecr},   {"somewhat", kDecr},
        {"sorta", kDecr},
    };
    return map;
}

std::span<const std::string_view> NegationWords()
{
    return std::span<const std::string_view>(kNegations);
}

bool LoadLexiconFile(const std::string& path,
                     std::unordered_map<std::string, float>& out,
                     std::string& err)
{
    err.clear();
    std::ifstream f(path);
    if (!f)
    {
        err = "Failed to open lexicon: " + path;
        return false;
    }

    size_t added = 0;
    std::string line;
    while (std::getline(f, line))
    {
        const size_t tab = line.find('\t');
        if (tab == std::string::npos || tab == 0)
            continue;

        std::string token = TrimAscii(line.substr(0, tab));
        if (token.empty())
            continue;
        for (char& c : token)
            c = (char)std::tolower((unsigned char)c);

        const size_t tab2 = line.find('\t', tab + 1);
        const std::string score_str = line.substr(tab + 1, tab2 == std::string::npos ? std::string::npos : tab2 - tab - 1);
        char* end = nullptr;
        const float score = std::strtof(score_str.c_str(), &end);
        if (end == score_str.c_str())
            continue;

        out[token] = score;
        ++added;
    }

    if (added == 0)
    {
        err = "Lexicon has no usable entries: " + path;
        return false;
    }
    return true;
}
} // namespace memeseed::vibe
