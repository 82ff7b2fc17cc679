#include "app/config.h"
#include "core/paths.h"
#include "text/font_ladder.h"
#include "text/text_layout.h"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [--config <path>] [--font <path>]... [--pattern <fc-pattern>]\n"
              << "               [--size N]... [--text <sample>] [--width N]\n"
              << "\n"
              << "Resolves the font ladder and reports which rung is in use, then measures a sample\n"
              << "string at each size.\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>     Take font_candidates / fontconfig_pattern from this config\n"
              << "  --font <path>       Candidate font file (repeatable; replaces configured candidates)\n"
              << "  --pattern <p>       fontconfig pattern (\"\" disables the fontconfig rung)\n"
              << "  --size N            Pixel size to probe (repeatable; default 18 40 54 72 96)\n"
              << "  --text <sample>     Sample string (default: \"NO LIVE IMAGES FOUND\")\n"
              << "  --width N           Also wrap the sample at this width and print the lines\n";
}

int main(int argc, char** argv)
{
    std::string config_path;
    std::vector<std::string> fonts;
    bool have_pattern = false;
    std::string pattern;
    std::vector<int> sizes;
    std::string sample = "NO LIVE IMAGES FOUND";
    int wrap_width = 0;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt) -> std::string_view {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                PrintUsage(argv[0]);
                std::exit(2);
            }
            return std::string_view(argv[++i]);
        };

        if (a == "--help" || a == "-h")
        {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (a == "--config")
        {
            config_path = std::string(need("--config"));
        }
        else if (a == "--font")
        {
            fonts.emplace_back(need("--font"));
        }
        else if (a == "--pattern")
        {
            pattern = std::string(need("--pattern"));
            have_pattern = true;
        }
        else if (a == "--size")
        {
            const int s = std::atoi(std::string(need("--size")).c_str());
            if (s <= 0)
            {
                std::cerr << "Invalid --size value\n";
                return 2;
            }
            sizes.push_back(s);
        }
        else if (a == "--text")
        {
            sample = std::string(need("--text"));
        }
        else if (a == "--width")
        {
            wrap_width = std::atoi(std::string(need("--width")).c_str());
        }
        else
        {
            std::cerr << "Unknown arg: " << a << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    memeseed::app::AppConfig cfg;
    {
        const std::string path = config_path.empty() ? GetMemeseedConfigPath() : config_path;
        bool found = false;
        std::string err;
        if (!memeseed::app::LoadAppConfig(path, cfg, found, err))
        {
            std::cerr << "Config load failed: " << err << "\n";
            return 1;
        }
    }

    memeseed::text::FontLadderOptions opts = cfg.fonts;
    if (!fonts.empty())
        opts.candidates = fonts;
    if (have_pattern)
        opts.fontconfig_pattern = pattern;
    if (sizes.empty())
        sizes = {18, 40, 54, 72, 96};

    memeseed::text::FontLadder ladder(opts);

    std::cout << "rung: " << memeseed::text::FontRungName(ladder.Rung()) << "\n";
    if (!ladder.FontPath().empty())
        std::cout << "file: " << ladder.FontPath() << "\n";
    for (const auto& r : ladder.Rejections())
        std::cout << "  - " << r << "\n";

    for (int size : sizes)
    {
        const memeseed::text::IFontFace& face = ladder.FaceAt(size);
        memeseed::text::TextMask mask;
        const bool can_stroke = face.RenderMask(sample, memeseed::text::StrokeWidthFor(size, 14), mask);

        std::cout << size << "px  " << face.Describe() << "  ascent=" << face.Ascent() << " descent=" << face.Descent()
                  << " width=" << face.MeasureWidth(sample) << " stroke=" << (can_stroke ? "yes" : "no") << "\n";

        if (wrap_width > 0)
        {
            for (const auto& line : memeseed::text::WrapText(sample, face, wrap_width))
                std::cout << "    | " << line << "\n";
        }
    }

    // Exit 1 when only the bitmap fallback is available, so deploy checks can gate on it.
    return ladder.Rung() == memeseed::text::FontRung::Builtin ? 1 : 0;
}
