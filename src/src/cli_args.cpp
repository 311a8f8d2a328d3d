#include <hron/cli_args.h>
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace hron {
namespace cli {

namespace {
    const std::vector<std::string> valid_options = {
        "--help", "-h",
        "--version", "-v",
        "--encode", "-e",
        "--decode", "-d",
        "--indent",
        "--color",
        "--verbose"
    };

    int parse_indent(const std::string& text) {
        size_t used = 0;
        int n = 0;
        try {
            n = std::stoi(text, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument("--indent expects a number, got '" + text + "'");
        }
        if (used != text.size() or n < 0)
            throw std::invalid_argument("--indent expects a non-negative number, got '" + text + "'");
        return n;
    }
}

int levenshtein_distance(const std::string& s1, const std::string& s2) {
    // two rows of the edit-distance table are enough
    std::vector<int> prev(s2.size() + 1);
    std::vector<int> cur(s2.size() + 1);
    for (size_t j = 0; j <= s2.size(); ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= s1.size(); ++i) {
        cur[0] = static_cast<int>(i);
        for (size_t j = 1; j <= s2.size(); ++j) {
            if (s1[i - 1] == s2[j - 1])
                cur[j] = prev[j - 1];
            else
                cur[j] = 1 + std::min({prev[j], cur[j - 1], prev[j - 1]});
        }
        std::swap(prev, cur);
    }
    return prev[s2.size()];
}

std::string suggest_similar_option(const std::string& unknown_arg,
                                   const std::vector<std::string>& options) {
    int min_distance = std::numeric_limits<int>::max();
    std::string best_match;
    for (const auto& option : options) {
        int dist = levenshtein_distance(unknown_arg, option);
        if (dist < min_distance) {
            min_distance = dist;
            best_match = option;
        }
    }

    // within 3 edits or 40% of the argument length
    int threshold = std::max(3, static_cast<int>(unknown_arg.length() * 0.4));
    if (min_distance <= threshold) return best_match;
    return "";
}

bool has_extension(const std::string& path, const std::string& ext) {
    return path.size() > ext.size() and path.compare(path.size() - ext.size(), ext.size(), ext) == 0;
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    std::vector<std::string> files;
    auto set_action = [&](Action a, const std::string& arg) {
        if (actionGiven_ and action_ != a)
            throw std::invalid_argument("conflicting option " + arg + ": only one action may be given");
        action_ = a;
        actionGiven_ = true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" or arg == "-h") {
            set_action(Action::HELP, arg);
        } else if (arg == "--version" or arg == "-v") {
            set_action(Action::VERSION, arg);
        } else if (arg == "--encode" or arg == "-e") {
            set_action(Action::ENCODE, arg);
        } else if (arg == "--decode" or arg == "-d") {
            set_action(Action::DECODE, arg);
        } else if (arg == "--indent") {
            if (i + 1 >= argc) throw std::invalid_argument("--indent requires a number argument");
            indent_ = parse_indent(argv[++i]);
        } else if (arg == "--color") {
            colorize_ = true;
        } else if (arg == "--verbose") {
            verbose_ = true;
        } else if (arg.size() > 1 and arg[0] == '-') {
            std::string error = "Unknown argument: " + arg;
            std::string suggestion = suggest_similar_option(arg, valid_options);
            if (not suggestion.empty()) error += "\n  Did you mean '" + suggestion + "'?";
            throw std::invalid_argument(error);
        } else {
            files.push_back(arg);
        }
    }

    if (action_ == Action::HELP or action_ == Action::VERSION) {
        if (not files.empty()) throw std::invalid_argument("unexpected argument: " + files.front());
        return;
    }

    if (not actionGiven_) {
        throw std::invalid_argument("no action given; use --encode or --decode");
    }
    if (files.size() > 2) throw std::invalid_argument("unexpected argument: " + files[2]);
    if (files.size() >= 1) inputPath_ = files[0];
    if (files.size() == 2) outputPath_ = files[1];

    if (action_ == Action::ENCODE and not outputPath_.empty() and not has_extension(outputPath_, ".hron"))
        throw std::invalid_argument("expected a .hron output file, got '" + outputPath_ + "'");
    if (action_ == Action::DECODE and not inputPath_.empty() and not has_extension(inputPath_, ".hron"))
        throw std::invalid_argument("expected a .hron input file, got '" + inputPath_ + "'");
}

}  // namespace cli
}  // namespace hron
