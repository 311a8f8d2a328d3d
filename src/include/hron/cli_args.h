#pragma once

#include <string>
#include <vector>

namespace hron {
namespace cli {

// Parses command-line arguments for the hron tool
class CliArgs {
public:
    enum class Action {
        HELP,      // Show help message
        VERSION,   // Show version
        ENCODE,    // JSON -> HRON
        DECODE     // HRON -> JSON
    };

    // Throws std::invalid_argument for anything it cannot make sense of.
    CliArgs(int argc, const char* argv[]);

    Action getAction() const { return action_; }
    // Empty means stdin / stdout.
    const std::string& getInputPath() const { return inputPath_; }
    const std::string& getOutputPath() const { return outputPath_; }
    int getIndent() const { return indent_; }
    bool colorize() const { return colorize_; }
    bool verbose() const { return verbose_; }

private:
    Action action_ = Action::HELP;
    bool actionGiven_ = false;
    std::string inputPath_;
    std::string outputPath_;
    int indent_ = 2;
    bool colorize_ = false;
    bool verbose_ = false;
};

// Levenshtein distance between two strings
int levenshtein_distance(const std::string& s1, const std::string& s2);

// Closest entry of `valid_options`, or "" when nothing is close enough
std::string suggest_similar_option(const std::string& unknown_arg,
                                   const std::vector<std::string>& valid_options);

bool has_extension(const std::string& path, const std::string& ext);

}  // namespace cli
}  // namespace hron
