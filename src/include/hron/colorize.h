#pragma once

#include <string>

namespace hron {

// Add ANSI colors to a rendered document: key names yellow, strings green,
// numbers and keywords magenta. strip_ansi(colorize(x)) == x.
std::string colorize(const std::string& document);

// Remove the color codes written by colorize(). Other escape bytes are kept.
std::string strip_ansi(const std::string& text);

}  // namespace hron
