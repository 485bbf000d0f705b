#ifndef SANDBOX_SHELL_HPP
#define SANDBOX_SHELL_HPP

#include <string>
#include <utility>
#include <vector>

namespace sandbox {

// Replaces every ' with '\'' so that text can be placed between single
// quotes.
std::string EscapeSingleQuotes(const std::string& text);

// Returns text as a single-quoted shell word.
std::string SingleQuote(const std::string& text);

// Returns arg unchanged if the shell would read it as one literal word,
// single-quoted otherwise.
std::string QuoteArgument(const std::string& arg);

// Turns an argument vector into a shell command line.
std::string JoinArguments(const std::vector<std::string>& args);

// Returns a heredoc delimiter that is not a line of any of texts, so that
// none of them can terminate the heredoc early.
std::string HeredocMarker(const std::vector<std::string>& texts);

// Renders environment as "export NAME='VALUE' && ...", in order. Returns an
// empty string for an empty environment.
std::string RenderExports(
    const std::vector<std::pair<std::string, std::string>>& environment);

}  // namespace sandbox

#endif
