#include "sandbox/shell.hpp"

#include <cstring>

#include "util/misc.hpp"

namespace {

const constexpr char* kSafeCharacters =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789"
    "_@%+=:,./-";

bool IsLineOf(const std::string& line, const std::string& text) {
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    if (text.compare(start, end - start, line) == 0) return true;
    start = end + 1;
  }
  return false;
}

}  // namespace

namespace sandbox {

std::string EscapeSingleQuotes(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    if (c == '\'') {
      escaped += "'\\''";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

std::string SingleQuote(const std::string& text) {
  return "'" + EscapeSingleQuotes(text) + "'";
}

std::string QuoteArgument(const std::string& arg) {
  if (!arg.empty() &&
      arg.find_first_not_of(kSafeCharacters) == std::string::npos) {
    return arg;
  }
  return SingleQuote(arg);
}

std::string JoinArguments(const std::vector<std::string>& args) {
  std::vector<std::string> quoted;
  quoted.reserve(args.size());
  for (const std::string& arg : args) quoted.push_back(QuoteArgument(arg));
  return util::join(quoted, " ");
}

std::string HeredocMarker(const std::vector<std::string>& texts) {
  std::string marker = "EOF";
  for (size_t attempt = 1;; attempt++) {
    bool clashes = false;
    for (const std::string& text : texts) {
      if (IsLineOf(marker, text)) {
        clashes = true;
        break;
      }
    }
    if (!clashes) return marker;
    marker = "EOF_" + util::random_hex(8 + attempt);
  }
}

std::string RenderExports(
    const std::vector<std::pair<std::string, std::string>>& environment) {
  std::vector<std::string> exports;
  exports.reserve(environment.size());
  for (const auto& variable : environment) {
    exports.push_back("export " + variable.first + "=" +
                      SingleQuote(variable.second));
  }
  return util::join(exports, " && ");
}

}  // namespace sandbox
