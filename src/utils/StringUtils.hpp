#pragma once

#include <string>
#include <vector>

namespace remembrances {

std::string toLower(const std::string& s);
std::string trim(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);
bool endsWith(const std::string& s, const std::string& suffix);

std::vector<std::string> splitLines(const std::string& text);

// True if `token` occurs in `text` with no word character ([A-Za-z0-9_])
// immediately before or after it.
bool containsToken(const std::string& text, const std::string& token);

// Single-quotes an argument for /bin/sh.
std::string shellQuote(const std::string& arg);
std::string joinCommand(const std::vector<std::string>& argv);

}
