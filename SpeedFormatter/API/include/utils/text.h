#pragma once
#include <string>

// Returns valid UTF-8. Every maximal invalid subsequence becomes U+FFFD.
std::string lossy_utf8(const std::string& bytes);

std::string trim_copy(std::string s);
