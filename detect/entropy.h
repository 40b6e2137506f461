#pragma once

#include <string>

namespace promptguard {

// Shannon entropy of `text` in bits per byte. Returns 0 for empty input.
double ShannonEntropy(const std::string& text);

bool HasLetterAndDigit(const std::string& text);
bool HasMixedCase(const std::string& text);

}  // namespace promptguard
