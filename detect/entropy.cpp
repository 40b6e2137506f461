#include "detect/entropy.h"

#include <array>
#include <cctype>
#include <cmath>

namespace promptguard {

double ShannonEntropy(const std::string& text) {
  if (text.empty()) {
    return 0.0;
  }
  std::array<std::size_t, 256> counts{};
  for (unsigned char c : text) {
    ++counts[c];
  }
  const double total = static_cast<double>(text.size());
  double entropy = 0.0;
  for (auto count : counts) {
    if (count == 0) {
      continue;
    }
    double p = static_cast<double>(count) / total;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

bool HasLetterAndDigit(const std::string& text) {
  bool letter = false;
  bool digit = false;
  for (unsigned char c : text) {
    letter = letter || std::isalpha(c);
    digit = digit || std::isdigit(c);
  }
  return letter && digit;
}

bool HasMixedCase(const std::string& text) {
  bool upper = false;
  bool lower = false;
  for (unsigned char c : text) {
    upper = upper || std::isupper(c);
    lower = lower || std::islower(c);
  }
  return upper && lower;
}

}  // namespace promptguard
