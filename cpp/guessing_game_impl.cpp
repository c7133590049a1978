// guessing_game_impl.cpp
//
// Implementation of the guessing session declared in guessing_game.hpp.
//
// -----------------------------------------------------------------------------
// PSEUDOCODE (one session)
//
//   secret = drawUniform(low, high)
//   print introduction
//   loop:
//     line = readLine()                 -> end-of-stream: throw InputError
//     g    = parseGuess(trim(line))     -> failure: re-prompt, continue
//     print "You guessed: g"
//     switch compare(g, secret):
//       Less    -> "Too low",  continue
//       Greater -> "Too high", continue
//       Equal   -> congratulate, Finished
// -----------------------------------------------------------------------------
//
#include "guessing_game.hpp"

#include <array>                           // std::array
#include <charconv>                        // std::from_chars
#include <cstddef>                         // std::size_t
#include <istream>                         // std::getline
#include <ostream>                         // operator<<
#include <stdexcept>                       // std::invalid_argument
#include <system_error>                    // std::errc
//
namespace guess {                                                               // create a namespace to avoid symbol collisions
//
namespace {                                                                     // file-local helpers
//
[[nodiscard]] constexpr bool isSpace(const char c) noexcept {                   // open scope
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}                                                                               // close scope
//
// UTF-8 encodings of the non-ASCII code points with the Unicode White_Space property.
constexpr std::array<std::string_view, 19> kWideSpaces {                        // use std::array for fixed-size compile-time arrays
  "\xC2\x85",                              // U+0085 next line
  "\xC2\xA0",                              // U+00A0 no-break space
  "\xE1\x9A\x80",                          // U+1680 ogham space mark
  "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", // U+2000..U+2003
  "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87", // U+2004..U+2007
  "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",                    // U+2008..U+200A
  "\xE2\x80\xA8", "\xE2\x80\xA9",          // U+2028, U+2029 line / paragraph separator
  "\xE2\x80\xAF",                          // U+202F narrow no-break space
  "\xE2\x81\x9F",                          // U+205F medium mathematical space
  "\xE3\x80\x80",                          // U+3000 ideographic space
};                                                                              // close scope
//
// Byte length of the whitespace code point at the front (or back) of `text`; 0 if none.
[[nodiscard]] std::size_t spaceWidth(const std::string_view text, const bool atFront) noexcept { // open scope
  if (text.empty()) return 0;                                                   // nothing to strip
  if (isSpace(atFront ? text.front() : text.back())) return 1;                  // ASCII fast path
  auto matches = [&](const std::string_view seq) {                              // open scope
    return atFront ? text.starts_with(seq) : text.ends_with(seq);               // C++20 string_view helpers
  };                                                                            // close scope
  for (const std::string_view seq : kWideSpaces) if (matches(seq)) return seq.size(); // loop
  return 0;                                                                     // return computed value
}                                                                               // close scope
//
GameConfig checkedConfig(const GameConfig& config) {                            // open scope
  if (config.low > config.high) throw std::invalid_argument("GuessingSession: low > high"); // throw exception on invalid input
  return config;                                                                // return computed value
}                                                                               // close scope
//
} // namespace
//
// -----------------------------
// Random source
// -----------------------------
DeviceRandomSource::DeviceRandomSource() : rng_(std::random_device{}()) {}     // seed from environment entropy
//
std::uint32_t DeviceRandomSource::drawUniform(const std::uint32_t low, const std::uint32_t high) { // open scope
  if (low > high) throw std::invalid_argument("drawUniform: low > high");       // throw exception on invalid input
  std::uniform_int_distribution<std::uint32_t> dist(low, high);                 // closed range [low, high]
  return dist(rng_);                                                            // return computed value
}                                                                               // close scope
//
// -----------------------------
// Parsing
// -----------------------------
std::string_view trim(std::string_view text) noexcept {                         // open scope
  while (const std::size_t n = spaceWidth(text, true)) text.remove_prefix(n);   // leading whitespace
  while (const std::size_t n = spaceWidth(text, false)) text.remove_suffix(n);  // trailing whitespace
  return text;                                                                  // return computed value
}                                                                               // close scope
//
std::optional<std::uint32_t> parseGuess(const std::string_view line) noexcept { // open scope
  std::string_view digits = trim(line);                                         // compute / assign value
  if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);        // one optional plus sign
  if (digits.empty() || digits.front() == '+' || digits.front() == '-') return std::nullopt; // empty, or a second sign
//
  std::uint32_t value = 0;                                                      // statement
  const char* const first = digits.data();                                      // const: avoid mutation
  const char* const last = first + digits.size();                               // const: avoid mutation
  const auto [ptr, ec] = std::from_chars(first, last, value);                   // base-10, no whitespace, no sign
  if (ec != std::errc{} || ptr != last) return std::nullopt;                    // not a number, out of range, or trailing text
  return value;                                                                 // return computed value
}                                                                               // close scope
//
// -----------------------------
// Session
// -----------------------------
GuessingSession::GuessingSession(RandomSource& random, std::istream& in, std::ostream& out, GameConfig config)
    : in_(in),
      out_(out),
      config_(checkedConfig(config)),
      secret_(random.drawUniform(config_.low, config_.high)) {}
//
void GuessingSession::printIntroduction() {                                     // open scope
  out_ << "Welcome to the Guessing Game!\n";                                    // print results / progress
  if (config_.revealSecret) out_ << "The secret number is: " << secret_ << "\n"; // debugging aid
  out_ << "I've picked a number between " << config_.low << " and " << config_.high
       << ". Can you guess what it is?\n";                                      // print results / progress
}                                                                               // close scope
//
void GuessingSession::start() {                                                 // open scope
  printIntroduction();                                                          // statement
  while (step() == SessionState::AwaitingGuess) {}                              // loop until Finished
}                                                                               // close scope
//
SessionState GuessingSession::step() {                                          // open scope
  if (state_ == SessionState::Finished) return state_;                          // terminal: read nothing
//
  out_.flush();                                                                 // prompt must be visible before blocking
  if (!std::getline(in_, line_)) throw InputError("Failed to read line.");      // end-of-stream or I/O fault is fatal
//
  const std::optional<std::uint32_t> parsed = parseGuess(line_);                // const: avoid mutation
  if (!parsed) {                                                                // open scope
    out_ << "That doesn't seem like a number. Please enter a valid number:\n";  // print results / progress
    return state_;                                                              // self-loop on AwaitingGuess
  }                                                                             // close scope
//
  out_ << "You guessed: " << *parsed << "\n";                                   // print results / progress
//
  switch (compareGuess(*parsed, secret_)) {                                     // open scope
    case Outcome::Less:
      out_ << "Too low! Try again:\n";                                          // print results / progress
      break;                                                                    // statement
    case Outcome::Greater:
      out_ << "Too high! Try again:\n";                                         // print results / progress
      break;                                                                    // statement
    case Outcome::Equal:
      out_ << "Congratulations! You guessed the right number!\n";               // print results / progress
      state_ = SessionState::Finished;                                          // terminal transition
      break;                                                                    // statement
  }                                                                             // close scope
  return state_;                                                                // return computed value
}                                                                               // close scope
//
} // namespace guess
