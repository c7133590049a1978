// guessing_game.hpp
//
// Number-guessing session: draws a secret in [low, high], then reads one line per
// guess and answers "too low" / "too high" until the secret is entered.
//
//   - RandomSource       : the only capability the session needs to pick a secret
//   - parseGuess / trim  : turn a raw input line into an optional unsigned value
//   - GuessingSession    : two-state loop (AwaitingGuess -> Finished)
//
// Notes:
//   - Streams are borrowed, never owned.
//   - Reading past end-of-stream is fatal (InputError); bad text is not.
//
#pragma once

#include <cstdint>                         // std::uint32_t
#include <iosfwd>                          // std::istream, std::ostream
#include <optional>                        // std::optional
#include <random>                          // RNG
#include <stdexcept>                       // std::runtime_error
#include <string>                          // std::string
#include <string_view>                     // std::string_view
//
namespace guess {                                                               // create a namespace to avoid symbol collisions
//
// -----------------------------
// Basic value types
// -----------------------------
enum class Outcome { Less, Greater, Equal };                                    // result of comparing a guess with the secret
//
enum class SessionState { AwaitingGuess, Finished };                            // AwaitingGuess is initial and recurring
//
struct GameConfig final {                                                       // open scope
  std::uint32_t low {1};                   // smallest secret that can be drawn
  std::uint32_t high {100};                // largest secret that can be drawn
  bool revealSecret {false};               // print the secret in the introduction (debugging)
};                                                                              // close scope
//
// Thrown when no line can be read from the input stream.
class InputError final : public std::runtime_error {                            // open scope
public:
  using std::runtime_error::runtime_error;                                      // inherit constructors
};                                                                              // close scope
//
// -----------------------------
// Random source
// -----------------------------
class RandomSource {                                                            // open scope
public:
  virtual ~RandomSource() = default;                                            // polymorphic base
  // Returns a value uniformly distributed over [low, high] inclusive.
  [[nodiscard]] virtual std::uint32_t drawUniform(std::uint32_t low, std::uint32_t high) = 0;
};                                                                              // close scope
//
// Seeded once from std::random_device; not reproducible.
class DeviceRandomSource final : public RandomSource {                          // open scope
public:
  DeviceRandomSource();                                                         // statement
  [[nodiscard]] std::uint32_t drawUniform(std::uint32_t low, std::uint32_t high) override;
//
private:
  std::mt19937 rng_;                                                            // process-local engine
};                                                                              // close scope
//
// -----------------------------
// Parsing and comparison
// -----------------------------
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;           // strip Unicode (UTF-8) whitespace on both ends
//
// Accepts an optional '+' followed by decimal digits that fit in 32 bits.
// No range check against the game bounds is made.
[[nodiscard]] std::optional<std::uint32_t> parseGuess(std::string_view line) noexcept;
//
[[nodiscard]] inline Outcome compareGuess(const std::uint32_t guess, const std::uint32_t secret) noexcept { // open scope
  if (guess < secret) return Outcome::Less;                                     // return computed value
  if (guess > secret) return Outcome::Greater;                                  // return computed value
  return Outcome::Equal;                                                        // return computed value
}                                                                               // close scope
//
// -----------------------------
// Session
// -----------------------------
class GuessingSession final {                                                   // open scope
public:
  // Draws the secret from `random` over [config.low, config.high].
  GuessingSession(RandomSource& random, std::istream& in, std::ostream& out, GameConfig config = {});
//
  GuessingSession(const GuessingSession&) = delete;                             // holds stream references
  GuessingSession& operator=(const GuessingSession&) = delete;                  // holds stream references
//
  // Prints the introduction and loops until the secret is guessed.
  // Throws InputError if input ends first.
  void start();                                                                 // statement
//
  // Runs one loop iteration: read, parse, echo, compare.
  SessionState step();                                                          // statement
//
  [[nodiscard]] SessionState state() const noexcept { return state_; }          // observer
  [[nodiscard]] std::uint32_t secret() const noexcept { return secret_; }       // observer
  [[nodiscard]] const GameConfig& config() const noexcept { return config_; }   // observer
//
private:
  void printIntroduction();                                                     // statement
//
  std::istream& in_;                                                            // borrowed input
  std::ostream& out_;                                                           // borrowed output
  const GameConfig config_;                                                     // immutable settings
  const std::uint32_t secret_;                                                  // immutable secret
  SessionState state_ {SessionState::AwaitingGuess};                            // current state
  std::string line_;                                                            // reused input buffer
};                                                                              // close scope
//
} // namespace guess
