// Concepts covered in this file (high-level checklist):
// 1) Drawing a random number from a closed range with <random> (seeded by the environment, not reproducible).
// 2) Reading whole lines from std::cin and turning text into an unsigned number without trusting the input.
// 3) A loop that only ends when a comparison says "equal" (too low / too high / match).
// 4) Recoverable mistakes (bad text: ask again) vs fatal ones (input closed: stop with an error).
// 5) Controlled switches: revealing the secret for debugging behind an #if switch.

// This header declares guess::GuessingSession and guess::DeviceRandomSource.
#include "guessing_game.hpp"

// This header provides EXIT_SUCCESS and EXIT_FAILURE.
#include <cstdlib>
// This header provides std::cin, std::cout and std::cerr.
#include <iostream>
// This header provides std::invalid_argument.
#include <stdexcept>
// This header provides std::system_error (thrown by std::random_device).
#include <system_error>

// This switch prints the secret number right after the welcome line (handy while testing by hand).
#define SHOW_SECRET_NUMBER 0

// This is where execution begins.
int main()
{
    // This is the default game: secrets are drawn from [1, 100].
    guess::GameConfig config;
#if SHOW_SECRET_NUMBER
    // This turns on the debugging line "The secret number is: N".
    config.revealSecret = true;
#endif

    try
    {
        // This random source is seeded once from std::random_device (which throws if no entropy source exists).
        guess::DeviceRandomSource random;
        // This draws the secret; it never changes for the rest of the program.
        guess::GuessingSession session(random, std::cin, std::cout, config);
        // This prints the introduction and keeps asking until the secret is guessed.
        session.start();
    }
    catch (const guess::InputError& e)
    {
        // Output (on stderr): error: Failed to read line.
        std::cerr << "error: " << e.what() << "\n";
        // This is the normal non-zero exit path: the input stream closed before a match.
        return EXIT_FAILURE;
    }
    catch (const std::invalid_argument& e)
    {
        // This only happens if the range above is edited so that low > high.
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    catch (const std::system_error& e)
    {
        // This happens when std::random_device cannot open the environment's entropy source.
        std::cerr << "error: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    // This reports success after the congratulatory message.
    return EXIT_SUCCESS;
}
