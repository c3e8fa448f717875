/**
 * MasterMind Engine - Core Type Definitions
 *
 * This file defines the fundamental data structures shared by the
 * secret generator, the game session and the drivers.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <stdexcept>


namespace mastermind
{


/**
 * Peg colors
 *
 * The first six members form the default palette.
 */
enum class Color : uint8_t
{
	Red = 0,
	Green = 1,
	Blue = 2,
	Yellow = 3,
	Orange = 4,
	Purple = 5,
	Cyan = 6,
	Magenta = 7,
	White = 8,
	Black = 9
};

constexpr int kColorCount = 10;


inline bool is_known_color(Color color)
{
	return static_cast<int>(color) < kColorCount;
}


/**
 * A sequence of colors (used for both secrets and guesses)
 */
using Code = std::vector<Color>;


/**
 * Scoring result for one guess against the secret
 */
struct Feedback
{
	int exact;    // right color, right position
	int partial;  // right color, wrong position

	Feedback() : exact(0), partial(0) {}
	Feedback(int e, int p) : exact(e), partial(p) {}

	bool operator==(const Feedback& other) const
	{
		return exact == other.exact && partial == other.partial;
	}

	bool operator!=(const Feedback& other) const
	{
		return !(*this == other);
	}
};


/**
 * One scored turn in the session history
 */
struct Attempt
{
	int turn_index;
	Code guess;
	Feedback feedback;

	Attempt(int turn, const Code& g, const Feedback& f)
		: turn_index(turn), guess(g), feedback(f) {}
};


/**
 * A revealed secret position
 */
struct Hint
{
	int position;
	Color color;

	Hint() : position(0), color(Color::Red) {}
	Hint(int pos, Color c) : position(pos), color(c) {}
};


/**
 * Session state machine
 */
enum class SessionState
{
	InProgress,
	Won,
	Lost,
	Abandoned
};


inline bool is_terminal(SessionState state)
{
	return state != SessionState::InProgress;
}


inline std::string state_to_string(SessionState state)
{
	switch (state)
	{
		case SessionState::InProgress: return "InProgress";
		case SessionState::Won: return "Won";
		case SessionState::Lost: return "Lost";
		case SessionState::Abandoned: return "Abandoned";
	}
	return "Unknown";
}


/**
 * Build a palette from the first `size` colors of the enumeration
 */
inline std::vector<Color> make_palette(int size)
{
	if (size < 1 || size > kColorCount)
	{
		throw std::out_of_range("Palette size must be between 1 and " + std::to_string(kColorCount));
	}

	std::vector<Color> palette;
	palette.reserve(size);
	for (int i = 0; i < size; i++)
	{
		palette.push_back(static_cast<Color>(i));
	}
	return palette;
}


/**
 * Game configuration
 */
struct GameConfig
{
	std::vector<Color> palette;
	int length;
	int max_attempts;
	bool allow_repeats;

	GameConfig()
		: palette(make_palette(6)),
		  length(4),
		  max_attempts(10),
		  allow_repeats(true) {}

	GameConfig(const std::vector<Color>& colors, int len, int max_tries, bool repeats = true)
		: palette(colors),
		  length(len),
		  max_attempts(max_tries),
		  allow_repeats(repeats) {}
};


/**
 * Outcome of a submitted guess
 *
 * `secret` is only set when the guess ended the session.
 */
struct GuessOutcome
{
	Feedback feedback;
	SessionState state;
	std::optional<Code> secret;

	GuessOutcome() : state(SessionState::InProgress) {}
};


// === Error kinds ===

class MastermindError : public std::runtime_error
{
public:
	explicit MastermindError(const std::string& what) : std::runtime_error(what) {}
};


/**
 * Malformed construction parameters; caller must rebuild with valid ones
 */
class InvalidConfiguration : public MastermindError
{
public:
	explicit InvalidConfiguration(const std::string& what) : MastermindError(what) {}
};


/**
 * Guess failed length or palette validation; session unchanged
 */
class InvalidGuess : public MastermindError
{
public:
	explicit InvalidGuess(const std::string& what) : MastermindError(what) {}
};


/**
 * Mutating call on a finished session
 */
class SessionTerminated : public MastermindError
{
public:
	explicit SessionTerminated(const std::string& what) : MastermindError(what) {}
};


class HintAlreadyUsed : public MastermindError
{
public:
	explicit HintAlreadyUsed(const std::string& what) : MastermindError(what) {}
};


}  // namespace mastermind
