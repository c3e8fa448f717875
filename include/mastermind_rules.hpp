/**
 * MasterMind Rules - Scoring and Validation
 *
 * Pure functions shared by the game session, the solver policies and
 * the drivers. None of them touch session state.
 */

#pragma once

#include "mastermind_types.hpp"
#include <array>
#include <algorithm>
#include <functional>
#include <stdexcept>


namespace mastermind
{


/**
 * Score a guess against the secret
 *
 * exact   = positions where guess[i] == secret[i]
 * partial = sum over colors of min(remaining secret count, remaining guess count),
 *           counting only the non-exact positions
 *
 * A secret peg can satisfy at most one guess peg, so repeated colors are never
 * double counted. The result is symmetric in its two arguments.
 */
inline Feedback score_guess(const Code& secret, const Code& guess)
{
	if (secret.size() != guess.size())
	{
		throw std::invalid_argument(
			"Cannot score codes of different length (" + std::to_string(secret.size()) +
			" vs " + std::to_string(guess.size()) + ")");
	}

	for (size_t i = 0; i < secret.size(); i++)
	{
		if (!is_known_color(secret[i]) || !is_known_color(guess[i]))
		{
			throw std::invalid_argument(
				"Cannot score unknown color at position " + std::to_string(i + 1));
		}
	}

	std::array<int, kColorCount> secretRemaining{};
	std::array<int, kColorCount> guessRemaining{};
	int exact = 0;

	for (size_t i = 0; i < secret.size(); i++)
	{
		if (guess[i] == secret[i])
		{
			exact++;
		}
		else
		{
			secretRemaining[static_cast<size_t>(secret[i])]++;
			guessRemaining[static_cast<size_t>(guess[i])]++;
		}
	}

	int partial = 0;
	for (int c = 0; c < kColorCount; c++)
	{
		partial += std::min(secretRemaining[c], guessRemaining[c]);
	}

	return Feedback(exact, partial);
}


inline bool in_palette(Color color, const std::vector<Color>& palette)
{
	return std::find(palette.begin(), palette.end(), color) != palette.end();
}


/**
 * Validation result
 */
struct GuessValidation
{
	bool valid;
	std::string reason;

	GuessValidation(bool v = true, const std::string& r = "")
		: valid(v), reason(r) {}
};


/**
 * Check a guess against the configured length and palette
 */
inline GuessValidation validate_guess(const Code& guess, const GameConfig& config)
{
	if (static_cast<int>(guess.size()) != config.length)
	{
		return GuessValidation(false,
			"Guess has " + std::to_string(guess.size()) +
			" colors, expected " + std::to_string(config.length));
	}

	for (size_t i = 0; i < guess.size(); i++)
	{
		if (!in_palette(guess[i], config.palette))
		{
			return GuessValidation(false,
				"Color at position " + std::to_string(i + 1) + " is not in the palette");
		}
	}

	return GuessValidation(true);
}


/**
 * Check construction parameters
 */
inline GuessValidation validate_config(const GameConfig& config)
{
	if (config.palette.empty())
	{
		return GuessValidation(false, "Palette is empty");
	}

	for (size_t i = 0; i < config.palette.size(); i++)
	{
		if (!is_known_color(config.palette[i]))
		{
			return GuessValidation(false,
				"Palette contains unknown color " + std::to_string(static_cast<int>(config.palette[i])));
		}

		for (size_t j = i + 1; j < config.palette.size(); j++)
		{
			if (config.palette[i] == config.palette[j])
			{
				return GuessValidation(false, "Palette contains a color twice");
			}
		}
	}

	if (config.length < 1)
	{
		return GuessValidation(false, "Code length must be at least 1");
	}

	if (config.max_attempts < 1)
	{
		return GuessValidation(false, "Max attempts must be at least 1");
	}

	if (!config.allow_repeats && config.length > static_cast<int>(config.palette.size()))
	{
		return GuessValidation(false, "Code length exceeds palette size while repeats are disabled");
	}

	return GuessValidation(true);
}


/**
 * Check whether `candidate` could be the secret given past attempts
 *
 * True when scoring each past guess against the candidate reproduces
 * the recorded feedback.
 */
inline bool is_consistent(const Code& candidate, const std::vector<Attempt>& attempts)
{
	for (const auto& attempt : attempts)
	{
		if (score_guess(candidate, attempt.guess) != attempt.feedback)
		{
			return false;
		}
	}
	return true;
}


inline bool has_repeats(const Code& code)
{
	for (size_t i = 0; i < code.size(); i++)
	{
		for (size_t j = i + 1; j < code.size(); j++)
		{
			if (code[i] == code[j]) return true;
		}
	}
	return false;
}


/**
 * Number of possible secrets for a configuration
 *
 * Saturates at `limit` to avoid overflow on large palettes.
 */
inline uint64_t count_codes(const GameConfig& config, uint64_t limit = UINT64_MAX)
{
	uint64_t total = 1;
	uint64_t choices = config.palette.size();

	for (int i = 0; i < config.length; i++)
	{
		if (choices == 0) return 0;
		if (total > limit / choices) return limit;
		total *= choices;
		if (!config.allow_repeats) choices--;
	}

	return total;
}


/**
 * Visit every possible secret in lexicographic palette order
 *
 * Odometer over palette indices. Codes with repeated colors are skipped
 * when the configuration forbids them. Return false from `fn` to stop early.
 */
inline void for_each_code(const GameConfig& config, const std::function<bool(const Code&)>& fn)
{
	const size_t paletteSize = config.palette.size();
	if (paletteSize == 0 || config.length < 1) return;

	std::vector<size_t> digits(config.length, 0);
	Code code(config.length, config.palette[0]);

	while (true)
	{
		if (config.allow_repeats || !has_repeats(code))
		{
			if (!fn(code)) return;
		}

		// Advance odometer (last position fastest)
		int pos = config.length - 1;
		while (pos >= 0)
		{
			digits[pos]++;
			if (digits[pos] < paletteSize)
			{
				code[pos] = config.palette[digits[pos]];
				break;
			}
			digits[pos] = 0;
			code[pos] = config.palette[0];
			pos--;
		}

		if (pos < 0) return;
	}
}


}  // namespace mastermind
