/**
 * SecretGenerator - Random Secret Codes
 *
 * Draws secrets from a palette using an injected RandomSource.
 * The generator does not own the source; the caller keeps it alive.
 */

#pragma once

#include "mastermind_types.hpp"
#include "random_source.hpp"
#include <vector>


namespace mastermind
{


class SecretGenerator
{
public:
	explicit SecretGenerator(RandomSource& source);

	/**
	 * Sample `length` colors with replacement
	 *
	 * Each position is drawn independently and uniformly from the palette.
	 *
	 * @throws InvalidConfiguration if palette is empty or length < 1
	 */
	Code generate(const std::vector<Color>& palette, int length);

	/**
	 * Sample `length` distinct colors (no repeats)
	 *
	 * Partial Fisher-Yates shuffle over a copy of the palette.
	 *
	 * @throws InvalidConfiguration if palette is empty, length < 1
	 *         or length > palette size
	 */
	Code generate_unique(const std::vector<Color>& palette, int length);

	/**
	 * Generate a secret honoring config.allow_repeats
	 */
	Code generate(const GameConfig& config);

private:
	void check_arguments(const std::vector<Color>& palette, int length) const;

	RandomSource& source;
};


}  // namespace mastermind
