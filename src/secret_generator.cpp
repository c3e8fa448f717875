/**
 * SecretGenerator Implementation
 */

#include "../include/secret_generator.hpp"
#include <utility>


namespace mastermind
{


SecretGenerator::SecretGenerator(RandomSource& source)
	: source(source)
{
}


void SecretGenerator::check_arguments(const std::vector<Color>& palette, int length) const
{
	if (palette.empty())
	{
		throw InvalidConfiguration("Cannot generate a secret from an empty palette");
	}
	if (length < 1)
	{
		throw InvalidConfiguration("Secret length must be at least 1, got " + std::to_string(length));
	}
}


Code SecretGenerator::generate(const std::vector<Color>& palette, int length)
{
	check_arguments(palette, length);

	Code secret;
	secret.reserve(length);
	for (int i = 0; i < length; i++)
	{
		secret.push_back(palette[source.next_index(palette.size())]);
	}
	return secret;
}


Code SecretGenerator::generate_unique(const std::vector<Color>& palette, int length)
{
	check_arguments(palette, length);

	if (length > static_cast<int>(palette.size()))
	{
		throw InvalidConfiguration(
			"Cannot draw " + std::to_string(length) + " distinct colors from a palette of " +
			std::to_string(palette.size()));
	}

	std::vector<Color> pool(palette);
	for (int i = 0; i < length; i++)
	{
		size_t j = i + source.next_index(pool.size() - i);
		std::swap(pool[i], pool[j]);
	}

	return Code(pool.begin(), pool.begin() + length);
}


Code SecretGenerator::generate(const GameConfig& config)
{
	return config.allow_repeats
		? generate(config.palette, config.length)
		: generate_unique(config.palette, config.length);
}


}  // namespace mastermind
