/**
 * MasterMind Notation - Encoding and Decoding
 *
 * Each color has a one-letter code:
 *   R Red, G Green, B Blue, Y Yellow, O Orange, P Purple,
 *   C Cyan, M Magenta, W White, K Black
 *
 * A code is written as the concatenation of its letters, e.g. "RGBY".
 * Decoding is case-insensitive.
 */

#pragma once

#include "mastermind_types.hpp"
#include <string>
#include <vector>
#include <cctype>
#include <stdexcept>


namespace mastermind
{


constexpr char kColorLetters[kColorCount + 1] = "RGBYOPCMWK";


/**
 * @throws std::invalid_argument for a value outside the Color enum
 */
inline char color_to_char(Color color)
{
	if (!is_known_color(color))
	{
		throw std::invalid_argument("Unknown color value: " + std::to_string(static_cast<int>(color)));
	}
	return kColorLetters[static_cast<int>(color)];
}


/**
 * Decode one color letter
 *
 * @throws std::invalid_argument for an unknown letter
 */
inline Color char_to_color(char letter)
{
	char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
	for (int i = 0; i < kColorCount; i++)
	{
		if (kColorLetters[i] == upper)
		{
			return static_cast<Color>(i);
		}
	}
	throw std::invalid_argument(std::string("Unknown color letter: '") + letter + "'");
}


inline std::string color_name(Color color)
{
	switch (color)
	{
		case Color::Red: return "Red";
		case Color::Green: return "Green";
		case Color::Blue: return "Blue";
		case Color::Yellow: return "Yellow";
		case Color::Orange: return "Orange";
		case Color::Purple: return "Purple";
		case Color::Cyan: return "Cyan";
		case Color::Magenta: return "Magenta";
		case Color::White: return "White";
		case Color::Black: return "Black";
	}
	return "Unknown";
}


/**
 * Encode a code to its letter string
 *
 * Examples:
 *   encode_code({Red, Green, Blue, Yellow}) → "RGBY"
 *   encode_code({}) → ""
 */
inline std::string encode_code(const Code& code)
{
	std::string result;
	result.reserve(code.size());
	for (Color c : code)
	{
		result += color_to_char(c);
	}
	return result;
}


/**
 * Decode a letter string to a code
 *
 * Whitespace is ignored so "R G B Y" and "rgby" both decode to RGBY.
 * Palette membership is not checked here; that is a rule, not notation.
 */
inline Code decode_code(const std::string& text)
{
	Code code;
	code.reserve(text.size());
	for (char ch : text)
	{
		if (std::isspace(static_cast<unsigned char>(ch)))
		{
			continue;
		}
		code.push_back(char_to_color(ch));
	}
	return code;
}


/**
 * Format feedback as "exact-partial", e.g. "2-1"
 */
inline std::string encode_feedback(const Feedback& feedback)
{
	return std::to_string(feedback.exact) + "-" + std::to_string(feedback.partial);
}


}  // namespace mastermind
