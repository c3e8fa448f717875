/**
 * Test color letter notation
 */

#include "../include/mastermind_types.hpp"
#include "../include/mastermind_notation.hpp"
#include <iostream>
#include <cassert>
#include <vector>


using namespace mastermind;


void test_color_letters()
{
	std::cout << "\n[TEST] Color Letters\n";
	std::cout << "====================\n";

	assert(color_to_char(Color::Red) == 'R');
	assert(color_to_char(Color::Purple) == 'P');
	assert(color_to_char(Color::Black) == 'K');

	for (int i = 0; i < kColorCount; i++)
	{
		Color c = static_cast<Color>(i);
		assert(char_to_color(color_to_char(c)) == c);
	}
	std::cout << "✓ All " << kColorCount << " letters map back to their color\n";

	assert(char_to_color('y') == Color::Yellow);
	std::cout << "✓ Lowercase letters accepted\n";

	assert(color_name(Color::Orange) == "Orange");
	std::cout << "✓ Color names\n";
}


void test_encode_decode_codes()
{
	std::cout << "\n[TEST] Code Encode/Decode\n";
	std::cout << "=========================\n";

	Code code = {Color::Red, Color::Green, Color::Blue, Color::Yellow};
	std::string encoded = encode_code(code);
	std::cout << "RGBY → \"" << encoded << "\"\n";
	assert(encoded == "RGBY");

	assert(decode_code("RGBY") == code);
	assert(decode_code("r g b y") == code);
	assert(decode_code(" rGbY\t") == code);
	std::cout << "✓ Case and whitespace ignored when decoding\n";

	assert(encode_code({}) == "");
	assert(decode_code("").empty());
	std::cout << "✓ Empty code\n";

	assert(encode_code(make_palette(6)) == "RGBYOP");
	std::cout << "✓ Default palette is RGBYOP\n";

	assert(encode_feedback(Feedback(2, 1)) == "2-1");
	std::cout << "✓ Feedback notation\n";
}


void test_error_handling()
{
	std::cout << "\n[TEST] Error Handling\n";
	std::cout << "=====================\n";

	bool threw = false;
	try
	{
		decode_code("RGXY");
	}
	catch (const std::invalid_argument& e)
	{
		threw = true;
		std::cout << "Caught: " << e.what() << "\n";
	}
	assert(threw);
	std::cout << "✓ Unknown letter rejected\n";

	threw = false;
	try
	{
		make_palette(11);
	}
	catch (const std::out_of_range&)
	{
		threw = true;
	}
	assert(threw);

	threw = false;
	try
	{
		make_palette(0);
	}
	catch (const std::out_of_range&)
	{
		threw = true;
	}
	assert(threw);
	std::cout << "✓ Palette size outside 1..10 rejected\n";

	threw = false;
	try
	{
		color_to_char(static_cast<Color>(40));
	}
	catch (const std::invalid_argument&)
	{
		threw = true;
	}
	assert(threw);
	std::cout << "✓ Color value outside the enum rejected\n";

	std::cout << "✓ Error handling tests passed\n";
}


int main()
{
	std::cout << "MasterMind Notation Test Suite\n";
	std::cout << "==============================\n";

	try
	{
		test_color_letters();
		test_encode_decode_codes();
		test_error_handling();

		std::cout << "\n" << std::string(70, '=') << "\n";
		std::cout << "✅ ALL TESTS PASSED!\n";
		std::cout << std::string(70, '=') << "\n";

		return 0;
	}
	catch (const std::exception& e)
	{
		std::cerr << "\n❌ TEST FAILED: " << e.what() << std::endl;
		return 1;
	}
}
