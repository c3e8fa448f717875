/**
 * GameRecorder Implementation
 */

#include "../include/game_recorder.hpp"
#include "../include/mastermind_notation.hpp"
#include <openssl/sha.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>


namespace mastermind
{


SessionRecord::SessionRecord()
	: result(SessionState::InProgress)
{
}


std::string sha256_short(const std::string& data)
{
	unsigned char hash[SHA256_DIGEST_LENGTH];
	SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

	std::ostringstream oss;
	for (int i = 0; i < 8; i++)  // First 8 bytes = 16 hex chars
	{
		oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
	}
	return oss.str();
}


SessionRecord GameRecorder::record_session(const GameSession& session)
{
	auto secret = session.get_secret();
	if (!secret.has_value())
	{
		throw std::runtime_error("Cannot record a session that is still in progress");
	}

	SessionRecord record;
	record.config = session.get_config();
	record.attempts = session.get_history();
	record.result = session.get_state();
	record.secret = *secret;
	record.hint = session.get_hint();

	return record;
}


std::string GameRecorder::to_mmn(const SessionRecord& record)
{
	std::ostringstream mmn;

	// Identical games produce identical text, and so the same record id
	mmn << "[Palette " << encode_code(record.config.palette) << "]\n";
	mmn << "[Length " << record.config.length << "]\n";
	mmn << "[MaxAttempts " << record.config.max_attempts << "]\n";
	if (!record.config.allow_repeats)
	{
		mmn << "[Repeats No]\n";
	}
	mmn << "[Result " << state_to_string(record.result) << "]\n";
	if (record.hint.has_value())
	{
		mmn << "[Hint " << (record.hint->position + 1) << "=" << color_to_char(record.hint->color) << "]\n";
	}

	mmn << "\n";

	for (const auto& attempt : record.attempts)
	{
		mmn << (attempt.turn_index + 1) << ". "
		    << encode_code(attempt.guess) << " "
		    << encode_feedback(attempt.feedback) << "\n";
	}

	mmn << "; " << encode_code(record.secret) << "\n";

	return mmn.str();
}


std::string GameRecorder::record_id(const SessionRecord& record)
{
	return sha256_short(to_mmn(record));
}


std::string GameRecorder::save_mmn(const SessionRecord& record, const std::string& dir)
{
	std::string content = to_mmn(record);
	std::string filename = dir + "/game_" + sha256_short(content) + ".mmn";

	std::ofstream file(filename);
	if (!file.is_open())
	{
		return "";
	}

	file << content;
	file.close();
	return filename;
}


}  // namespace mastermind
