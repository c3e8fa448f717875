/**
 * Game Recorder and MMN Export
 *
 * Records finished sessions and exports them to MMN (MasterMind Notation):
 *
 *   [Palette RGBYOP]
 *   [Length 4]
 *   [MaxAttempts 10]
 *   [Result Won]
 *   [Hint 3=Y]
 *
 *   1. RBGY 2-2
 *   2. RGBY 4-0
 *   ; RGBY
 *
 * Hint positions are 1-based in the text; the [Hint] tag is omitted when
 * no hint was used. Persistence belongs to the drivers, the engine itself
 * never writes records.
 */

#pragma once

#include "game_session.hpp"
#include <string>
#include <vector>
#include <optional>


namespace mastermind
{


struct SessionRecord
{
	GameConfig config;
	std::vector<Attempt> attempts;
	SessionState result;
	Code secret;
	std::optional<Hint> hint;

	SessionRecord();
};


class GameRecorder
{
public:
	/**
	 * Create record from a finished session
	 *
	 * @throws std::runtime_error if the session is still in progress
	 */
	static SessionRecord record_session(const GameSession& session);

	/**
	 * Export record to MMN text
	 */
	static std::string to_mmn(const SessionRecord& record);

	/**
	 * First 16 hex characters of the SHA-256 of the MMN text
	 */
	static std::string record_id(const SessionRecord& record);

	/**
	 * Save record to `<dir>/game_<id>.mmn`
	 *
	 * @return Written file path, or empty string if the file could not be opened
	 */
	static std::string save_mmn(const SessionRecord& record, const std::string& dir);
};


/**
 * Compute SHA256 hash and return first 16 hex characters
 */
std::string sha256_short(const std::string& data);


}  // namespace mastermind
