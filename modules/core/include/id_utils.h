#ifndef ID_UTILS_H
#define ID_UTILS_H

#include <cstddef>
#include <string>

/**
 * @brief Short lowercase-hex room code (default 8 chars, like a truncated UUID).
 * Drawn from libsodium's CSPRNG so codes are not guessable.
 */
std::string generate_room_id(size_t length = 8);

/**
 * @brief Peer identity of the form "id_<9 random base36><base36 millis>".
 */
std::string generate_peer_id();

/**
 * @brief Random UUID (version 4) naming one offered file.
 */
std::string generate_file_id();

/**
 * @brief 32 hex chars binding an accepted data channel to its negotiation.
 */
std::string generate_channel_token();

/**
 * @brief Constant-time comparison for channel tokens.
 */
bool tokens_equal(const std::string& a, const std::string& b);

#endif // ID_UTILS_H
