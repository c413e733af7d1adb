#include "engine/authenticator.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace banchess::engine {

static constexpr std::size_t MAX_USER_ID_LENGTH  = 64;
static constexpr std::size_t MAX_USERNAME_LENGTH = 32;

static bool isValidUserId(const std::string& userId) {
	if (userId.empty() || userId.size() > MAX_USER_ID_LENGTH) {
		return false;
	}
	return std::ranges::all_of(userId, [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-'; });
}

static bool isValidUsername(const std::string& username) {
	if (username.empty() || username.size() > MAX_USERNAME_LENGTH) {
		return false;
	}
	return std::ranges::all_of(username, [](char c) { return std::isprint(static_cast<unsigned char>(c)); });
}

GuestAuthenticator::GuestAuthenticator(std::string token) : m_token(std::move(token)) {
}

std::optional<Identity> GuestAuthenticator::authenticate(const Credentials& credentials) const {
	if (!m_token.empty() && credentials.token != m_token) {
		return {};
	}
	if (!isValidUserId(credentials.userId) || !isValidUsername(credentials.username)) {
		return {};
	}
	return Identity{.userId = credentials.userId, .displayName = credentials.username};
}

} // namespace banchess::engine
