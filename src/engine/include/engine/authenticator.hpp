#pragma once

#include "engine/types.hpp"

#include <optional>
#include <string>

namespace banchess::engine {

struct Credentials {
	std::string userId;
	std::string username;
	std::string token; //!< Shared secret. Empty in guest mode.
};

//! Boundary to the identity provider.
class IAuthenticator {
public:
	virtual ~IAuthenticator() = default;

	//! Returns the identity for valid credentials, empty otherwise.
	virtual std::optional<Identity> authenticate(const Credentials& credentials) const = 0;
};

//! Accepts well-formed guest identities.
//! User id: 1-64 characters of [A-Za-z0-9_-]. Display name: 1-32 printable characters.
//! A non-empty token must be presented by every client.
class GuestAuthenticator final : public IAuthenticator {
public:
	explicit GuestAuthenticator(std::string token = {});

	std::optional<Identity> authenticate(const Credentials& credentials) const override;

private:
	std::string m_token;
};

} // namespace banchess::engine
