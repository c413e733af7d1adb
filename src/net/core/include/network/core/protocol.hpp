#pragma once

#include <bit>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include <string>

namespace banchess::network::core {

using ConnectionId = std::uint32_t; //!< Identifies a connection on network layer. Starts at 1.
using Message      = std::string;   //!< Message type.

inline constexpr std::uint16_t DEFAULT_PORT = 12345;

//! Maximum payload we write and clients read. Full snapshots carry the whole history with a position per entry.
//! The longest game the fifty move rule allows encodes to roughly 4 MiB.
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 8 * 1024 * 1024;

inline constexpr std::uint32_t MAX_REQUEST_BYTES = 64 * 1024; //!< Maximum payload the server reads from a client.

inline constexpr std::size_t DEFAULT_MAX_QUEUED_MESSAGES = 256; //!< Outbound messages per connection before it is dropped.
inline constexpr std::chrono::seconds DEFAULT_IDLE_TIMEOUT{60}; //!< Close connections that stay silent this long.

//! Variable-sized packets are prefixed with the payload size in network byte order.
struct BasicMessageHeader {
	std::uint32_t payload_size{};
};

constexpr std::uint32_t byteswap_u32(std::uint32_t value) {
	return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) | ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

constexpr std::uint32_t to_network_u32(std::uint32_t value) {
	if constexpr (std::endian::native == std::endian::big) {
		return value;
	}
	return byteswap_u32(value);
}

constexpr std::uint32_t from_network_u32(std::uint32_t value) {
	return to_network_u32(value);
}

} // namespace banchess::network::core
