#pragma once
#include "errors.hpp"
#include <cstdint>
#include <optional>

// Range and marker checks shared by the codec, the ISO-8601 parser and the
// generator. Each returns the error to report, or std::nullopt when the
// value is acceptable.

namespace microshard{

	inline constexpr std::uint64_t max_shard_id = 0xFFFF'FFFFULL;          // 2^32 - 1
	inline constexpr std::uint64_t max_timestamp_micros = (1ULL << 54) - 1; // 2540-11-07T23:35:09.481983Z
	inline constexpr std::uint64_t max_random = (1ULL << 36) - 1;
	inline constexpr std::uint64_t version_marker = 8;
	inline constexpr std::uint64_t variant_marker = 2; // binary 10

	// Always passes for a native 32-bit shard. Deployments that carve the
	// shard space narrower (e.g. 16 bits of region + 16 of node) pass their
	// own upper bound.
	[[nodiscard]] constexpr std::optional<error> check_shard_id(std::uint64_t shard_id, std::uint64_t max = max_shard_id) noexcept{
		if(shard_id > max || shard_id > max_shard_id){
			return error{errc::invalid_shard_id, shard_id};
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::optional<error> check_timestamp(std::uint64_t micros) noexcept{
		if(micros > max_timestamp_micros){
			return error{errc::time_overflow, micros};
		}
		return std::nullopt;
	}

	// bits 79..76 of the identifier, i.e. bits 15..12 of the high word
	[[nodiscard]] constexpr std::optional<error> check_version(std::uint64_t high) noexcept{
		const auto version = (high >> 12) & 0xFu;
		if(version != version_marker){
			return error{errc::invalid_version, version};
		}
		return std::nullopt;
	}

	// bits 63..62 of the identifier, i.e. the top two bits of the low word
	[[nodiscard]] constexpr std::optional<error> check_variant(std::uint64_t low) noexcept{
		const auto variant = low >> 62;
		if(variant != variant_marker){
			return error{errc::invalid_variant, variant};
		}
		return std::nullopt;
	}

} //namespace microshard
