#pragma once
#include "entropy.hpp"
#include "errors.hpp"
#include "iso8601.hpp"
#include "validation.hpp"
#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

// MicroShard UUID is fundamentally:
// - a 128-bit unsigned integer
// - serialized to 16 big-endian bytes
// - printed as a standard lowercase 8-4-4-4-12 UUID string
//
// The 128 bits are laid out thusly (MSB first):
//   - 48 bits: time_high   \ 54-bit microsecond timestamp since the unix
//   -  4 bits: version = 8  |  epoch, split around the version nibble
//   -  6 bits: time_low    /  (valid until 2540-11-07T23:35:09.481983Z)
//   -  6 bits: shard_high  \ 32-bit shard id, split around the variant
//   -  2 bits: variant = 2  |
//   - 26 bits: shard_low   /
//   - 36 bits: random
//
// The timestamp fills the most significant bits, so ids sort by creation
// time whether compared as integers, as bytes or as strings. Ids minted in
// the same microsecond order by shard, then by their random bits.
//
// This header provides:
//
//   - uuid_t::generate(shard)
//       Current wall-clock time, the given shard, 36 bits from an entropy
//       source. Fails with system_time_error if the clock reads before 1970.
//
//   - uuid_t::from_micros(micros, shard), from_time(tp, shard),
//     from_iso("2025-12-12T10:00:00.123456Z", shard)
//       Backfill ids for a known instant. Fail with time_overflow past the
//       54-bit limit, or invalid_iso_format for a malformed string.
//
//   - uuid_t::build(micros, shard, random_bits)
//       Fully deterministic; nothing is drawn.
//
//   - id.time(), id.timestamp_micros(), id.to_iso_string()
//       The creation instant as a sys_time<microseconds>, raw count, or text.
//
//   - uuid_t::from_bytes(), from_u128(), from_string()
//       Strict import. Anything not carrying version 8 and variant 2 is
//       rejected with invalid_version / invalid_variant.
//
// Every factory has an overload taking an explicit random_source. The ones
// without draw from entropy_source::for_this_thread().

namespace microshard{

	// An unsigned 128-bit value as two words, ordered by high then low.
	struct u128 final{
		std::uint64_t high = 0;
		std::uint64_t low = 0;
		constexpr auto operator<=>(const u128&) const noexcept = default;
	};

	class uuid_t final{
	public:
		using byte = std::uint8_t;
		using clock = std::chrono::system_clock;
		using micro_time = std::chrono::sys_time<std::chrono::microseconds>;

		// The nil uuid. No factory returns it; it fails the marker checks.
		constexpr uuid_t() noexcept = default;

		[[nodiscard]] static result<uuid_t> generate(std::uint32_t shard_id) noexcept{
			return generate(shard_id, entropy_source::for_this_thread());
		}

		template<random_source S>
		[[nodiscard]] static result<uuid_t> generate(std::uint32_t shard_id, S& source){
			return from_time(clock::now(), shard_id, source);
		}

		[[nodiscard]] static result<uuid_t> from_time(clock::time_point tp, std::uint32_t shard_id) noexcept{
			return from_time(tp, shard_id, entropy_source::for_this_thread());
		}

		template<random_source S>
		[[nodiscard]] static result<uuid_t> from_time(clock::time_point tp, std::uint32_t shard_id, S& source){
			auto micros = micros_since_epoch(tp);
			if(!micros){
				return micros.error();
			}
			return from_micros(*micros, shard_id, source);
		}

		[[nodiscard]] static result<uuid_t> from_micros(std::uint64_t micros, std::uint32_t shard_id) noexcept{
			return from_micros(micros, shard_id, entropy_source::for_this_thread());
		}

		// Validates before drawing, so a rejected request leaves the source untouched.
		template<random_source S>
		[[nodiscard]] static result<uuid_t> from_micros(std::uint64_t micros, std::uint32_t shard_id, S& source){
			if(auto err = check_shard_id(shard_id)){
				return *err;
			}
			if(auto err = check_timestamp(micros)){
				return *err;
			}
			return pack(micros, shard_id, source.next_random());
		}

		[[nodiscard]] static result<uuid_t> from_iso(std::string_view iso, std::uint32_t shard_id) noexcept{
			return from_iso(iso, shard_id, entropy_source::for_this_thread());
		}

		template<random_source S>
		[[nodiscard]] static result<uuid_t> from_iso(std::string_view iso, std::uint32_t shard_id, S& source){
			auto micros = iso8601::parse(iso);
			if(!micros){
				return micros.error();
			}
			return from_micros(*micros, shard_id, source);
		}

		// Only the low 36 bits of random_bits are used.
		[[nodiscard]] static result<uuid_t> build(std::uint64_t micros, std::uint32_t shard_id, std::uint64_t random_bits) noexcept{
			if(auto err = check_shard_id(shard_id)){
				return *err;
			}
			if(auto err = check_timestamp(micros)){
				return *err;
			}
			return pack(micros, shard_id, random_bits);
		}

		// Version is checked before variant; only the first violation is reported.
		[[nodiscard]] static result<uuid_t> from_u128(u128 value) noexcept{
			if(auto err = check_version(value.high)){
				return *err;
			}
			if(auto err = check_variant(value.low)){
				return *err;
			}
			return uuid_t{value};
		}

		[[nodiscard]] static result<uuid_t> from_bytes(std::span<const byte, 16> bytes) noexcept{
			return from_u128(u128{read_big_endian(bytes.first<8>()), read_big_endian(bytes.last<8>())});
		}

		// Accepts the hyphenated 8-4-4-4-12 form or 32 bare hex digits, in either case.
		[[nodiscard]] static result<uuid_t> from_string(std::string_view s) noexcept{
			const error bad{errc::invalid_uuid_string};
			const bool hyphenated = s.size() == 36;
			if(!hyphenated && s.size() != 32){
				return bad;
			}
			u128 value{};
			unsigned nibbles = 0;
			for(std::size_t i = 0; i < s.size(); ++i){
				if(hyphenated && (i == 8 || i == 13 || i == 18 || i == 23)){
					if(s[i] != '-'){
						return bad;
					}
					continue;
				}
				const auto nibble = decode_hex(s[i]);
				if(!nibble){
					return bad;
				}
				auto& word = nibbles < 16 ? value.high : value.low;
				word = (word << 4) | *nibble;
				++nibbles;
			}
			return from_u128(value);
		}

		[[nodiscard]] constexpr std::uint64_t timestamp_micros() const noexcept{
			const std::uint64_t time_high = (value.high >> 16) & 0xFFFF'FFFF'FFFFULL;
			const std::uint64_t time_low = (value.high >> 6) & 0x3FULL;
			return (time_high << 6) | time_low;
		}

		// Microsecond ticks; the 54-bit range overflows a nanosecond time_point.
		[[nodiscard]] constexpr micro_time time() const noexcept{
			return micro_time{std::chrono::microseconds{static_cast<std::chrono::microseconds::rep>(timestamp_micros())}};
		}

		[[nodiscard]] constexpr std::uint32_t shard_id() const noexcept{
			const std::uint64_t shard_high = value.high & 0x3FULL;
			const std::uint64_t shard_low = (value.low >> 36) & 0x3FF'FFFFULL;
			return static_cast<std::uint32_t>((shard_high << 26) | shard_low);
		}

		[[nodiscard]] constexpr std::uint64_t random_bits() const noexcept{
			return value.low & max_random;
		}

		[[nodiscard]] constexpr unsigned version() const noexcept{
			return static_cast<unsigned>((value.high >> 12) & 0xFu);
		}

		[[nodiscard]] constexpr unsigned variant() const noexcept{
			return static_cast<unsigned>(value.low >> 62);
		}

		[[nodiscard]] constexpr u128 as_u128() const noexcept{
			return value;
		}

		[[nodiscard]] constexpr std::array<byte, 16> as_bytes() const noexcept{
			std::array<byte, 16> bytes{};
			write_big_endian(value.high, std::span<byte, 8>{bytes.data(), 8});
			write_big_endian(value.low, std::span<byte, 8>{bytes.data() + 8, 8});
			return bytes;
		}

		// Rendered from the big-endian bytes, so the text never depends on host byte order.
		[[nodiscard]] std::string to_string() const{
			const auto bytes = as_bytes();
			std::string out(36, '-');
			std::size_t pos = 0;
			for(std::size_t i = 0; i < bytes.size(); ++i){
				if(i == 4 || i == 6 || i == 8 || i == 10){
					++pos; // keep the hyphen
				}
				out[pos++] = HEX[bytes[i] >> 4];
				out[pos++] = HEX[bytes[i] & 0xF];
			}
			return out;
		}

		[[nodiscard]] explicit operator std::string() const{
			return to_string();
		}

		// Cannot fail: a 54-bit timestamp always lands in a four-digit year.
		[[nodiscard]] std::string to_iso_string() const{
			return iso8601::detail::format_unchecked(timestamp_micros());
		}

		constexpr auto operator<=>(const uuid_t&) const noexcept = default;

	private:
		static constexpr char HEX[16] = {
			'0','1','2','3','4','5','6','7',
			'8','9','a','b','c','d','e','f'
		};

		u128 value{};

		explicit constexpr uuid_t(u128 v) noexcept : value(v){}

		[[nodiscard]] static constexpr uuid_t pack(std::uint64_t micros, std::uint32_t shard_id, std::uint64_t random_bits) noexcept{
			const std::uint64_t shard = shard_id;
			const std::uint64_t time_high = (micros >> 6) & 0xFFFF'FFFF'FFFFULL;
			const std::uint64_t time_low = micros & 0x3FULL;
			const std::uint64_t shard_high = (shard >> 26) & 0x3FULL;
			const std::uint64_t shard_low = shard & 0x3FF'FFFFULL;
			return uuid_t{u128{
				(time_high << 16) | (version_marker << 12) | (time_low << 6) | shard_high,
				(variant_marker << 62) | (shard_low << 36) | (random_bits & max_random)
			}};
		}

		[[nodiscard]] static result<std::uint64_t> micros_since_epoch(clock::time_point tp) noexcept{
			using namespace std::chrono;
			const auto us = floor<microseconds>(tp.time_since_epoch()).count();
			if(us < 0){
				return error{errc::system_time_error, std::uint64_t{0} - static_cast<std::uint64_t>(us)};
			}
			return static_cast<std::uint64_t>(us);
		}

		//helpers for moving words in and out of big-endian byte order
		constexpr static void write_big_endian(std::uint64_t v, std::span<byte, 8> out) noexcept{
			for(std::size_t i = 0; i < 8; ++i){
				out[i] = static_cast<byte>((v >> ((7 - i) * 8)) & 0xFF);
			}
		}

		[[nodiscard]] constexpr static std::uint64_t read_big_endian(std::span<const byte, 8> in) noexcept{
			std::uint64_t v = 0;
			for(const byte b : in){
				v = (v << 8) | static_cast<std::uint64_t>(b);
			}
			return v;
		}

		[[nodiscard]] constexpr static std::optional<std::uint64_t> decode_hex(char c) noexcept{
			if(c >= '0' && c <= '9'){ return static_cast<std::uint64_t>(c - '0'); }
			if(c >= 'a' && c <= 'f'){ return static_cast<std::uint64_t>(c - 'a' + 10); }
			if(c >= 'A' && c <= 'F'){ return static_cast<std::uint64_t>(c - 'A' + 10); }
			return std::nullopt;
		}
	};

	inline std::ostream& operator<<(std::ostream& os, const uuid_t& id){
		return os << id.to_string();
	}

} //namespace microshard

namespace std{
	template<>
	struct hash<microshard::uuid_t>{
		[[nodiscard]] std::size_t operator()(const microshard::uuid_t& id) const noexcept{
			const auto v = id.as_u128();
			// shift breaks the symmetry between equal high and low words
			return std::hash<std::uint64_t>{}(v.high) ^ (std::hash<std::uint64_t>{}(v.low) << 1);
		}
	};
} //namespace std
