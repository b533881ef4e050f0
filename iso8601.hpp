#pragma once
#include "calendar.hpp"
#include "errors.hpp"
#include "validation.hpp"
#include <fmt/format.h>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Strict UTC ISO-8601 timestamps with microsecond precision:
//
//   parse("2025-12-12T10:00:00.123456Z") -> 1765533600123456
//   format(1765533600123456)             -> "2025-12-12T10:00:00.123456Z"
//
// parse() accepts exactly YYYY-MM-DDTHH:MM:SS[.f...]Z. The fraction may have
// any number of digits; only the first six count and shorter ones are
// right-padded with zeros. No offsets other than Z, no lowercase t/z, no
// dates before the epoch. Second 60 is accepted and counted as an ordinary
// 60th second (there is no leap-second table).
//
// format() always emits six fractional digits and a four-digit year.

namespace microshard::iso8601{

	inline constexpr std::size_t min_length = 20;       // YYYY-MM-DDTHH:MM:SSZ
	inline constexpr std::size_t formatted_length = 27; // YYYY-MM-DDTHH:MM:SS.ffffffZ

	namespace detail{
		[[nodiscard]] constexpr bool is_digit(char c) noexcept{
			return c >= '0' && c <= '9';
		}

		[[nodiscard]] inline std::optional<unsigned> parse_u32(std::string_view s, std::size_t pos, std::size_t len) noexcept{
			unsigned v{};
			const char* first = s.data() + pos;
			const char* last = first + len;
			auto rc = std::from_chars(first, last, v);
			if(rc.ec != std::errc{} || rc.ptr != last){
				return std::nullopt;
			}
			return v;
		}

		// Caller guarantees micros <= max_timestamp_micros, which keeps the year
		// within four digits.
		[[nodiscard]] inline std::string format_unchecked(std::uint64_t micros){
			const auto t = calendar::seconds_to_civil(static_cast<std::int64_t>(micros / 1'000'000));
			return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
				t.year, t.month, t.day, t.hour, t.minute, t.second, micros % 1'000'000);
		}
	} //namespace detail

	[[nodiscard]] inline result<std::uint64_t> parse(std::string_view s) noexcept{
		const error bad{errc::invalid_iso_format};
		if(s.size() < min_length){
			return bad;
		}
		if(s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':'){
			return bad;
		}

		const auto year = detail::parse_u32(s, 0, 4);
		const auto month = detail::parse_u32(s, 5, 2);
		const auto day = detail::parse_u32(s, 8, 2);
		const auto hour = detail::parse_u32(s, 11, 2);
		const auto minute = detail::parse_u32(s, 14, 2);
		const auto second = detail::parse_u32(s, 17, 2);
		if(!year || !month || !day || !hour || !minute || !second){
			return bad;
		}

		std::size_t pos = 19;
		std::uint64_t fraction = 0;
		if(s[pos] == '.'){
			const std::size_t first = ++pos;
			std::uint64_t scale = 100'000;
			while(pos < s.size() && detail::is_digit(s[pos])){
				if(pos - first < 6){
					fraction += static_cast<std::uint64_t>(s[pos] - '0') * scale;
					scale /= 10;
				}
				++pos;
			}
			if(pos == first){
				return bad; // "." without digits
			}
		}
		if(pos + 1 != s.size() || s[pos] != 'Z'){
			return bad;
		}

		if(*month < 1 || *month > 12 || *hour > 23 || *minute > 59 || *second > 60){
			return bad;
		}
		if(*day < 1 || *day > calendar::days_in_month(*year, *month)){
			return bad;
		}

		const std::int64_t days = calendar::date_to_days(*year, *month, *day);
		if(days < 0){
			return bad;
		}
		const std::uint64_t seconds = static_cast<std::uint64_t>(days) * calendar::seconds_per_day
			+ std::uint64_t{*hour} * 3600 + std::uint64_t{*minute} * 60 + *second;
		return seconds * 1'000'000 + fraction;
	}

	// time_overflow above max_timestamp_micros.
	[[nodiscard]] inline result<std::string> format(std::uint64_t micros){
		if(auto err = check_timestamp(micros)){
			return *err;
		}
		return detail::format_unchecked(micros);
	}

} //namespace microshard::iso8601
