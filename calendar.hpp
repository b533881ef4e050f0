#pragma once
#include <cstdint>

// Proleptic Gregorian calendar arithmetic relative to the unix epoch
// (1970-01-01). Everything here is constexpr.
//
//   date_to_days()  civil date -> days since epoch (closed form from year 0)
//   days_to_civil() days since epoch -> civil date (era / shifted-March form)
//
// The two are exact inverses for every date from 0001-01-01 through
// 9999-12-31, which covers everything the ISO-8601 parser can produce.

namespace microshard::calendar{

	struct civil_date final{
		std::int64_t year = 1970;
		unsigned month = 1; // 1..12
		unsigned day = 1;   // 1..31
		constexpr bool operator==(const civil_date&) const noexcept = default;
	};

	struct civil_time final{
		std::int64_t year = 1970;
		unsigned month = 1;
		unsigned day = 1;
		unsigned hour = 0;
		unsigned minute = 0;
		unsigned second = 0;
		constexpr bool operator==(const civil_time&) const noexcept = default;
	};

	inline constexpr std::int64_t seconds_per_day = 86'400;
	inline constexpr std::int64_t days_per_era = 146'097;     // 400 Gregorian years
	inline constexpr std::int64_t days_year0_to_epoch = 719'162; // 0001-01-01 .. 1970-01-01
	inline constexpr std::int64_t days_march0_to_epoch = 719'468; // 0000-03-01 .. 1970-01-01

	[[nodiscard]] constexpr bool is_leap(std::int64_t year) noexcept{
		return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
	}

	// 0 for a month outside 1..12, so callers can use it as a range check
	[[nodiscard]] constexpr unsigned days_in_month(std::int64_t year, unsigned month) noexcept{
		constexpr unsigned lengths[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
		if(month < 1 || month > 12){
			return 0;
		}
		if(month == 2 && is_leap(year)){
			return 29;
		}
		return lengths[month - 1];
	}

	// Signed: dates before 1970-01-01 give negative counts.
	// Preconditions: year >= 1, month in 1..12, day in 1..days_in_month.
	[[nodiscard]] constexpr std::int64_t date_to_days(std::int64_t year, unsigned month, unsigned day) noexcept{
		constexpr std::int64_t days_before_month[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};
		const std::int64_t y = year - 1; // completed years
		std::int64_t days = y * 365 + y / 4 - y / 100 + y / 400;
		days -= days_year0_to_epoch;
		days += days_before_month[month - 1];
		if(month > 2 && is_leap(year)){
			++days;
		}
		return days + static_cast<std::int64_t>(day) - 1;
	}

	// Years counted from March 1st, leap day last.
	[[nodiscard]] constexpr civil_date days_to_civil(std::int64_t days) noexcept{
		const std::int64_t z = days + days_march0_to_epoch;
		const std::int64_t era = (z >= 0 ? z : z - (days_per_era - 1)) / days_per_era;
		const std::int64_t doe = z - era * days_per_era;                               // [0, 146096]
		const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // [0, 399]
		const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);              // [0, 365]
		const std::int64_t mp = (5 * doy + 2) / 153;                                    // [0, 11], 0 = March
		const auto day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
		const auto month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
		const std::int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);
		return civil_date{year, month, day};
	}

	[[nodiscard]] constexpr civil_time seconds_to_civil(std::int64_t seconds) noexcept{
		std::int64_t days = seconds / seconds_per_day;
		std::int64_t rem = seconds % seconds_per_day;
		if(rem < 0){ // floor, not truncate, for instants before the epoch
			rem += seconds_per_day;
			--days;
		}
		const auto date = days_to_civil(days);
		const auto tod = static_cast<unsigned>(rem);
		return civil_time{date.year, date.month, date.day, tod / 3600, (tod % 3600) / 60, tod % 60};
	}

} //namespace microshard::calendar
