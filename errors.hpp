#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

// Every fallible operation in this library returns a result<T>: either the
// value or a microshard::error describing what went wrong. Malformed input
// never throws and never aborts. Asking a failed result for its value() is
// a caller bug and surfaces as std::bad_variant_access.

namespace microshard{

	// Closed set. The numeric values are stable and may be logged.
	enum class errc : std::uint8_t{
		invalid_shard_id = 1,
		time_overflow,
		invalid_iso_format,
		system_time_error,
		invalid_version,
		invalid_variant,
		invalid_uuid_string,
	};

	[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept{
		switch(code){
		case errc::invalid_shard_id: return "invalid_shard_id";
		case errc::time_overflow: return "time_overflow";
		case errc::invalid_iso_format: return "invalid_iso_format";
		case errc::system_time_error: return "system_time_error";
		case errc::invalid_version: return "invalid_version";
		case errc::invalid_variant: return "invalid_variant";
		case errc::invalid_uuid_string: return "invalid_uuid_string";
		}
		return "unknown";
	}

	struct error final{
		errc code{};
		std::uint64_t observed = 0; // the offending value, when there is one

		[[nodiscard]] std::string message() const{
			const auto v = std::to_string(observed);
			switch(code){
			case errc::invalid_shard_id:
				return "shard id " + v + " is outside the representable range";
			case errc::time_overflow:
				return "timestamp " + v + "us exceeds 2^54-1 (year 2540)";
			case errc::invalid_iso_format:
				return "timestamp is not a valid YYYY-MM-DDTHH:MM:SS[.ffffff]Z string";
			case errc::system_time_error:
				return "clock reads " + v + "us before the unix epoch";
			case errc::invalid_version:
				return "version nibble is " + v + ", expected 8";
			case errc::invalid_variant:
				return "variant bits are " + v + ", expected 2";
			case errc::invalid_uuid_string:
				return "not a 32 or 36 character hexadecimal uuid";
			}
			return "unknown error";
		}

		constexpr bool operator==(const error&) const noexcept = default;
	};

	inline std::ostream& operator<<(std::ostream& os, const error& err){
		return os << to_string(err.code) << ": " << err.message();
	}

	template<class T>
	class result final{
		static_assert(!std::is_same_v<std::remove_cv_t<T>, microshard::error>, "result<error> is ambiguous");
		std::variant<T, microshard::error> _value;

	public:
		using value_type = T;

		constexpr result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
			: _value(std::in_place_index<0>, std::move(value)){}
		constexpr result(microshard::error err) noexcept
			: _value(std::in_place_index<1>, err){}

		[[nodiscard]] constexpr bool has_value() const noexcept{ return _value.index() == 0; }
		constexpr explicit operator bool() const noexcept{ return has_value(); }

		[[nodiscard]] constexpr const T& value() const&{ return std::get<0>(_value); }
		[[nodiscard]] constexpr T& value() &{ return std::get<0>(_value); }
		[[nodiscard]] constexpr T&& value() &&{ return std::get<0>(std::move(_value)); }

		[[nodiscard]] constexpr const T& operator*() const&{ return value(); }
		[[nodiscard]] constexpr T& operator*() &{ return value(); }
		[[nodiscard]] constexpr const T* operator->() const{ return &value(); }
		[[nodiscard]] constexpr T* operator->(){ return &value(); }

		[[nodiscard]] constexpr const microshard::error& error() const{ return std::get<1>(_value); }

		template<class U>
		[[nodiscard]] constexpr T value_or(U&& fallback) const&{
			return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
		}
	};

} //namespace microshard
