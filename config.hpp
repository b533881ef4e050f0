#pragma once
#include <glog/logging.h>
#include <charconv>
#include <concepts>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

// Settings for the msuuid tool. Each value has a compiled-in default that an
// environment variable may override; command-line flags override both.

namespace microshard{

	template<std::integral T>
	class config_value final{
	public:
		constexpr config_value(T default_value, std::string_view env_var) noexcept
			: fallback(default_value), env(env_var){}

		// The env value if it parses as a T, else the default. A malformed or
		// out-of-range env value is logged and ignored.
		[[nodiscard]] T get() const{
			if(auto v = from_env()){
				return *v;
			}
			return fallback;
		}

		[[nodiscard]] std::string_view env_var() const noexcept{ return env; }

	private:
		T fallback;
		std::string_view env;

		[[nodiscard]] std::optional<T> from_env() const{
			const std::string name{env};
			const char* raw = std::getenv(name.c_str());
			if(raw == nullptr){
				return std::nullopt;
			}
			const std::string_view text{raw};
			T v{};
			auto rc = std::from_chars(text.data(), text.data() + text.size(), v);
			if(rc.ec != std::errc{} || rc.ptr != text.data() + text.size()){
				LOG(WARNING) << "Ignoring " << name << "=\"" << text << "\": not a valid value, using " << fallback;
				return std::nullopt;
			}
			return v;
		}
	};

	struct tool_config final{
		config_value<std::uint32_t> shard_id{0, "MSUUID_SHARD_ID"};
		config_value<int> verbosity{0, "MSUUID_LOG_LEVEL"};
	};

} //namespace microshard
