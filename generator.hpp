#pragma once
#include "entropy.hpp"
#include "errors.hpp"
#include "microshard.hpp"
#include "validation.hpp"
#include <cstdint>
#include <string_view>

// A shard-bound id factory: validates the shard once at creation and owns
// its own entropy stream. Meant to be held by one thread (a worker, a
// connection handler); move it, don't share it.
//
//   auto gen = microshard::generator::create(42);
//   if(!gen){ /* bad shard configuration */ }
//   auto id = gen->next();

namespace microshard{

	class generator final{
	public:
		[[nodiscard]] static result<generator> create(std::uint32_t shard_id) noexcept{
			return create(shard_id, entropy_source{});
		}

		[[nodiscard]] static result<generator> create(std::uint32_t shard_id, entropy_source source) noexcept{
			if(auto err = check_shard_id(shard_id)){
				return *err;
			}
			return generator{shard_id, source};
		}

		[[nodiscard]] result<uuid_t> next(){
			return uuid_t::generate(shard, source);
		}

		[[nodiscard]] result<uuid_t> from_micros(std::uint64_t micros){
			return uuid_t::from_micros(micros, shard, source);
		}

		[[nodiscard]] result<uuid_t> from_time(uuid_t::clock::time_point tp){
			return uuid_t::from_time(tp, shard, source);
		}

		[[nodiscard]] result<uuid_t> from_iso(std::string_view iso){
			return uuid_t::from_iso(iso, shard, source);
		}

		[[nodiscard]] constexpr std::uint32_t shard_id() const noexcept{
			return shard;
		}

	private:
		constexpr generator(std::uint32_t shard_id, entropy_source src) noexcept
			: shard(shard_id), source(src){}

		std::uint32_t shard;
		entropy_source source;
	};

} //namespace microshard
