#pragma once
#include "random.hpp" //grab from: https://github.com/ulfben/cpp_prngs/
#include "romuduojr.hpp" //grab from: https://github.com/ulfben/cpp_prngs/
#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <random>
#include <thread>

// Supplies the 36 random bits of every identifier.
//
// Not a CSPRNG. Ids minted in the same microsecond for the same shard are
// told apart by these bits alone.
//
// An entropy_source is a plain value owned by one thread. Either give each
// thread its own (split() or for_this_thread()), or share one
// synchronized_entropy_source, which serializes draws behind a mutex.

namespace microshard{

	template<class S>
	concept random_source = requires(S& s){
		{ s.next_random() } -> std::same_as<std::uint64_t>;
	};

	class entropy_source final{
	public:
		using PRNG = rnd::Random<RomuDuoJr>;

		static constexpr unsigned width = 36;
		static constexpr std::uint64_t mask = (std::uint64_t{1} << width) - 1;
		static constexpr std::uint64_t fallback_seed = 0x9E37'79B9'7F4A'7C15ULL;

		// Seeded from the OS entropy device mixed with the clock and thread id.
		entropy_source() noexcept : entropy_source(nondeterministic_seed()){}

		// Reproducible stream, for tests and deterministic backfills.
		explicit constexpr entropy_source(std::uint64_t seed) noexcept : rng(PRNG{non_zero(seed)}){}

		// One draw: the next engine output masked to its low 36 bits.
		[[nodiscard]] constexpr std::uint64_t next_random() noexcept{
			return rng.next() & mask;
		}

		// A decorrelated child stream, e.g. to hand to a worker thread.
		// Advances this source.
		[[nodiscard]] constexpr entropy_source split() noexcept{
			return entropy_source{rng.split()};
		}

		// Lazily seeded on first use in each thread, never shared.
		[[nodiscard]] static entropy_source& for_this_thread() noexcept{
			static thread_local entropy_source source{};
			return source;
		}

		[[nodiscard]] static std::uint64_t nondeterministic_seed() noexcept{
			using namespace std::chrono;
			std::uint64_t seed = static_cast<std::uint64_t>(
				high_resolution_clock::now().time_since_epoch().count());
			seed ^= static_cast<std::uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id())) * 0xBF58'476D'1CE4'E5B9ULL;
			try{
				std::random_device rd;
				const std::uint64_t hi = rd();
				const std::uint64_t lo = rd();
				seed ^= (hi << 32) | lo;
			} catch(const std::exception&){
				// no entropy device on this platform; clock and thread id remain
			}
			return seed;
		}

		// Seed 0 is remapped to fallback_seed.
		[[nodiscard]] static constexpr std::uint64_t non_zero(std::uint64_t seed) noexcept{
			return seed != 0 ? seed : fallback_seed;
		}

		constexpr bool operator==(const entropy_source&) const noexcept = default;

	private:
		explicit constexpr entropy_source(PRNG engine) noexcept : rng(engine){}

		PRNG rng;
	};

	class synchronized_entropy_source final{
	public:
		synchronized_entropy_source() noexcept = default;
		explicit synchronized_entropy_source(std::uint64_t seed) noexcept : source(seed){}

		synchronized_entropy_source(const synchronized_entropy_source&) = delete;
		synchronized_entropy_source& operator=(const synchronized_entropy_source&) = delete;

		[[nodiscard]] std::uint64_t next_random(){
			std::lock_guard lock(mutex);
			return source.next_random();
		}

	private:
		std::mutex mutex;
		entropy_source source{};
	};

	static_assert(random_source<entropy_source>);
	static_assert(random_source<synchronized_entropy_source>);

} //namespace microshard
