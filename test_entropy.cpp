#include "entropy.hpp"
#include "microshard.hpp"
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {
	using microshard::entropy_source;
	using microshard::synchronized_entropy_source;
	using microshard::uuid_t;

	constexpr std::uint64_t MAX_RANDOM = (1ULL << 36) - 1;

	static std::vector<std::uint64_t> draw(entropy_source& src, std::size_t n){
		std::vector<std::uint64_t> out(n);
		std::generate(out.begin(), out.end(), [&]{ return src.next_random(); });
		return out;
	}

	// Counts upward; lets tests see exactly what a factory drew.
	struct counting_source{
		std::uint64_t next = 0;
		std::size_t calls = 0;
		std::uint64_t next_random() noexcept{
			++calls;
			return next++;
		}
	};
	static_assert(microshard::random_source<counting_source>);

	TEST(Entropy, SameSeedSameStream){
		entropy_source a{12345};
		entropy_source b{12345};
		EXPECT_EQ(a, b);
		EXPECT_EQ(draw(a, 1000), draw(b, 1000));
	}

	TEST(Entropy, DifferentSeedsDiverge){
		entropy_source a{1};
		entropy_source b{2};
		EXPECT_NE(draw(a, 16), draw(b, 16));
	}

	TEST(Entropy, ZeroSeedIsRemapped){
		EXPECT_EQ(entropy_source::non_zero(0), entropy_source::fallback_seed);
		EXPECT_EQ(entropy_source::non_zero(7), 7u);
		entropy_source zero{0};
		entropy_source fallback{entropy_source::fallback_seed};
		EXPECT_EQ(zero, fallback);
		EXPECT_EQ(draw(zero, 64), draw(fallback, 64));
	}

	TEST(Entropy, DrawsFitIn36Bits){
		entropy_source src{0xC0FFEE};
		std::uint64_t seen_or = 0;
		for(int i = 0; i < 100000; ++i){
			const auto r = src.next_random();
			ASSERT_LE(r, MAX_RANDOM);
			seen_or |= r;
		}
		// every one of the 36 bit positions gets set at least once
		EXPECT_EQ(seen_or, MAX_RANDOM);
	}

	TEST(Entropy, DrawIsTheLowBitsOfTheEngineOutput){
		entropy_source src{777};
		entropy_source::PRNG engine{777ULL};
		for(int i = 0; i < 1000; ++i){
			EXPECT_EQ(src.next_random(), engine.next() & MAX_RANDOM);
		}
	}

	TEST(Entropy, DrawsDoNotRepeatQuickly){
		entropy_source src{99};
		const auto values = draw(src, 10000);
		const std::unordered_set<std::uint64_t> unique(values.begin(), values.end());
		EXPECT_GE(unique.size(), values.size() - 2);
	}

	TEST(Entropy, SplitGivesAnIndependentStream){
		entropy_source parent{42};
		entropy_source untouched{42};
		auto child = parent.split();
		EXPECT_NE(parent, untouched); // splitting advances the parent
		EXPECT_NE(draw(child, 16), draw(parent, 16));

		// and is itself reproducible
		entropy_source again{42};
		auto child_again = again.split();
		entropy_source replay{42};
		auto child_replay = replay.split();
		EXPECT_EQ(draw(child_again, 32), draw(child_replay, 32));
	}

	TEST(Entropy, DefaultSeedingDiffersBetweenInstances){
		entropy_source a{};
		entropy_source b{};
		EXPECT_NE(draw(a, 4), draw(b, 4));
	}

	TEST(Entropy, ThreadLocalSourceIsPerThread){
		auto* mine = &entropy_source::for_this_thread();
		EXPECT_EQ(mine, &entropy_source::for_this_thread());

		entropy_source* theirs = nullptr;
		std::thread t([&]{ theirs = &entropy_source::for_this_thread(); });
		t.join();
		EXPECT_NE(mine, theirs);
	}

	TEST(Entropy, SynchronizedSourceIsReproducibleWhenSeeded){
		synchronized_entropy_source a{5};
		entropy_source b{5};
		for(int i = 0; i < 100; ++i){
			EXPECT_EQ(a.next_random(), b.next_random());
		}
	}

	// Seeded, so the set of draws is fixed whatever the interleaving: every
	// value of the single-threaded stream must come out exactly once.
	TEST(Entropy, SharedSynchronizedSourceAcrossThreads){
		constexpr int THREADS = 8;
		constexpr int PER_THREAD = 5000;
		constexpr std::uint64_t SEED = 0x5EED;
		synchronized_entropy_source shared{SEED};
		std::vector<std::vector<uuid_t>> per_thread(THREADS);
		std::vector<std::thread> workers;
		for(int t = 0; t < THREADS; ++t){
			workers.emplace_back([&, t]{
				auto& out = per_thread[t];
				out.reserve(PER_THREAD);
				for(int i = 0; i < PER_THREAD; ++i){
					// same instant, same shard: only the random bits tell them apart
					auto id = uuid_t::from_micros(1'672'531'200'000'000u, 3, shared);
					if(id){
						out.push_back(*id);
					}
				}
			});
		}
		for(auto& w : workers){
			w.join();
		}
		std::vector<std::uint64_t> drawn;
		drawn.reserve(THREADS * PER_THREAD);
		for(const auto& ids : per_thread){
			ASSERT_EQ(ids.size(), static_cast<std::size_t>(PER_THREAD));
			for(const auto& id : ids){
				drawn.push_back(id.random_bits());
			}
		}
		entropy_source reference{SEED};
		auto expected = draw(reference, THREADS * PER_THREAD);
		std::sort(drawn.begin(), drawn.end());
		std::sort(expected.begin(), expected.end());
		EXPECT_EQ(drawn, expected);
	}

	TEST(Entropy, PerThreadGenerationIsUnique){
		constexpr int THREADS = 8;
		constexpr int PER_THREAD = 5000;
		std::mutex mutex;
		std::unordered_set<uuid_t> all;
		std::vector<std::thread> workers;
		for(int t = 0; t < THREADS; ++t){
			workers.emplace_back([&]{
				std::vector<uuid_t> local;
				local.reserve(PER_THREAD);
				for(int i = 0; i < PER_THREAD; ++i){
					auto id = uuid_t::generate(11);
					if(id){
						local.push_back(*id);
					}
				}
				std::lock_guard lock(mutex);
				all.insert(local.begin(), local.end());
			});
		}
		for(auto& w : workers){
			w.join();
		}
		EXPECT_EQ(all.size(), static_cast<std::size_t>(THREADS * PER_THREAD));
	}

	TEST(Entropy, CustomSourceFeedsTheRandomField){
		counting_source src{.next = 0xABC};
		auto first = uuid_t::from_micros(1000, 1, src);
		auto second = uuid_t::from_micros(1000, 1, src);
		ASSERT_TRUE(first && second);
		EXPECT_EQ(first->random_bits(), 0xABCu);
		EXPECT_EQ(second->random_bits(), 0xABDu);
		EXPECT_LT(*first, *second);
		EXPECT_EQ(src.calls, 2u);
	}

	TEST(Entropy, CustomSourceIsMaskedTo36Bits){
		counting_source src{.next = ~0ULL};
		auto id = uuid_t::from_micros(1000, 1, src);
		ASSERT_TRUE(id);
		EXPECT_EQ(id->random_bits(), MAX_RANDOM);
		EXPECT_EQ(id->shard_id(), 1u);
		EXPECT_EQ(id->timestamp_micros(), 1000u);
	}

	TEST(Entropy, RejectedRequestsDrawNothing){
		counting_source src{};
		EXPECT_FALSE(uuid_t::from_micros(1ULL << 54, 1, src));
		EXPECT_FALSE(uuid_t::from_iso("not a timestamp", 1, src));
		EXPECT_EQ(src.calls, 0u);
	}

} // namespace
