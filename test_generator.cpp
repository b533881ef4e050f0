#include "generator.hpp"
#include <chrono>
#include <cstdint>
#include <gtest/gtest.h>
#include <unordered_set>
#include <utility>

namespace {
	using microshard::entropy_source;
	using microshard::errc;
	using microshard::generator;
	using microshard::uuid_t;

	TEST(Generator, CreateKeepsTheShard){
		auto gen = generator::create(42);
		ASSERT_TRUE(gen);
		EXPECT_EQ(gen->shard_id(), 42u);

		auto top = generator::create(0xFFFF'FFFFu);
		ASSERT_TRUE(top);
		EXPECT_EQ(top->shard_id(), 0xFFFF'FFFFu);
	}

	TEST(Generator, NextStampsShardAndCurrentTime){
		auto gen = generator::create(7);
		ASSERT_TRUE(gen);
		const auto before = std::chrono::duration_cast<std::chrono::microseconds>(
			uuid_t::clock::now().time_since_epoch()).count();
		auto id = gen->next();
		const auto after = std::chrono::duration_cast<std::chrono::microseconds>(
			uuid_t::clock::now().time_since_epoch()).count();
		ASSERT_TRUE(id);
		EXPECT_EQ(id->shard_id(), 7u);
		EXPECT_EQ(id->version(), 8u);
		EXPECT_EQ(id->variant(), 2u);
		EXPECT_GE(id->timestamp_micros(), static_cast<std::uint64_t>(before));
		EXPECT_LE(id->timestamp_micros(), static_cast<std::uint64_t>(after));
	}

	TEST(Generator, NextIsUniqueAndNonDecreasingInTime){
		auto gen = generator::create(1);
		ASSERT_TRUE(gen);
		std::unordered_set<uuid_t> seen;
		std::uint64_t last = 0;
		for(int i = 0; i < 10000; ++i){
			auto id = gen->next();
			ASSERT_TRUE(id);
			ASSERT_TRUE(seen.insert(*id).second) << *id;
			EXPECT_GE(id->timestamp_micros(), last);
			last = id->timestamp_micros();
		}
	}

	TEST(Generator, BackfillFromMicros){
		auto gen = generator::create(5);
		ASSERT_TRUE(gen);
		auto id = gen->from_micros(1'672'531'200'000'000u);
		ASSERT_TRUE(id);
		EXPECT_EQ(id->timestamp_micros(), 1'672'531'200'000'000u);
		EXPECT_EQ(id->shard_id(), 5u);
	}

	TEST(Generator, BackfillFromIso){
		auto gen = generator::create(9);
		ASSERT_TRUE(gen);
		auto id = gen->from_iso("2025-12-12T10:00:00.123456Z");
		ASSERT_TRUE(id);
		EXPECT_EQ(id->timestamp_micros(), 1'765'533'600'123'456u);
		EXPECT_EQ(id->shard_id(), 9u);
		EXPECT_EQ(id->to_iso_string(), "2025-12-12T10:00:00.123456Z");
	}

	TEST(Generator, BackfillFromTimePoint){
		auto gen = generator::create(3);
		ASSERT_TRUE(gen);
		const auto tp = uuid_t::clock::time_point{} + std::chrono::microseconds{1'709'200'800'000'000};
		auto id = gen->from_time(tp);
		ASSERT_TRUE(id);
		EXPECT_EQ(id->timestamp_micros(), 1'709'200'800'000'000u);
		EXPECT_EQ(id->to_iso_string(), "2024-02-29T10:00:00.000000Z");
	}

	TEST(Generator, ErrorsPropagate){
		auto gen = generator::create(3);
		ASSERT_TRUE(gen);

		auto overflow = gen->from_micros(1ULL << 54);
		ASSERT_FALSE(overflow);
		EXPECT_EQ(overflow.error().code, errc::time_overflow);
		EXPECT_EQ(overflow.error().observed, 1ULL << 54);

		auto bad_iso = gen->from_iso("2023-02-29T00:00:00Z");
		ASSERT_FALSE(bad_iso);
		EXPECT_EQ(bad_iso.error().code, errc::invalid_iso_format);

		auto too_late = gen->from_iso("2541-01-01T00:00:00Z");
		ASSERT_FALSE(too_late);
		EXPECT_EQ(too_late.error().code, errc::time_overflow);

		auto pre_epoch = gen->from_time(uuid_t::clock::time_point{} - std::chrono::seconds{1});
		ASSERT_FALSE(pre_epoch);
		EXPECT_EQ(pre_epoch.error().code, errc::system_time_error);
		EXPECT_EQ(pre_epoch.error().observed, 1'000'000u);
	}

	TEST(Generator, SeededGeneratorsAreReproducible){
		auto a = generator::create(77, entropy_source{2024});
		auto b = generator::create(77, entropy_source{2024});
		ASSERT_TRUE(a && b);
		for(std::uint64_t micros = 0; micros < 1000; ++micros){
			auto x = a->from_micros(micros);
			auto y = b->from_micros(micros);
			ASSERT_TRUE(x && y);
			EXPECT_EQ(*x, *y);
		}
	}

	TEST(Generator, SameInstantDifferentRandomBits){
		auto gen = generator::create(77, entropy_source{1});
		ASSERT_TRUE(gen);
		auto x = gen->from_micros(1'000'000);
		auto y = gen->from_micros(1'000'000);
		ASSERT_TRUE(x && y);
		EXPECT_EQ(x->timestamp_micros(), y->timestamp_micros());
		EXPECT_EQ(x->shard_id(), y->shard_id());
		EXPECT_NE(x->random_bits(), y->random_bits());
	}

	TEST(Generator, GeneratorsAreMovable){
		auto gen = generator::create(12, entropy_source{8});
		ASSERT_TRUE(gen);
		generator moved = std::move(*gen);
		EXPECT_EQ(moved.shard_id(), 12u);
		EXPECT_TRUE(moved.next());
	}

} // namespace
