#include "microshard.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <gtest/gtest.h>
#include <random>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace {
	using microshard::errc;
	using microshard::u128;
	using microshard::uuid_t;

	constexpr std::uint64_t MAX_MICROS = (1ULL << 54) - 1;
	constexpr std::uint64_t JAN_2023 = 1'672'531'200'000'000ULL; // 2023-01-01T00:00:00Z

	//helper
	constexpr static bool is_lower_hex(char c) noexcept{
		return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
	}

	// Helper: deterministic id, fails the test if the build is rejected.
	static uuid_t must_build(std::uint64_t micros, std::uint32_t shard, std::uint64_t random = 0){
		auto id = uuid_t::build(micros, shard, random);
		EXPECT_TRUE(id.has_value()) << "build(" << micros << ", " << shard << ") failed: " << id.error();
		return id.value_or(uuid_t{});
	}

	TEST(Microshard, KnownVectorLayout){
		const auto id = must_build(JAN_2023, 1, 0);
		EXPECT_EQ(id.to_string(), "17c4a210-3500-8000-8000-001000000000");
		EXPECT_EQ(id.as_u128().high, 0x17c4a21035008000ULL);
		EXPECT_EQ(id.as_u128().low, 0x8000001000000000ULL);
	}

	TEST(Microshard, KnownVectorAllFieldsSaturated){
		const auto id = must_build(1'672'531'200'123'456ULL, 0xFFFF'FFFFu, (1ULL << 36) - 1);
		EXPECT_EQ(id.to_string(), "17c4a210-3c89-803f-bfff-ffffffffffff");
	}

	TEST(Microshard, FieldsLandAtTheirBitOffsets){
		const auto id = must_build(1, 0xDEAD'BEEFu, 0x1'2345'6789ULL);
		EXPECT_EQ(id.as_u128().high, 0x0000'0000'0000'8077ULL); // time_low=1 at bit 6, shard_high=0x37
		EXPECT_EQ(id.as_u128().low, 0xAADB'EEF1'2345'6789ULL);
		EXPECT_EQ(id.random_bits(), 0x1'2345'6789ULL);
	}

	TEST(Microshard, BuildMasksRandomTo36Bits){
		const auto id = must_build(JAN_2023, 7, ~0ULL);
		EXPECT_EQ(id.random_bits(), (1ULL << 36) - 1);
		EXPECT_EQ(id.shard_id(), 7u);
		EXPECT_EQ(id.variant(), 2u);
	}

	TEST(Microshard, TimestampAndShardRoundtrip){
		const std::array<std::uint64_t, 8> times{0, 1, 63, 64, 65, JAN_2023, MAX_MICROS - 1, MAX_MICROS};
		const std::array<std::uint32_t, 7> shards{0, 1, (1u << 26) - 1, 1u << 26, 0x8000'0000u, 0xDEAD'BEEFu, 0xFFFF'FFFFu};
		for(const auto t : times){
			for(const auto s : shards){
				const auto id = uuid_t::from_micros(t, s);
				ASSERT_TRUE(id.has_value());
				EXPECT_EQ(id->timestamp_micros(), t);
				EXPECT_EQ(id->shard_id(), s);
			}
		}
	}

	TEST(Microshard, RandomizedRoundtrip){
		std::mt19937_64 rng{20250101};
		for(int i = 0; i < 2000; ++i){
			const auto t = rng() & MAX_MICROS;
			const auto s = static_cast<std::uint32_t>(rng());
			const auto id = uuid_t::from_micros(t, s);
			ASSERT_TRUE(id.has_value());
			EXPECT_EQ(id->timestamp_micros(), t);
			EXPECT_EQ(id->shard_id(), s);
		}
	}

	TEST(Microshard, EveryConstructedIdCarriesMarkers){
		for(int i = 0; i < 500; ++i){
			const auto id = uuid_t::generate(static_cast<std::uint32_t>(i * 7919));
			ASSERT_TRUE(id.has_value());
			EXPECT_EQ(id->version(), 8u);
			EXPECT_EQ(id->variant(), 2u);
			const auto bytes = id->as_bytes();
			EXPECT_EQ(bytes[6] >> 4, 8);
			EXPECT_EQ(bytes[8] >> 6, 0b10);
		}
	}

	TEST(Microshard, OverflowBoundary){
		EXPECT_TRUE(uuid_t::from_micros(MAX_MICROS, 5).has_value());

		const auto overflow = uuid_t::from_micros(MAX_MICROS + 1, 5);
		ASSERT_FALSE(overflow.has_value());
		EXPECT_EQ(overflow.error().code, errc::time_overflow);
		EXPECT_EQ(overflow.error().observed, MAX_MICROS + 1);

		const auto built = uuid_t::build(MAX_MICROS + 1, 5, 0);
		ASSERT_FALSE(built.has_value());
		EXPECT_EQ(built.error().code, errc::time_overflow);
	}

	TEST(Microshard, MaxTimestampRendersLastRepresentableInstant){
		const auto id = must_build(MAX_MICROS, 0);
		EXPECT_EQ(id.to_string(), "ffffffff-ffff-8fc0-8000-000000000000");
		EXPECT_EQ(id.to_iso_string(), "2540-11-07T23:35:09.481983Z");
	}

	TEST(Microshard, RejectedBuildDoesNotConsumeEntropy){
		microshard::entropy_source a{99};
		microshard::entropy_source b{99};
		EXPECT_FALSE(uuid_t::from_micros(MAX_MICROS + 1, 1, a).has_value());
		const auto x = uuid_t::from_micros(JAN_2023, 1, a);
		const auto y = uuid_t::from_micros(JAN_2023, 1, b);
		ASSERT_TRUE(x.has_value());
		ASSERT_TRUE(y.has_value());
		EXPECT_EQ(*x, *y);
	}

	TEST(Microshard, ExplicitSourceMakesIdsReproducible){
		microshard::entropy_source a{1234};
		microshard::entropy_source b{1234};
		for(int i = 0; i < 100; ++i){
			const auto x = uuid_t::from_micros(JAN_2023 + i, 3, a);
			const auto y = uuid_t::from_micros(JAN_2023 + i, 3, b);
			ASSERT_TRUE(x.has_value());
			ASSERT_TRUE(y.has_value());
			EXPECT_EQ(*x, *y);
		}
	}

	TEST(Microshard, LaterTimestampAlwaysSortsAfter){
		// worst case for the earlier id: max shard and max random
		const auto early = must_build(JAN_2023, 0xFFFF'FFFFu, ~0ULL);
		const auto late = must_build(JAN_2023 + 1, 0, 0);
		EXPECT_LT(early, late);
		EXPECT_LT(early.to_string(), late.to_string());
		EXPECT_LT(early.as_bytes(), late.as_bytes());
	}

	TEST(Microshard, OrderingAcrossTimeLowCarry){
		// 63 -> 64 moves the carry from time_low into time_high
		const auto a = must_build(63, 0xFFFF'FFFFu, ~0ULL);
		const auto b = must_build(64, 0, 0);
		EXPECT_LT(a, b);
	}

	TEST(Microshard, SortingByValueMatchesSortingByTimestampAndString){
		std::mt19937_64 rng{12345};
		std::vector<uuid_t> ids;
		for(int i = 0; i < 256; ++i){
			ids.push_back(must_build(rng() & MAX_MICROS, static_cast<std::uint32_t>(rng()), rng()));
		}
		auto by_value = ids;
		std::sort(by_value.begin(), by_value.end());

		std::vector<std::string> strings;
		for(const auto& id : ids){
			strings.push_back(id.to_string());
		}
		std::sort(strings.begin(), strings.end());

		for(std::size_t i = 0; i < ids.size(); ++i){
			EXPECT_EQ(by_value[i].to_string(), strings[i]);
			if(i > 0){
				EXPECT_LE(by_value[i - 1].timestamp_micros(), by_value[i].timestamp_micros());
			}
		}
	}

	TEST(Microshard, SameMicrosecondOrdersByShardThenRandom){
		EXPECT_LT(must_build(JAN_2023, 1, 500), must_build(JAN_2023, 2, 0));
		EXPECT_LT(must_build(JAN_2023, 2, 0), must_build(JAN_2023, 2, 1));
	}

	TEST(Microshard, EqualityAndThreeWayComparison){
		const auto a = must_build(JAN_2023, 9, 42);
		const auto b = must_build(JAN_2023, 9, 42);
		EXPECT_EQ(a, b);
		EXPECT_FALSE(a < b);
		EXPECT_FALSE(b < a);
		EXPECT_EQ(a <=> b, std::strong_ordering::equal);
		EXPECT_EQ((u128{1, 0} <=> u128{0, ~0ULL}), std::strong_ordering::greater);
	}

	TEST(Microshard, ToStringHasCanonicalShape){
		const auto id = uuid_t::generate(77);
		ASSERT_TRUE(id.has_value());
		const auto s = id->to_string();
		ASSERT_EQ(s.size(), 36u);
		for(std::size_t i = 0; i < s.size(); ++i){
			if(i == 8 || i == 13 || i == 18 || i == 23){
				EXPECT_EQ(s[i], '-');
			} else{
				EXPECT_TRUE(is_lower_hex(s[i])) << "Unexpected character " << s[i] << " at " << i;
			}
		}
		EXPECT_EQ(s[14], '8'); // version nibble
		EXPECT_EQ(static_cast<std::string>(*id), s);
	}

	TEST(Microshard, StringRoundtrip){
		for(int i = 0; i < 1000; ++i){
			const auto id = uuid_t::generate(static_cast<std::uint32_t>(i));
			ASSERT_TRUE(id.has_value());
			const auto parsed = uuid_t::from_string(id->to_string());
			ASSERT_TRUE(parsed.has_value()) << "Failed to parse: " << *id;
			EXPECT_EQ(*parsed, *id);
		}
	}

	TEST(Microshard, FromStringAcceptsUppercaseAndUnhyphenated){
		const auto base = uuid_t::from_string("17c4a210-3500-8000-8000-001000000000");
		ASSERT_TRUE(base.has_value());
		const auto upper = uuid_t::from_string("17C4A210-3500-8000-8000-001000000000");
		const auto bare = uuid_t::from_string("17c4a210350080008000001000000000");
		ASSERT_TRUE(upper.has_value());
		ASSERT_TRUE(bare.has_value());
		EXPECT_EQ(*upper, *base);
		EXPECT_EQ(*bare, *base);
		EXPECT_EQ(base->shard_id(), 1u);
		EXPECT_EQ(base->timestamp_micros(), JAN_2023);
	}

	TEST(Microshard, FromStringRejectsMalformedText){
		for(const std::string_view bad : {
			"",
			"17c4a210-3500-8000-8000-00100000000",   // 35 chars
			"17c4a210-3500-8000-8000-0010000000000", // 37 chars
			"z7c4a210-3500-8000-8000-001000000000",  // not hex
			"17c4a210_3500-8000-8000-001000000000",  // wrong separator
			"17c4a2103-500-8000-8000-001000000000",  // misplaced hyphen
			"17c4a210350080008000001000000000ff",    // 34 chars
		}){
			const auto r = uuid_t::from_string(bad);
			ASSERT_FALSE(r.has_value()) << bad;
			EXPECT_EQ(r.error().code, errc::invalid_uuid_string) << bad;
		}
	}

	TEST(Microshard, ImportRejectsWrongVersionWithObservedValue){
		// a standard v4 uuid
		const auto r = uuid_t::from_string("123e4567-e89b-42d3-a456-426614174000");
		ASSERT_FALSE(r.has_value());
		EXPECT_EQ(r.error().code, errc::invalid_version);
		EXPECT_EQ(r.error().observed, 4u);
	}

	TEST(Microshard, ImportRejectsWrongVariantWithObservedValue){
		const auto good = must_build(JAN_2023, 1, 0).as_u128();
		const auto r = uuid_t::from_u128(u128{good.high, good.low & ~(3ULL << 62)});
		ASSERT_FALSE(r.has_value());
		EXPECT_EQ(r.error().code, errc::invalid_variant);
		EXPECT_EQ(r.error().observed, 0u);

		const auto r3 = uuid_t::from_u128(u128{good.high, good.low | (3ULL << 62)});
		ASSERT_FALSE(r3.has_value());
		EXPECT_EQ(r3.error().code, errc::invalid_variant);
		EXPECT_EQ(r3.error().observed, 3u);
	}

	TEST(Microshard, ImportReportsVersionBeforeVariant){
		const auto r = uuid_t::from_u128(u128{0, 0});
		ASSERT_FALSE(r.has_value());
		EXPECT_EQ(r.error().code, errc::invalid_version);
		EXPECT_EQ(r.error().observed, 0u);
	}

	TEST(Microshard, FromU128AcceptsValidValue){
		const auto id = must_build(JAN_2023, 31337, 99);
		const auto r = uuid_t::from_u128(id.as_u128());
		ASSERT_TRUE(r.has_value());
		EXPECT_EQ(*r, id);
	}

	TEST(Microshard, BytesAreBigEndian){
		const auto id = must_build(JAN_2023, 1, 0);
		const std::array<uuid_t::byte, 16> expected{
			0x17, 0xc4, 0xa2, 0x10, 0x35, 0x00, 0x80, 0x00,
			0x80, 0x00, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00
		};
		EXPECT_EQ(id.as_bytes(), expected);
	}

	TEST(Microshard, ToBytesFromBytesRoundTrip){
		for(int i = 0; i < 500; ++i){
			const auto id = uuid_t::generate(static_cast<std::uint32_t>(i) * 2654435761u);
			ASSERT_TRUE(id.has_value());
			const auto bytes = id->as_bytes();
			const auto back = uuid_t::from_bytes(bytes);
			ASSERT_TRUE(back.has_value());
			EXPECT_EQ(*back, *id);
			EXPECT_EQ(back->as_bytes(), bytes);
		}
	}

	TEST(Microshard, FromBytesRejectsForeignUuid){
		std::array<uuid_t::byte, 16> bytes{};
		for(std::size_t i = 0; i < bytes.size(); ++i){
			bytes[i] = static_cast<uuid_t::byte>(i * 7); // arbitrary pattern, byte 6 = 0x2a
		}
		const auto r = uuid_t::from_bytes(bytes);
		ASSERT_FALSE(r.has_value());
		EXPECT_EQ(r.error().code, errc::invalid_version);
		EXPECT_EQ(r.error().observed, 2u);
	}

	TEST(Microshard, FromIsoBuildsTheParsedInstant){
		const auto id = uuid_t::from_iso("2023-01-01T12:00:00.123456Z", 42);
		ASSERT_TRUE(id.has_value());
		EXPECT_EQ(id->timestamp_micros(), 1'672'574'400'123'456ULL);
		EXPECT_EQ(id->shard_id(), 42u);
		EXPECT_EQ(id->to_iso_string(), "2023-01-01T12:00:00.123456Z");
	}

	TEST(Microshard, FromIsoNormalizesMissingFraction){
		const auto id = uuid_t::from_iso("2023-01-01T12:00:00Z", 1);
		ASSERT_TRUE(id.has_value());
		EXPECT_EQ(id->to_iso_string(), "2023-01-01T12:00:00.000000Z");
	}

	TEST(Microshard, FromIsoLeapYears){
		EXPECT_TRUE(uuid_t::from_iso("2024-02-29T10:00:00.000000Z", 1).has_value());
		EXPECT_TRUE(uuid_t::from_iso("2000-02-29T12:30:45.000000Z", 1).has_value());
		EXPECT_FALSE(uuid_t::from_iso("2023-02-29T00:00:00Z", 1).has_value());
		EXPECT_FALSE(uuid_t::from_iso("2100-02-29T00:00:00Z", 1).has_value());
	}

	TEST(Microshard, FromIsoRejectsMalformedInput){
		for(const std::string_view bad : {
			"bad-string",
			"2023/01/01T12:00:00Z",
			"2023-13-01T12:00:00Z",
			"2023-01-01T25:00:00Z",
		}){
			const auto r = uuid_t::from_iso(bad, 1);
			ASSERT_FALSE(r.has_value()) << bad;
			EXPECT_EQ(r.error().code, errc::invalid_iso_format) << bad;
		}
	}

	TEST(Microshard, FromIsoBeyondMaxTimestampOverflows){
		const auto r = uuid_t::from_iso("2541-01-01T00:00:00Z", 1);
		ASSERT_FALSE(r.has_value());
		EXPECT_EQ(r.error().code, errc::time_overflow);
	}

	TEST(Microshard, FromTimeTruncatesToMicroseconds){
		using namespace std::chrono;
		const auto tp = uuid_t::clock::time_point{duration_cast<uuid_t::clock::duration>(microseconds{JAN_2023} + nanoseconds{999})};
		const auto id = uuid_t::from_time(tp, 3);
		ASSERT_TRUE(id.has_value());
		EXPECT_EQ(id->timestamp_micros(), JAN_2023);
	}

	TEST(Microshard, TimeRecoversTheTimePointAtMicrosecondPrecision){
		using namespace std::chrono;
		const auto tp = uuid_t::clock::time_point{duration_cast<uuid_t::clock::duration>(microseconds{JAN_2023 + 123'456} + nanoseconds{789})};
		const auto id = uuid_t::from_time(tp, 3);
		ASSERT_TRUE(id.has_value());
		EXPECT_TRUE(id->time() == floor<microseconds>(tp));
		EXPECT_EQ(duration_cast<microseconds>(id->time().time_since_epoch()).count(), static_cast<std::int64_t>(JAN_2023 + 123'456));

		const auto now = uuid_t::generate(1);
		ASSERT_TRUE(now.has_value());
		EXPECT_TRUE(uuid_t::from_time(now->time(), 1)->timestamp_micros() == now->timestamp_micros());
		EXPECT_TRUE(must_build(MAX_MICROS, 0).time() == uuid_t::micro_time{microseconds{MAX_MICROS}});
		EXPECT_TRUE(uuid_t{}.time() == uuid_t::clock::time_point{});
	}

	TEST(Microshard, FromTimeBeforeEpochIsSystemTimeError){
		using namespace std::chrono;
		const auto tp = uuid_t::clock::time_point{} - seconds{1};
		const auto id = uuid_t::from_time(tp, 3);
		ASSERT_FALSE(id.has_value());
		EXPECT_EQ(id.error().code, errc::system_time_error);
		EXPECT_EQ(id.error().observed, 1'000'000u);
	}

	TEST(Microshard, GenerateUsesCurrentTime){
		using namespace std::chrono;
		const auto before = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
		const auto id = uuid_t::generate(5);
		const auto after = duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
		ASSERT_TRUE(id.has_value());
		EXPECT_GE(id->timestamp_micros(), static_cast<std::uint64_t>(before));
		EXPECT_LE(id->timestamp_micros(), static_cast<std::uint64_t>(after));
		EXPECT_EQ(id->shard_id(), 5u);
	}

	TEST(Microshard, GenerateIsLaterThanFixedPast){
		const auto old_id = must_build(JAN_2023, 1);
		const auto new_id = uuid_t::generate(1);
		ASSERT_TRUE(new_id.has_value());
		EXPECT_LT(old_id, *new_id);
		EXPECT_LT(old_id.to_string(), new_id->to_string());
	}

	TEST(Microshard, GenerateProducesUniqueIds){
		constexpr int N = 5000;
		std::unordered_set<uuid_t> seen;
		for(int i = 0; i < N; ++i){
			const auto id = uuid_t::generate(1);
			ASSERT_TRUE(id.has_value());
			seen.insert(*id);
		}
		// 36 random bits per id: a collision at this scale is vanishingly unlikely
		EXPECT_EQ(seen.size(), static_cast<std::size_t>(N));
	}

	TEST(Microshard, HashAgreesWithEquality){
		const auto a = must_build(JAN_2023, 4, 4);
		const auto b = uuid_t::from_string(a.to_string());
		ASSERT_TRUE(b.has_value());
		EXPECT_EQ(std::hash<uuid_t>{}(a), std::hash<uuid_t>{}(*b));
	}

	TEST(Microshard, StreamsCanonicalString){
		const auto id = must_build(JAN_2023, 1, 0);
		std::ostringstream oss;
		oss << id;
		EXPECT_EQ(oss.str(), "17c4a210-3500-8000-8000-001000000000");
	}

	TEST(Microshard, NilIsAllZeroAndNotImportable){
		const uuid_t nil{};
		EXPECT_EQ(nil.to_string(), "00000000-0000-0000-0000-000000000000");
		EXPECT_EQ(nil.timestamp_micros(), 0u);
		EXPECT_EQ(nil.to_iso_string(), "1970-01-01T00:00:00.000000Z");
		EXPECT_FALSE(uuid_t::from_string(nil.to_string()).has_value());
	}

	TEST(Microshard, ErrorMessagesNameTheProblem){
		const auto r = uuid_t::from_micros(MAX_MICROS + 1000, 1);
		ASSERT_FALSE(r.has_value());
		std::ostringstream oss;
		oss << r.error();
		EXPECT_NE(oss.str().find("time_overflow"), std::string::npos);
		EXPECT_NE(r.error().message().find(std::to_string(MAX_MICROS + 1000)), std::string::npos);
	}

	TEST(Microshard, NarrowShardSpaceIsEnforced){
		EXPECT_FALSE(microshard::check_shard_id(0xFFFFu, 0xFFFFu).has_value());
		const auto err = microshard::check_shard_id(0x10000u, 0xFFFFu);
		ASSERT_TRUE(err.has_value());
		EXPECT_EQ(err->code, errc::invalid_shard_id);
		EXPECT_EQ(err->observed, 0x10000u);
		EXPECT_FALSE(microshard::check_shard_id(0xFFFF'FFFFu).has_value());
	}

} // namespace
