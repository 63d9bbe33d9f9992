#include <vector>
#include "transport/frame_reader.hpp"
#include "devices/nav_profile.hpp"
#include "fake_channel.hpp"

#include "CppUTest/TestHarness.h"

using namespace gpsmodel;
using namespace std::chrono_literals;


TEST_GROUP(FrameReader)
{
	FakeChannel channel;
};

TEST(FrameReader, ReadsFrameFedInOnePiece)
{
	UbxFrame sent = UbxFrame::make(0x05, 0x01, { 0x06, 0x24 }).value();
	channel.feed(sent.serialize());

	FrameReader reader(channel);
	auto frame = reader.next_frame();

	CHECK_TRUE(frame.ok());
	CHECK_TRUE(sent == frame.value());
	CHECK_TRUE(FrameReader::State::DONE == reader.state());
	LONGS_EQUAL(0, channel.unread());
}

TEST(FrameReader, RoundTripsEveryProfile)
{
	for (const auto& name : ProfileCatalog::profile_names())
	{
		auto profile = ProfileCatalog::find_profile(name);
		CHECK_TRUE(profile.ok());

		UbxFrame sent = UbxFrame::make(0x06, 0x24, ProfileCatalog::payload_for(profile.value())).value();
		channel.feed(sent.serialize());

		FrameReader reader(channel);
		auto frame = reader.next_frame();
		CHECK_TRUE(frame.ok());
		CHECK_TRUE(sent == frame.value());
	}
}

TEST(FrameReader, SkipsNoiseBeforeSync)
{
	// NMEA chatter, a lone sync char and the second sync char out of order
	std::vector<uint8_t> noise = { '$', 'G', 'P', 'G', 'G', 'A', ',', 0xB5, 0x00, 0x62, 0x62, 0xB5, 0x0D };
	channel.feed(noise);
	channel.feed({ 0xB5, 0x62, 0x05, 0x01, 0x02, 0x00, 0x06, 0x24, 0x32, 0x5B });

	FrameReader reader(channel);
	auto frame = reader.next_frame();

	CHECK_TRUE(frame.ok());
	CHECK_TRUE(frame.value().is_ack_for(0x06, 0x24));
}

TEST(FrameReader, MismatchDropsByteAndRestartsMatch)
{
	// B5 62 only counts when adjacent
	channel.feed({ 0xB5, 0x11, 0x62 });

	FrameReader reader(channel, 16);
	CHECK_FALSE(reader.sync_to_frame());
	CHECK_TRUE(Error::SYNC_TIMEOUT == reader.last_error());
	CHECK_TRUE(FrameReader::State::FAILED == reader.state());
}

TEST(FrameReader, RepeatedFirstSyncCharIsConsumed)
{
	// The second B5 is compared against 0x62, fails and is dropped, so the
	// following 62 no longer completes a marker.
	channel.feed({ 0xB5, 0xB5, 0x62 });
	channel.feed(UbxFrame::ack_for(0x06, 0x09).serialize());

	FrameReader reader(channel);
	auto frame = reader.next_frame();

	CHECK_TRUE(frame.ok());
	CHECK_TRUE(frame.value().is_ack_for(0x06, 0x09));
}

TEST(FrameReader, SyncSplitAcrossSlowReads)
{
	UbxFrame sent = UbxFrame::make(0x06, 0x24, { 1, 2, 3, 4, 5 }).value();
	channel.feed({ 0x00, 0xFF });
	channel.feed(sent.serialize());
	channel.max_chunk = 1;
	channel.stall_reads = 3;

	FrameReader reader(channel);
	auto frame = reader.next_frame();

	CHECK_TRUE(frame.ok());
	CHECK_TRUE(sent == frame.value());
}

TEST(FrameReader, PayloadArrivesInPieces)
{
	std::vector<uint8_t> payload(36);
	for (size_t i = 0; i < payload.size(); i++)
		payload[i] = static_cast<uint8_t>(i * 7);
	UbxFrame sent = UbxFrame::make(0x06, 0x24, payload).value();
	channel.feed(sent.serialize());
	channel.max_chunk = 5;
	channel.stall_reads = 1;

	FrameReader reader(channel);
	auto frame = reader.next_frame();

	CHECK_TRUE(frame.ok());
	CHECK_TRUE(sent == frame.value());
}

TEST(FrameReader, SyncTimesOutOnSilentChannel)
{
	FrameReader reader(channel, 100);
	CHECK_FALSE(reader.sync_to_frame());
	LONGS_EQUAL(100, channel.reads);
	CHECK_TRUE(Error::SYNC_TIMEOUT == reader.last_error());
}

TEST(FrameReader, SyncTimesOutOnEndlessNoise)
{
	channel.feed(std::vector<uint8_t>(1000, 0xB5));

	FrameReader reader(channel, 200);
	CHECK_FALSE(reader.sync_to_frame());
	LONGS_EQUAL(200, channel.reads);
	LONGS_EQUAL(800, channel.unread());
}

TEST(FrameReader, SyncHonoursWallClockTimeout)
{
	FrameReader reader(channel, 1 << 30, 0ms);
	CHECK_FALSE(reader.sync_to_frame());
	CHECK_TRUE(Error::SYNC_TIMEOUT == reader.last_error());
}

TEST(FrameReader, ReadExactCollectsPartialReads)
{
	channel.feed({ 1, 2, 3, 4, 5, 6, 7 });
	channel.max_chunk = 2;

	FrameReader reader(channel);
	auto bytes = reader.read_exact(5);

	CHECK_TRUE(bytes.ok());
	std::vector<uint8_t> expected = { 1, 2, 3, 4, 5 };
	CHECK_TRUE(expected == bytes.value());
	LONGS_EQUAL(2, channel.unread());
}

TEST(FrameReader, ReadExactTimesOut)
{
	channel.feed({ 1, 2 });

	FrameReader reader(channel, 10);
	auto bytes = reader.read_exact(5);

	CHECK_FALSE(bytes.ok());
	CHECK_TRUE(Error::READ_TIMEOUT == bytes.error());
}

TEST(FrameReader, TruncatedFrameFailsInPayload)
{
	std::vector<uint8_t> bytes = UbxFrame::make(0x06, 0x24, { 1, 2, 3, 4 }).value().serialize();
	bytes.resize(bytes.size() - 4);
	channel.feed(bytes);

	FrameReader reader(channel, 50);
	auto frame = reader.next_frame();

	CHECK_FALSE(frame.ok());
	CHECK_TRUE(Error::READ_TIMEOUT == frame.error());
	CHECK_TRUE(FrameReader::State::FAILED == reader.state());
}

TEST(FrameReader, RejectsPayloadBitFlips)
{
	auto profile = ProfileCatalog::find_profile("stationary");
	std::vector<uint8_t> clean = UbxFrame::make(0x06, 0x24, ProfileCatalog::payload_for(profile.value())).value().serialize();

	// payload occupies bytes 6 .. size-3
	for (size_t pos = 6; pos < clean.size() - 2; pos += 5)
	{
		std::vector<uint8_t> bytes = clean;
		bytes[pos] ^= 0x01;

		FakeChannel corrupt;
		corrupt.feed(bytes);
		FrameReader reader(corrupt);
		auto frame = reader.next_frame();

		CHECK_FALSE(frame.ok());
		CHECK_TRUE(Error::CHECKSUM_MISMATCH == frame.error());
	}
}

TEST(FrameReader, RejectsChecksumBitFlips)
{
	std::vector<uint8_t> clean = UbxFrame::ack_for(0x06, 0x24).serialize();

	for (size_t pos = clean.size() - 2; pos < clean.size(); pos++)
	{
		for (int bit = 0; bit < 8; bit++)
		{
			std::vector<uint8_t> bytes = clean;
			bytes[pos] ^= static_cast<uint8_t>(1 << bit);

			FakeChannel corrupt;
			corrupt.feed(bytes);
			FrameReader reader(corrupt);
			auto frame = reader.next_frame();

			CHECK_FALSE(frame.ok());
			CHECK_TRUE(Error::CHECKSUM_MISMATCH == frame.error());
		}
	}
}

TEST(FrameReader, ReadsBackToBackFrames)
{
	UbxFrame first = UbxFrame::make(0x06, 0x24, { 9, 9 }).value();
	UbxFrame second = UbxFrame::ack_for(0x06, 0x24);
	channel.feed(first.serialize());
	channel.feed(second.serialize());

	FrameReader reader(channel);
	auto a = reader.next_frame();
	auto b = reader.next_frame();

	CHECK_TRUE(a.ok());
	CHECK_TRUE(b.ok());
	CHECK_TRUE(first == a.value());
	CHECK_TRUE(second == b.value());
}
