#include <vector>
#include "transport/ubx_frame.hpp"
#include "common/helpers.hpp"

#include "CppUTest/TestHarness.h"

using namespace gpsmodel;


TEST_GROUP(UbxFrame)
{
};

TEST(UbxFrame, SerializeEmptyPayload)
{
	UbxFrame frame = UbxFrame::make(0x06, 0x24).value();
	std::vector<uint8_t> expected = { 0xB5, 0x62, 0x06, 0x24, 0x00, 0x00, 0x2A, 0x84 };
	CHECK_TRUE(expected == frame.serialize());
}

TEST(UbxFrame, SerializeAckAck)
{
	UbxFrame ack = UbxFrame::ack_for(0x06, 0x24);
	STRCMP_EQUAL("B5 62 05 01 02 00 06 24 32 5B", bytesToHex(ack.serialize()).c_str());
}

TEST(UbxFrame, LengthIsLittleEndian)
{
	std::vector<uint8_t> payload(0x0102, 0xAA);
	std::vector<uint8_t> bytes = UbxFrame::make(0x06, 0x24, payload).value().serialize();

	LONGS_EQUAL(2 + 4 + 0x0102 + 2, bytes.size());
	BYTES_EQUAL(0x02, bytes[4]);
	BYTES_EQUAL(0x01, bytes[5]);
	BYTES_EQUAL(0xAA, bytes[6]);
}

TEST(UbxFrame, LargestPayloadIsAccepted)
{
	auto frame = UbxFrame::make(0x06, 0x24, std::vector<uint8_t>(0xFFFF, 0xAA));
	CHECK_TRUE(frame.ok());

	std::vector<uint8_t> bytes = frame.value().serialize();
	BYTES_EQUAL(0xFF, bytes[4]);
	BYTES_EQUAL(0xFF, bytes[5]);
}

TEST(UbxFrame, OversizedPayloadIsRejected)
{
	auto frame = UbxFrame::make(0x06, 0x24, std::vector<uint8_t>(0x10003, 0xAA));
	CHECK_FALSE(frame.ok());
	CHECK_TRUE(Error::PARSE_ERROR == frame.error());
}

TEST(UbxFrame, SerializeIsPure)
{
	UbxFrame frame = UbxFrame::make(0x06, 0x09, { 1, 2, 3 }).value();
	CHECK_TRUE(frame.serialize() == frame.serialize());
}

TEST(UbxFrame, EqualityIsStructural)
{
	CHECK_TRUE(UbxFrame::make(0x05, 0x01, { 0x06, 0x24 }).value() == UbxFrame::make(0x05, 0x01, { 0x06, 0x24 }).value());
	CHECK_TRUE(UbxFrame::make(0x05, 0x01, { 0x06, 0x24 }).value() != UbxFrame::make(0x05, 0x00, { 0x06, 0x24 }).value());
	CHECK_TRUE(UbxFrame::make(0x05, 0x01, { 0x06, 0x24 }).value() != UbxFrame::make(0x06, 0x01, { 0x06, 0x24 }).value());
	CHECK_TRUE(UbxFrame::make(0x05, 0x01, { 0x06, 0x24 }).value() != UbxFrame::make(0x05, 0x01, { 0x06, 0x09 }).value());
	CHECK_TRUE(UbxFrame::make(0x05, 0x01).value() != UbxFrame::make(0x05, 0x01, { 0x00 }).value());
}

TEST(UbxFrame, AckMatching)
{
	UbxFrame ack = UbxFrame::ack_for(0x06, 0x09);
	CHECK_TRUE(ack.is_ack_for(0x06, 0x09));
	CHECK_FALSE(ack.is_ack_for(0x06, 0x24));
	CHECK_FALSE(ack.is_nak_for(0x06, 0x09));

	UbxFrame nak = UbxFrame::make(0x05, 0x00, { 0x06, 0x09 }).value();
	CHECK_TRUE(nak.is_nak_for(0x06, 0x09));
	CHECK_FALSE(nak.is_ack_for(0x06, 0x09));
}
