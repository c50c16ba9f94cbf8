#include <gtest/gtest.h>

#include <stdexcept>

#include "fiscal/transport/FrameFormat.hpp"
#include "fiscal/types/Error.hpp"
#include "support/FakeChannel.hpp"

using namespace fiscal;
using fiscal::transport::FrameStatus;

TEST(ZfpFrameFormatTest, WrapAddsLengthSequenceAndXorChecksum) {
    transport::ZfpFrameFormat format;
    auto frame = format.wrap(std::string(1, '\x20'));
    EXPECT_EQ(frame, (std::string{'\x02', '\x23', '\x20', '\x20', '2', '3', '\x0A'}));
}

TEST(ZfpFrameFormatTest, SequenceAdvancesPerFrame) {
    transport::ZfpFrameFormat format;
    auto first = format.wrap(std::string(1, '\x20'));
    auto second = format.wrap(std::string(1, '\x20'));
    EXPECT_EQ(static_cast<uint8_t>(first[2]), 0x20);
    EXPECT_EQ(static_cast<uint8_t>(second[2]), 0x21);
}

TEST(ZfpFrameFormatTest, ExtractReturnsBodyAfterCommandByte) {
    transport::ZfpFrameFormat device;
    std::string body = test::zfpBody("17-05-2024 10:30");
    std::string buffer = "\xFF" + device.wrap("\x68" + body);

    transport::ZfpFrameFormat format;
    std::string extracted;
    ASSERT_EQ(format.extract(buffer, extracted), FrameStatus::Complete);
    EXPECT_EQ(extracted, body);
    EXPECT_TRUE(buffer.empty());
}

TEST(ZfpFrameFormatTest, PartialFrameIsIncomplete) {
    transport::ZfpFrameFormat device;
    auto frame = device.wrap("\x68" + test::zfpBody("17-05-2024 10:30"));
    std::string buffer = frame.substr(0, frame.size() - 3);

    transport::ZfpFrameFormat format;
    std::string extracted;
    EXPECT_EQ(format.extract(buffer, extracted), FrameStatus::Incomplete);
    EXPECT_EQ(buffer.size(), frame.size() - 3);

    buffer += frame.substr(frame.size() - 3);
    EXPECT_EQ(format.extract(buffer, extracted), FrameStatus::Complete);
}

TEST(ZfpFrameFormatTest, RetryMarkerMeansBusy) {
    transport::ZfpFrameFormat format;
    std::string buffer = "\x0E";
    std::string extracted;
    EXPECT_EQ(format.extract(buffer, extracted), FrameStatus::Busy);
}

TEST(ZfpFrameFormatTest, NakThrows) {
    transport::ZfpFrameFormat format;
    std::string buffer = "\x15";
    std::string extracted;
    EXPECT_THROW(format.extract(buffer, extracted), types::TransportException);
}

TEST(ZfpFrameFormatTest, CorruptedChecksumThrows) {
    transport::ZfpFrameFormat device;
    auto frame = device.wrap("\x68" + test::zfpBody("17-05-2024 10:30"));
    frame[frame.size() - 2] = frame[frame.size() - 2] == '0' ? '1' : '0';

    transport::ZfpFrameFormat format;
    std::string extracted;
    EXPECT_THROW(format.extract(frame, extracted), types::ChecksumMismatchException);
    EXPECT_TRUE(frame.empty());
}

TEST(IslFrameFormatTest, WrapAddsPostambleAndSumChecksum) {
    transport::IslFrameFormat format;
    auto frame = format.wrap(std::string(1, '\x4A'));
    EXPECT_EQ(frame, (std::string{'\x01', '\x24', '\x20', '\x4A', '\x05', '0', '0', '9', '3', '\x03'}));

    auto next = format.wrap(std::string(1, '\x4A'));
    EXPECT_EQ(static_cast<uint8_t>(next[2]), 0x21);
}

TEST(IslFrameFormatTest, ExtractReturnsBodyWithStatusSegment) {
    transport::IslFrameFormat device;
    std::string body = test::islBody("P,12550,0,0");
    std::string buffer = device.wrap("\x46" + body);

    transport::IslFrameFormat format;
    std::string extracted;
    ASSERT_EQ(format.extract(buffer, extracted), FrameStatus::Complete);
    EXPECT_EQ(extracted, body);
}

TEST(IslFrameFormatTest, SynWithoutFrameMeansBusy) {
    transport::IslFrameFormat format;
    std::string buffer = "\x16\x16";
    std::string extracted;
    EXPECT_EQ(format.extract(buffer, extracted), FrameStatus::Busy);
    EXPECT_TRUE(buffer.empty());
}

TEST(IslFrameFormatTest, NakThrows) {
    transport::IslFrameFormat format;
    std::string buffer = "\x15";
    std::string extracted;
    EXPECT_THROW(format.extract(buffer, extracted), types::TransportException);
}

TEST(IslFrameFormatTest, CorruptedChecksumThrows) {
    transport::IslFrameFormat device;
    auto frame = device.wrap("\x46" + test::islBody("P,12550,0,0"));
    frame[frame.size() - 2] = frame[frame.size() - 2] == '0' ? '1' : '0';

    transport::IslFrameFormat format;
    std::string extracted;
    EXPECT_THROW(format.extract(frame, extracted), types::ChecksumMismatchException);
}

TEST(FrameFormatTest, FactoryKnowsBothFamilies) {
    EXPECT_NE(dynamic_cast<transport::ZfpFrameFormat *>(transport::makeFrameFormat("zfp").get()), nullptr);
    EXPECT_NE(dynamic_cast<transport::IslFrameFormat *>(transport::makeFrameFormat("isl").get()), nullptr);
    EXPECT_THROW(transport::makeFrameFormat("xml"), std::invalid_argument);
}
