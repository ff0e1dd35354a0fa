#include "common/protocol/usbhid/UsbHid.hpp"

#include <gtest/gtest.h>

using namespace usbhid;

namespace {

const Frame kWorkedReport = {
    0x01, 0x13, 0x13,
    0x00, 0x08, 0x00, 0x0B, 0x01, 0x00, 0x00, 0x00,
    0x03, 0x00, 0x00,
    0x29, 0x00, 0xBC, 0xE0, 0x00, 0x01, 0xAB, 0xCC
};

const Frame kWorkedPayload = {0x29, 0x00, 0xBC, 0xE0, 0x00, 0x01, 0xAB, 0xCC};

}  // namespace

// ==================== encode ====================

TEST(UsbHidBuilderTest, EncodesWithDefaultOptions) {
    Frame payload = {0x29, 0x00, 0xBC, 0xE0, 0x00, 0x01};
    Frame expected = {
        0x01, 0x13, 0x11,
        0x00, 0x08, 0x00, 0x09, 0x01, 0x00, 0x00, 0x00,
        0x03, 0x00, 0x00,
        0x29, 0x00, 0xBC, 0xE0, 0x00, 0x01
    };
    EXPECT_EQ(UsbHidBuilder::encode(payload), expected);
}

TEST(UsbHidBuilderTest, EncodesGroupValueWriteReport) {
    EXPECT_EQ(UsbHidBuilder::encode(kWorkedPayload), kWorkedReport);
}

TEST(UsbHidBuilderTest, EncodesEmptyPayload) {
    Frame expected = {
        0x01, 0x13, 0x0B,
        0x00, 0x08, 0x00, 0x03, 0x01, 0x00, 0x00, 0x00,
        0x03, 0x00, 0x00
    };
    EXPECT_EQ(UsbHidBuilder::encode({}), expected);
}

TEST(UsbHidBuilderTest, AppliesCustomOptions) {
    EncodeOptions options;
    options.sequenceNumber = 5;
    options.packetType = PacketType::Start;
    options.protocolId = ProtocolId::MBusTunnel;
    options.emiId = 0x01;

    auto report = UsbHidBuilder::encode({0xAA}, options);
    ASSERT_EQ(report.size(), 15u);
    EXPECT_EQ(report[1], 0x55);
    EXPECT_EQ(report[7], 0x02);
    EXPECT_EQ(report[11], 0x01);
    EXPECT_EQ(report[14], 0xAA);
}

TEST(UsbHidBuilderTest, TruncatesSequenceNumberToFourBits) {
    EncodeOptions options;
    options.sequenceNumber = 0x12;
    auto report = UsbHidBuilder::encode({0x01}, options);
    EXPECT_EQ(report[1], 0x23);
}

TEST(UsbHidBuilderTest, OutputLengthIsPayloadPlusFourteen) {
    for (size_t n : {0u, 1u, 8u, 50u, 240u}) {
        Frame payload(n, 0x5A);
        auto report = UsbHidBuilder::encode(payload);
        EXPECT_EQ(report.size(), ProtocolConst::FRAMING_OVERHEAD + n) << "payload size " << n;
        EXPECT_EQ(report[2], static_cast<uint8_t>(8 + 3 + n));
        EXPECT_EQ(UsbHidUtils::readUInt16BE(report, 5), 3 + n);
    }
}

TEST(UsbHidBuilderTest, DataLengthKeepsLowByteForOversizedPayload) {
    Frame payload(300, 0x00);
    auto report = UsbHidBuilder::encode(payload);
    EXPECT_EQ(report.size(), 314u);
    EXPECT_EQ(report[2], static_cast<uint8_t>((8 + 3 + 300) & 0xFF));
    EXPECT_EQ(UsbHidUtils::readUInt16BE(report, 5), 303);
}

TEST(UsbHidBuilderTest, EncodesLayersIndependently) {
    EXPECT_EQ(UsbHidBuilder::encodeEmiHeader({0xAB}, 0x03), (Frame{0x03, 0x00, 0x00, 0xAB}));
    EXPECT_EQ(UsbHidBuilder::encodeProtocolHeader({0x03, 0x00, 0x00}, ProtocolId::KnxTunnel),
              (Frame{0x00, 0x08, 0x00, 0x03, 0x01, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00}));
    EXPECT_EQ(UsbHidBuilder::encodeReportHeader({0xEE, 0xFF}, 2, PacketType::End),
              (Frame{0x01, 0x26, 0x02, 0xEE, 0xFF}));
}

// ==================== decode ====================

TEST(UsbHidParserTest, DecodesGroupValueWriteReport) {
    auto result = UsbHidParser::decode(kWorkedReport);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.error, DecodeError::None);

    EXPECT_EQ(result->reportId, 0x01);
    EXPECT_EQ(result->sequenceNumber, 1);
    EXPECT_EQ(result->packetType, PacketType::AllInOne);
    EXPECT_EQ(result->dataLength, 0x13);
    EXPECT_EQ(result->protocolVersion, 0x00);
    EXPECT_EQ(result->headerLength, 0x08);
    EXPECT_EQ(result->bodyLength, 11);
    EXPECT_EQ(result->protocolId, ProtocolId::KnxTunnel);
    EXPECT_EQ(result->emiId, 0x03);
    EXPECT_EQ(result->payload, kWorkedPayload);
}

TEST(UsbHidParserTest, RejectsWrongReportIdentifier) {
    auto result = UsbHidParser::decode({0x02});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, DecodeError::InvalidReportIdentifier);
}

TEST(UsbHidParserTest, RejectsEmptyInput) {
    EXPECT_EQ(UsbHidParser::decode({}).error, DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, RejectsTruncatedPacketInfo) {
    EXPECT_EQ(UsbHidParser::decode({0x01, 0x13}).error, DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, RejectsUnknownPacketType) {
    Frame report = kWorkedReport;
    report[1] = 0x1F;
    EXPECT_EQ(UsbHidParser::decode(report).error, DecodeError::UnknownPacketType);
}

TEST(UsbHidParserTest, RejectsUnknownProtocolId) {
    Frame report = kWorkedReport;
    report[7] = 0xFF;
    EXPECT_EQ(UsbHidParser::decode(report).error, DecodeError::UnknownProtocolId);
}

TEST(UsbHidParserTest, RejectsTruncatedProtocolHeader) {
    Frame report(kWorkedReport.begin(), kWorkedReport.begin() + 7);
    EXPECT_EQ(UsbHidParser::decode(report).error, DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, RejectsMissingReservedBytes) {
    // 协议 ID 之后缺少保留字节
    Frame report(kWorkedReport.begin(), kWorkedReport.begin() + 9);
    EXPECT_EQ(UsbHidParser::decode(report).error, DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, RejectsTruncatedEmiHeader) {
    Frame report(kWorkedReport.begin(), kWorkedReport.begin() + 12);
    EXPECT_EQ(UsbHidParser::decode(report).error, DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, AcceptsEmptyPayload) {
    Frame report(kWorkedReport.begin(), kWorkedReport.begin() + 14);
    auto result = UsbHidParser::decode(report);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result->payload.empty());
}

TEST(UsbHidParserTest, DoesNotValidateDeclaredLengths) {
    // 声明长度与实际不符时不报错，负载为 EMI 头之后的全部字节
    Frame report = kWorkedReport;
    report[2] = 0x02;
    report[6] = 0x01;
    report.push_back(0xDD);
    auto result = UsbHidParser::decode(report);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->dataLength, 0x02);
    EXPECT_EQ(result->bodyLength, 1);
    EXPECT_EQ(result->payload.size(), kWorkedPayload.size() + 1);
}

TEST(UsbHidParserTest, ExtractsPayload) {
    auto payload = UsbHidParser::extractPayload(kWorkedReport);
    ASSERT_TRUE(payload.ok());
    EXPECT_EQ(*payload, kWorkedPayload);
}

TEST(UsbHidParserTest, ExtractPayloadPropagatesErrors) {
    EXPECT_EQ(UsbHidParser::extractPayload({0x02}).error, DecodeError::InvalidReportIdentifier);
    EXPECT_EQ(UsbHidParser::extractPayload({0x01, 0x13}).error, DecodeError::InsufficientData);
}

// ==================== 分层解析 ====================

TEST(UsbHidParserTest, DecodesReportIdentifierStage) {
    EXPECT_EQ(*UsbHidParser::decodeReportIdentifier({0x01, 0x13, 0x09}), 0x01);
    EXPECT_EQ(UsbHidParser::decodeReportIdentifier({0x02, 0x13}).error,
              DecodeError::InvalidReportIdentifier);
    EXPECT_EQ(UsbHidParser::decodeReportIdentifier({}).error, DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, DecodesPacketInfoStage) {
    auto info = UsbHidParser::decodePacketInfo({0x13, 0x09, 0xAA, 0xBB});
    ASSERT_TRUE(info.ok());
    EXPECT_EQ(info->sequenceNumber, 1);
    EXPECT_EQ(info->packetType, PacketType::AllInOne);
    EXPECT_EQ(info->dataLength, 9);

    EXPECT_EQ(UsbHidParser::decodePacketInfo({0xF5, 0x00})->sequenceNumber, 15);
    EXPECT_EQ(UsbHidParser::decodePacketInfo({0x15, 0x00})->packetType, PacketType::Start);
    EXPECT_EQ(UsbHidParser::decodePacketInfo({0x16, 0x00})->packetType, PacketType::End);
    EXPECT_EQ(UsbHidParser::decodePacketInfo({0x13}).error, DecodeError::InsufficientData);
    EXPECT_EQ(UsbHidParser::decodePacketInfo({0x1F, 0x09}).error, DecodeError::UnknownPacketType);
}

TEST(UsbHidParserTest, DecodesProtocolHeaderStage) {
    auto header = UsbHidParser::decodeProtocolHeader(
        {0x00, 0x08, 0x01, 0x23, 0x0F, 0x00, 0x00, 0x00});
    ASSERT_TRUE(header.ok());
    EXPECT_EQ(header->version, 0x00);
    EXPECT_EQ(header->headerLength, 0x08);
    EXPECT_EQ(header->bodyLength, 291);
    EXPECT_EQ(header->protocolId, ProtocolId::BusAccessServerFeatureService);

    EXPECT_EQ(UsbHidParser::decodeProtocolHeader({0x00, 0x08, 0x00, 0x05}).error,
              DecodeError::InsufficientData);
    // 协议 ID 先于保留字节检查
    EXPECT_EQ(UsbHidParser::decodeProtocolHeader({0x00, 0x08, 0x00, 0x05, 0xFF}).error,
              DecodeError::UnknownProtocolId);
    EXPECT_EQ(UsbHidParser::decodeProtocolHeader({0x00, 0x08, 0x00, 0x05, 0x01}).error,
              DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, DecodesEmiHeaderStage) {
    auto body = UsbHidParser::decodeEmiHeader({0x03, 0x00, 0x00, 0x29, 0x00});
    ASSERT_TRUE(body.ok());
    EXPECT_EQ(body->emiId, 0x03);
    EXPECT_EQ(body->payload, (Frame{0x29, 0x00}));

    EXPECT_EQ(UsbHidParser::decodeEmiHeader({0x03, 0x00}).error, DecodeError::InsufficientData);
}

TEST(UsbHidParserTest, StageParsersHonorOffset) {
    EXPECT_EQ(UsbHidParser::decodeReportIdentifier(kWorkedReport, UsbHidParser::REPORT_ID_OFFSET).error,
              DecodeError::None);
    EXPECT_EQ(UsbHidParser::decodeEmiHeader(kWorkedReport, UsbHidParser::EMI_HEADER_OFFSET)->payload,
              kWorkedPayload);
    EXPECT_EQ(UsbHidParser::decodeEmiHeader(kWorkedReport, 100).error, DecodeError::InsufficientData);
}

// ==================== 编解码一致性 ====================

TEST(UsbHidCodecTest, SequenceAndPacketTypeSurviveRoundTrip) {
    const PacketType types[] = {
        PacketType::AllInOne, PacketType::Partial, PacketType::Start, PacketType::End
    };
    const Frame payload = {0x11, 0x22, 0x33};

    for (uint8_t seq = 0; seq < 16; ++seq) {
        for (auto type : types) {
            EncodeOptions options;
            options.sequenceNumber = seq;
            options.packetType = type;

            auto report = UsbHidBuilder::encode(payload, options);
            EXPECT_EQ(report[1], static_cast<uint8_t>((seq << 4) | UsbHidUtils::toByte(type)));

            auto decoded = UsbHidParser::decode(report);
            ASSERT_TRUE(decoded.ok());
            EXPECT_EQ(decoded->sequenceNumber, seq);
            EXPECT_EQ(decoded->packetType, type);
            EXPECT_EQ(decoded->payload, payload);
        }
    }
}

TEST(UsbHidCodecTest, OptionsAndLengthInvariantsHoldAfterDecode) {
    EncodeOptions options;
    options.sequenceNumber = 7;
    options.packetType = PacketType::Partial;
    options.protocolId = ProtocolId::BatiBusTunnel;
    options.emiId = 0xF0;

    Frame payload(40);
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<uint8_t>(i * 3);

    auto decoded = UsbHidParser::decode(UsbHidBuilder::encode(payload, options));
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded->protocolId, ProtocolId::BatiBusTunnel);
    EXPECT_EQ(decoded->emiId, 0xF0);
    EXPECT_EQ(decoded->bodyLength, 3 + payload.size());
    EXPECT_EQ(decoded->dataLength, 8 + decoded->bodyLength);
    EXPECT_EQ(decoded->payload, payload);
}
