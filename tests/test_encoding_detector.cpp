// EN: Unit tests for EncodingDetector and newline helpers
// FR: Tests unitaires pour EncodingDetector et les utilitaires de fin de ligne

#include <gtest/gtest.h>
#include "tnorm/text/encoding_detector.hpp"
#include "tnorm/text/transcoder.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

using namespace TNORM;
using namespace TNORM::Text;

class EncodingDetectorTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }

    EncodingDetector detector_{"cp932"};
};

// EN: Fallback chain
// FR: Chaîne de repli

TEST_F(EncodingDetectorTest, ChainOrder) {
    const auto& chain = detector_.candidates();
    ASSERT_EQ(chain.size(), 4u);
    EXPECT_EQ(chain[0].encoding, "utf-8-sig");
    EXPECT_EQ(chain[1].encoding, "utf-8");
    EXPECT_EQ(chain[2].encoding, "cp932");
    EXPECT_EQ(chain[3].encoding, "latin-1");
    EXPECT_FALSE(chain[3].strict);
}

TEST_F(EncodingDetectorTest, LegacyLatin1IsNotDuplicated) {
    EncodingDetector detector("iso-8859-1");
    EXPECT_EQ(detector.candidates().size(), 3u);
}

TEST_F(EncodingDetectorTest, BomWins) {
    EXPECT_EQ(detector_.detect(std::string(kUtf8Bom) + "a,b\r\n"), "utf-8-sig");
    EXPECT_TRUE(EncodingDetector::hasUtf8Bom(std::string(kUtf8Bom)));
    EXPECT_FALSE(EncodingDetector::hasUtf8Bom("\xEF\xBB"));
}

TEST_F(EncodingDetectorTest, ValidUtf8) {
    EXPECT_EQ(detector_.detect("JAN\xE3\x82\xB3\xE3\x83\xBC\xE3\x83\x89,x\n"), "utf-8");
    EXPECT_EQ(detector_.detect(""), "utf-8");
}

TEST_F(EncodingDetectorTest, LegacyCodePage) {
    // EN: "商品" in CP932, invalid as UTF-8
    // FR: "商品" en CP932, invalide en UTF-8
    EXPECT_EQ(detector_.detect("\x8F\xA4\x95\x69,x\r\n"), "cp932");
}

TEST_F(EncodingDetectorTest, PermissiveFallback) {
    // EN: 0x81 followed by a space is neither UTF-8 nor CP932
    // FR: 0x81 suivi d'un espace n'est ni UTF-8 ni CP932
    EXPECT_EQ(detector_.detect("\x81 abc"), "latin-1");
}

// EN: Newlines
// FR: Fins de ligne

TEST_F(EncodingDetectorTest, NewlineMajority) {
    EXPECT_EQ(EncodingDetector::detectNewline("a\r\nb\r\nc\n"), NewlineStyle::CRLF);
    EXPECT_EQ(EncodingDetector::detectNewline("a\nb\nc\r\n"), NewlineStyle::LF);
    EXPECT_EQ(EncodingDetector::detectNewline("a\r\nb\n"), NewlineStyle::CRLF);
    EXPECT_EQ(EncodingDetector::detectNewline("no newline"), NewlineStyle::CRLF);
}

TEST_F(EncodingDetectorTest, ParseNewline) {
    EXPECT_EQ(parseNewline("crlf"), NewlineStyle::CRLF);
    EXPECT_EQ(parseNewline("\n"), NewlineStyle::LF);
    EXPECT_EQ(parseNewline("LF"), NewlineStyle::LF);
    EXPECT_FALSE(parseNewline("CR").has_value());
    EXPECT_EQ(newlineSequence(NewlineStyle::CRLF), "\r\n");
    EXPECT_EQ(newlineToString(NewlineStyle::LF), "LF");
}
