#include "bit_codec.hpp"
#include "lsb_audio_stego.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace audstego;

TEST(LsbAudioStego, SilentBufferRoundTrip)
{
    SampleBuffer cover = testutil::silence(16000);
    SampleBuffer stego;

    ASSERT_TRUE(encodeLSB(cover, "HI", stego));
    EXPECT_EQ(stego.size(), cover.size());
    EXPECT_EQ(decodeLSB(stego), "HI");
}

TEST(LsbAudioStego, NoiseBufferRoundTrip)
{
    SampleBuffer cover = testutil::noise(2000, 12345);
    const char* messages[] = {"Hello, World!", "no hash marks here", "HI"};

    for (const char* m : messages) {
        SampleBuffer stego;
        ASSERT_TRUE(encodeLSB(cover, m, stego)) << m;

        std::string out;
        ASSERT_TRUE(extractLSB(stego, out)) << m;
        EXPECT_EQ(out, m);
    }
}

TEST(LsbAudioStego, CoverHashesAfterPayloadDoNotLeakIntoMessage)
{
    // LSBs of samples 40.. spell "###", right where "HI###" ends
    std::vector<int16_t> pcm(400, 1000);
    std::vector<uint8_t> hashes = encodeBits("");
    for (size_t i = 0; i < hashes.size(); ++i) {
        pcm[40 + i] = static_cast<int16_t>(1000 | hashes[i]);
    }
    SampleBuffer cover = makeSampleBuffer(pcm);

    SampleBuffer stego;
    ASSERT_TRUE(encodeLSB(cover, "HI", stego));
    EXPECT_EQ(stego.data()[41], cover.data()[41]);
    EXPECT_EQ(decodeLSB(stego), "HI");
}

TEST(LsbAudioStego, CapacityBoundary)
{
    // 97 chars + "###" = 800 bits
    std::string message(97, 'k');
    SampleBuffer stego;

    EXPECT_TRUE(encodeLSB(testutil::silence(800), message, stego));
    EXPECT_EQ(decodeLSB(stego), message);

    SampleBuffer untouched;
    EXPECT_FALSE(encodeLSB(testutil::silence(799), message, untouched));
    EXPECT_TRUE(untouched.empty());
}

TEST(LsbAudioStego, OnlyLowestBitChanges)
{
    SampleBuffer cover = testutil::noise(4000, 99, 32000);
    SampleBuffer stego;
    ASSERT_TRUE(encodeLSB(cover, "upper bits stay put", stego));

    const size_t used = encodeBits("upper bits stay put").size();
    for (size_t i = 0; i < cover.size(); ++i) {
        uint16_t before = static_cast<uint16_t>(cover.data()[i]);
        uint16_t after = static_cast<uint16_t>(stego.data()[i]);
        EXPECT_EQ(before & 0xFFFE, after & 0xFFFE) << "sample " << i;
        if (i >= used) {
            EXPECT_EQ(before, after) << "sample " << i;
        }
    }
}

TEST(LsbAudioStego, NegativeSamplesUseRawBitPattern)
{
    SampleBuffer cover = testutil::constant(64, -1);   // 0xFFFF
    SampleBuffer stego;
    ASSERT_TRUE(encodeLSB(cover, "", stego));

    // first bit of '#' is 0
    EXPECT_EQ(stego.data()[0], -2);
    EXPECT_EQ(stego.data()[2], -1);
}

TEST(LsbAudioStego, CoverIsNotModified)
{
    SampleBuffer cover = testutil::noise(1000, 5);
    std::vector<int16_t> before = toVector(cover);

    SampleBuffer stego;
    ASSERT_TRUE(encodeLSB(cover, "copy", stego));

    EXPECT_EQ(toVector(cover), before);
    EXPECT_NE(stego.data(), cover.data());
    EXPECT_EQ(stego.format.sampleRate, cover.format.sampleRate);
    EXPECT_EQ(stego.format.frames, cover.format.frames);
}

TEST(LsbAudioStego, UnmodifiedBufferHasNoMessage)
{
    EXPECT_EQ(decodeLSB(testutil::silence(16000)), NO_MESSAGE_FOUND);
    EXPECT_EQ(decodeLSB(testutil::noise(2000, 12345)), NO_MESSAGE_FOUND);
    EXPECT_EQ(decodeLSB(SampleBuffer()), NO_MESSAGE_FOUND);
}

TEST(LsbAudioStego, Capacity)
{
    EXPECT_EQ(lsbCapacityBits(testutil::silence(16000)), 16000u);
    EXPECT_EQ(lsbMaxMessageChars(testutil::silence(16000)), 1997u);
    EXPECT_EQ(lsbMaxMessageChars(testutil::silence(20)), 0u);
}
