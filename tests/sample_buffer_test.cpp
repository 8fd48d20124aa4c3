#include "echo_audio_stego.hpp"
#include "lsb_audio_stego.hpp"
#include "metrics.hpp"
#include "sample_buffer.hpp"
#include "wav_io.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace audstego;

TEST(SampleBuffer, FramesMatchChannels)
{
    SampleBuffer buf = makeSampleBuffer({1, 2, 3, 4, 5, 6}, 2, 48000);
    EXPECT_EQ(buf.size(), 6u);
    EXPECT_EQ(buf.format.frames, 3u);
    EXPECT_EQ(buf.format.channels, 2);
    EXPECT_EQ(buf.format.sampleRate, 48000);
}

TEST(SampleBuffer, PartialTrailingFrameIsDropped)
{
    SampleBuffer stereo = makeSampleBuffer({1, 2, 3, 4, 5}, 2);
    EXPECT_EQ(toVector(stereo), std::vector<int16_t>({1, 2, 3, 4}));
    EXPECT_EQ(stereo.format.frames, 2u);
    EXPECT_EQ(stereo.size(), stereo.format.frames * stereo.format.channels);

    SampleBuffer tooShort = makeSampleBuffer({9}, 2);
    EXPECT_TRUE(tooShort.empty());
    EXPECT_EQ(tooShort.format.frames, 0u);
}

TEST(SampleBuffer, RejectsZeroChannels)
{
    EXPECT_THROW(makeSampleBuffer({1, 2}, 0), std::invalid_argument);
}

TEST(SampleBuffer, CloneDoesNotShareSamples)
{
    SampleBuffer a = makeSampleBuffer({1, 2, 3});
    SampleBuffer b = cloneBuffer(a);
    b.data()[0] = 42;
    EXPECT_EQ(a.data()[0], 1);
}

TEST(SampleBuffer, EnginesRejectWrongDepth)
{
    SampleBuffer floats;
    floats.samples = cv::Mat(1, 1000, CV_32FC1, cv::Scalar(0));

    SampleBuffer out;
    std::string message;
    EchoDecodeResult result;

    EXPECT_THROW(checkSampleBuffer(floats), cv::Exception);
    EXPECT_THROW(encodeLSB(floats, "x", out), cv::Exception);
    EXPECT_THROW(extractLSB(floats, message), cv::Exception);
    EXPECT_THROW(encodeEcho(floats, "x", EchoParams(), out), cv::Exception);
    EXPECT_THROW(decodeEcho(floats, floats, 200, 400, result), cv::Exception);
    EXPECT_THROW(wavio::writeWav(floats), cv::Exception);
}

TEST(SampleBuffer, EnginesRejectColumnShape)
{
    SampleBuffer column;
    column.samples = cv::Mat(1000, 1, CV_16SC1, cv::Scalar(0));
    SampleBuffer row = makeSampleBuffer(std::vector<int16_t>(1000, 0));

    EchoDecodeResult result;
    EXPECT_THROW(decodeEcho(row, column, 200, 400, result), cv::Exception);
    EXPECT_THROW(metrics::computeSNR(row, column), cv::Exception);

    EXPECT_NO_THROW(checkSampleBuffer(row));
    EXPECT_NO_THROW(checkSampleBuffer(SampleBuffer()));
}
