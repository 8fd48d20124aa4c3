#ifndef SAMPLE_BUFFER_HPP
#define SAMPLE_BUFFER_HPP

#include <opencv2/core.hpp>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace audstego {

    // Format metadata carried through the engines untouched; only the WAV
    // writer needs it.
    struct AudioFormat {
        int channels = 1;
        int sampleRate = 44100;
        int sampleWidth = 2;   // bytes, always 16-bit PCM
        size_t frames = 0;
    };

    // Interleaved signed 16-bit samples in a 1 x N CV_16SC1 matrix (or an
    // empty Mat); size() == format.frames * format.channels.
    // cv::Mat copies share data: anything that writes must clone() first.
    struct SampleBuffer {
        cv::Mat samples;
        AudioFormat format;

        size_t size() const { return samples.empty() ? 0 : samples.total(); }
        bool empty() const { return size() == 0; }

        const int16_t* data() const { return samples.empty() ? nullptr : samples.ptr<int16_t>(0); }
        int16_t* data() { return samples.empty() ? nullptr : samples.ptr<int16_t>(0); }
    };

    // Copies pcm into a new buffer. A trailing partial frame is dropped.
    // Throws std::invalid_argument if channels < 1.
    SampleBuffer makeSampleBuffer(const std::vector<int16_t>& pcm,
                                  int channels = 1,
                                  int sampleRate = 44100);

    std::vector<int16_t> toVector(const SampleBuffer& buffer);

    // CV_Assert that samples is empty or a single CV_16SC1 row.
    void checkSampleBuffer(const SampleBuffer& buffer);

    // Deep copy, format included.
    SampleBuffer cloneBuffer(const SampleBuffer& buffer);

}

#endif // SAMPLE_BUFFER_HPP
