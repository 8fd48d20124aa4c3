#include "sample_buffer.hpp"

#include <stdexcept>

namespace audstego {

    SampleBuffer makeSampleBuffer(const std::vector<int16_t>& pcm,
                                  int channels,
                                  int sampleRate)
    {
        if (channels < 1) {
            throw std::invalid_argument("channel count must be at least 1");
        }

        SampleBuffer buf;
        buf.format.channels = channels;
        buf.format.sampleRate = sampleRate;
        buf.format.frames = pcm.size() / channels;

        const size_t count = buf.format.frames * channels;
        if (count > 0) {
            // wrap then clone so the buffer owns its memory
            cv::Mat view(1, static_cast<int>(count), CV_16SC1,
                         const_cast<int16_t*>(pcm.data()));
            buf.samples = view.clone();
        }
        return buf;
    }

    std::vector<int16_t> toVector(const SampleBuffer& buffer)
    {
        if (buffer.empty()) return {};
        return std::vector<int16_t>(buffer.data(), buffer.data() + buffer.size());
    }

    void checkSampleBuffer(const SampleBuffer& buffer)
    {
        CV_Assert(buffer.samples.empty() ||
                  (buffer.samples.type() == CV_16SC1 && buffer.samples.rows == 1));
    }

    SampleBuffer cloneBuffer(const SampleBuffer& buffer)
    {
        SampleBuffer copy;
        copy.format = buffer.format;
        copy.samples = buffer.samples.clone();
        return copy;
    }

}
