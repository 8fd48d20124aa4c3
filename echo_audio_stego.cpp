#include "echo_audio_stego.hpp"
#include "bit_codec.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace audstego {

    static void checkDelays(int d0, int d1)
    {
        if (d0 <= 0 || d1 <= 0) {
            throw std::invalid_argument("echo delays must be positive");
        }
        if (d0 == d1) {
            throw std::invalid_argument("echo delays d0 and d1 must differ");
        }
    }

    size_t echoMaxMessageChars(const SampleBuffer& buffer, const EchoParams& params)
    {
        const size_t maxDelay = static_cast<size_t>(std::max(params.d0, params.d1));
        if (buffer.size() <= maxDelay) return 0;

        size_t bits = (buffer.size() - maxDelay) / ECHO_CHUNK_SIZE;
        size_t chars = bits / 8;
        return chars > TERMINATOR.size() ? chars - TERMINATOR.size() : 0;
    }

    bool encodeEcho(const SampleBuffer& cover,
                    const std::string& message,
                    const EchoParams& params,
                    SampleBuffer& outStego)
    {
        checkSampleBuffer(cover);
        checkDelays(params.d0, params.d1);
        if (!(params.alpha > 0.0 && params.alpha <= 1.0)) {
            throw std::invalid_argument("echo alpha must be in (0, 1]");
        }

        std::vector<uint8_t> bits = encodeBits(message);

        const size_t n = cover.size();
        const size_t chunk = ECHO_CHUNK_SIZE;
        const size_t maxDelay = static_cast<size_t>(std::max(params.d0, params.d1));
        const size_t needed = bits.size() * chunk + maxDelay;

        if (needed > n) {
            std::cerr << "[echo embed] Message too long. Need " << needed
                      << " samples, have " << n << ".\n";
            return false;
        }

        // accumulate in float, echoes are always taken from the clean cover
        cv::Mat src, out;
        cover.samples.convertTo(src, CV_32F);
        out = src.clone();

        for (size_t i = 0; i < bits.size(); ++i) {
            size_t start = i * chunk;
            size_t end = std::min(start + chunk, n - maxDelay);
            if (end <= start) break;

            size_t delay = static_cast<size_t>(bits[i] ? params.d1 : params.d0);
            size_t echoStart = start + delay;
            size_t echoEnd = echoStart + (end - start);
            if (echoEnd > n) continue;

            cv::Mat dst = out.colRange(static_cast<int>(echoStart), static_cast<int>(echoEnd));
            cv::scaleAdd(src.colRange(static_cast<int>(start), static_cast<int>(end)),
                         params.alpha, dst, dst);
        }

        SampleBuffer stego;
        stego.format = cover.format;
        // saturating conversion clips to [-32768, 32767]
        out.convertTo(stego.samples, CV_16S);

        outStego = stego;
        std::cout << "[echo embed] Done. " << bits.size() << " chunks of "
                  << chunk << " samples, max delay " << maxDelay << "." << std::endl;
        return true;
    }

    bool decodeEcho(const SampleBuffer& original,
                    const SampleBuffer& stego,
                    int d0,
                    int d1,
                    EchoDecodeResult& out)
    {
        checkSampleBuffer(original);
        checkSampleBuffer(stego);
        checkDelays(d0, d1);

        out = EchoDecodeResult();
        out.message = NO_MESSAGE_FOUND;

        const size_t chunk = ECHO_CHUNK_SIZE;
        const size_t maxDelay = static_cast<size_t>(std::max(d0, d1));
        const size_t n = std::min(original.size(), stego.size());

        if (original.size() != stego.size()) {
            std::cerr << "[echo extract] Length mismatch (" << original.size()
                      << " vs " << stego.size() << "), using first " << n
                      << " samples.\n";
        }

        if (n <= maxDelay) {
            std::cerr << "[echo extract] Not enough samples for a single chunk.\n";
            return false;
        }

        cv::Mat orig, st;
        original.samples.colRange(0, static_cast<int>(n)).convertTo(orig, CV_64F);
        stego.samples.colRange(0, static_cast<int>(n)).convertTo(st, CV_64F);

        const size_t numChunks = (n - maxDelay) / chunk;
        out.bits.reserve(numChunks);
        out.diagnostics.reserve(numChunks);

        for (size_t i = 0; i < numChunks; ++i) {
            int start = static_cast<int>(i * chunk);
            int end = start + static_cast<int>(chunk);
            int extEnd = end + static_cast<int>(maxDelay);

            // whatever the stego adds on top of the cover, both delays covered
            cv::Mat diff = st.colRange(start, extEnd) - orig.colRange(start, extEnd);
            cv::Mat origChunk = orig.colRange(start, end);

            cv::Mat echoD0 = diff.colRange(d0, d0 + static_cast<int>(chunk));
            cv::Mat echoD1 = diff.colRange(d1, d1 + static_cast<int>(chunk));

            ChunkDiagnostic diag;
            diag.chunk = i;
            diag.corrD0 = std::abs(origChunk.dot(echoD0));
            diag.corrD1 = std::abs(origChunk.dot(echoD1));
            diag.bit = diag.corrD1 > diag.corrD0 ? 1 : 0;

            out.bits.push_back(static_cast<uint8_t>(diag.bit));
            out.diagnostics.push_back(diag);
        }

        std::string message;
        if (decodeBits(out.bits, message, true)) {
            out.found = true;
            out.message = message;
        }
        return out.found;
    }

    std::string formatDiagnostic(const ChunkDiagnostic& d)
    {
        std::ostringstream os;
        os << "Chunk " << d.chunk << std::fixed << std::setprecision(2)
           << ": corr_d0=" << d.corrD0
           << ", corr_d1=" << d.corrD1
           << ", bit=" << d.bit;
        return os.str();
    }

}
