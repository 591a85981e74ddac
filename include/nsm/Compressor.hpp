#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include "nsm/CodecPool.hpp"
#include "nsm/Format.hpp"
#include "nsm/PermitPool.hpp"

namespace nsm {

// Streaming frame compressor. One instance per process; every call holds a
// permit from a shared pool for the whole frame, so concurrent callers never
// exceed maxJobs() active codec operations.
class Compressor {
public:
    struct Options {
        size_t maxJobs = 0; // 0 = defaultJobs()
        int zstdLevel = 3;
        int gzipLevel = 6;
    };

    Compressor();
    explicit Compressor(const Options& options);

    Compressor(const Compressor&) = delete;
    Compressor& operator=(const Compressor&) = delete;

    // Encode `src` as one self-contained frame into `dst`; returns bytes written.
    uint64_t compress(std::ostream& dst, std::string_view src, Algorithm algo);

    // Decode exactly one frame from `src` into `dst`; returns bytes written.
    // Output beyond `maxOutput` bytes fails with DecompressionFailure.
    uint64_t decompress(std::ostream& dst, std::string_view src, Algorithm algo,
                        uint64_t maxOutput = kUnlimited);

    static constexpr uint64_t kUnlimited = UINT64_MAX;

    size_t maxJobs() const { return permits_.capacity(); }
    size_t activeJobs() const { return permits_.active(); }
    size_t peakJobs() const { return permits_.peak(); }
    const CodecPool& codecPool() const { return pool_; }

    // Half the hardware threads, at least one.
    static size_t defaultJobs();

private:
    uint64_t compressZstd(std::ostream& dst, std::string_view src);
    uint64_t compressGzip(std::ostream& dst, std::string_view src);
    uint64_t decompressZstd(std::ostream& dst, std::string_view src, uint64_t maxOutput);
    uint64_t decompressGzip(std::ostream& dst, std::string_view src, uint64_t maxOutput);

    Options options_;
    PermitPool permits_;
    CodecPool pool_;
};

} // namespace nsm
