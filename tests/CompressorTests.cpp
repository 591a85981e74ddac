#include "nsm/Cipher.hpp"
#include "nsm/Compressor.hpp"
#include "nsm/PermitPool.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace nsm;

static std::string compressToString(Compressor& c, const std::string& src, Algorithm algo) {
    std::ostringstream out;
    uint64_t n = c.compress(out, src, algo);
    expect(n == out.str().size(), "compress reports bytes written");
    return out.str();
}

static std::string decompressToString(Compressor& c, const std::string& frame, Algorithm algo) {
    std::ostringstream out;
    uint64_t n = c.decompress(out, frame, algo);
    expect(n == out.str().size(), "decompress reports bytes written");
    return out.str();
}

int main() {
    std::string text;
    for (int i = 0; i < 2000; ++i) text += "the quick brown fox jumps over the lazy dog " + std::to_string(i % 17) + "\n";
    const std::string binary = randomBytes(200000, 3);

    // Both algorithms
    for (Algorithm algo : {Algorithm::Zstd, Algorithm::Gzip}) {
        const std::string name = algorithmName(algo);
        Compressor c;
        std::string frame = compressToString(c, text, algo);
        expect(frame.size() < text.size() / 4, name + " compresses repetitive text");
        expect(decompressToString(c, frame, algo) == text, name + " text round trip");
        expect(decompressToString(c, compressToString(c, binary, algo), algo) == binary, name + " binary round trip");
        expect(decompressToString(c, compressToString(c, "", algo), algo).empty(), name + " empty input");

        expectError(ErrorCode::DecompressionFailure, [&] { decompressToString(c, randomBytes(64, 5), algo); },
                    name + " rejects garbage");
        expectError(ErrorCode::DecompressionFailure,
                    [&] { decompressToString(c, frame.substr(0, frame.size() - 6), algo); },
                    name + " rejects a truncated frame");
        expectError(ErrorCode::DecompressionFailure, [&] { decompressToString(c, frame + "junk", algo); },
                    name + " rejects bytes after the frame");
        expect(c.activeJobs() == 0, name + " permits released after failures");
    }

    // gzip frames carry the gzip magic so external tools can read them
    {
        Compressor c;
        std::string frame = compressToString(c, "hello", Algorithm::Gzip);
        expect(frame.size() > 2 && static_cast<unsigned char>(frame[0]) == 0x1f &&
                   static_cast<unsigned char>(frame[1]) == 0x8b,
               "gzip wrapper present");
    }

    // Output cap stops a frame that expands past its recorded size
    {
        Compressor c;
        const std::string zeros(4 << 20, '\0');
        for (Algorithm algo : {Algorithm::Zstd, Algorithm::Gzip}) {
            const std::string name = algorithmName(algo);
            std::string frame = compressToString(c, zeros, algo);
            expect(frame.size() < zeros.size() / 100, name + " zeros compress well");
            std::ostringstream out;
            expectError(ErrorCode::DecompressionFailure, [&] { c.decompress(out, frame, algo, 1024); },
                        name + " frame larger than the cap");
            expect(out.str().size() <= 1024, name + " nothing past the cap is written");
            std::ostringstream exact;
            expect(c.decompress(exact, frame, algo, zeros.size()) == zeros.size(), name + " cap equal to the size");
            expect(c.activeJobs() == 0, name + " permit released after the cap");
        }
    }

    // Unsupported algorithm never falls back
    {
        Compressor c;
        std::ostringstream out;
        expectError(ErrorCode::UnsupportedAlgorithm, [&] { c.compress(out, "x", static_cast<Algorithm>(7)); },
                    "unsupported compress algorithm");
        expectError(ErrorCode::UnsupportedAlgorithm, [&] { c.decompress(out, "x", static_cast<Algorithm>(7)); },
                    "unsupported decompress algorithm");
        expect(c.activeJobs() == 0, "permit released after unsupported algorithm");
    }

    // Codec state recycling
    {
        Compressor c;
        compressToString(c, text, Algorithm::Zstd);
        compressToString(c, binary, Algorithm::Zstd);
        expect(c.codecPool().created() == 1, "one zstd encoder created");
        expect(c.codecPool().reused() == 1, "zstd encoder reused");
        expect(c.codecPool().idle(Algorithm::Zstd, Direction::Compress) == 1, "encoder returned to pool");

        std::string frame = compressToString(c, text, Algorithm::Gzip);
        decompressToString(c, frame, Algorithm::Gzip);
        expect(c.codecPool().idle(Algorithm::Gzip, Direction::Decompress) == 1, "clean decoder returned");
        expectError(ErrorCode::DecompressionFailure, [&] { decompressToString(c, "not gzip at all", Algorithm::Gzip); },
                    "gzip garbage");
        expect(c.codecPool().idle(Algorithm::Gzip, Direction::Decompress) == 0, "failed decoder is discarded");
        expect(decompressToString(c, frame, Algorithm::Gzip) == text, "fresh decoder after discard works");
    }

    // Permit pool bounds concurrency
    {
        PermitPool pool(3);
        std::atomic<int> current{0};
        std::atomic<int> observed{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 12; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 5; ++i) {
                    auto permit = pool.acquire();
                    int now = ++current;
                    int prev = observed.load();
                    while (now > prev && !observed.compare_exchange_weak(prev, now)) {}
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    --current;
                }
            });
        }
        for (auto& th : threads) th.join();
        expect(observed.load() <= 3, "never more than three permits held");
        expect(pool.peak() <= 3 && pool.peak() >= 1, "pool peak within capacity");
        expect(pool.active() == 0, "all permits returned");
        expect(PermitPool(0).capacity() == 1, "pool has at least one permit");
    }
    {
        Compressor::Options options;
        options.maxJobs = 2;
        Compressor c(options);
        expect(c.maxJobs() == 2, "configured job limit");
        std::atomic<bool> ok{true};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&, t] {
                const Algorithm algo = t % 2 ? Algorithm::Gzip : Algorithm::Zstd;
                for (int i = 0; i < 4; ++i) {
                    std::ostringstream frame;
                    c.compress(frame, binary, algo);
                    std::ostringstream back;
                    c.decompress(back, frame.str(), algo);
                    if (back.str() != binary) ok = false;
                }
            });
        }
        for (auto& th : threads) th.join();
        expect(ok.load(), "concurrent round trips intact");
        expect(c.peakJobs() <= 2, "codec jobs never exceed the configured limit");
        expect(c.activeJobs() == 0, "no codec jobs left running");
    }
    expect(Compressor::defaultJobs() >= 1, "default job count is at least one");

    // Frame encryption
    {
        const std::string key(64, 'a');
        FrameCipher cipher(key);
        std::string sealed = cipher.seal("secret payload", "a.txt");
        expect(sealed.size() == FrameCipher::kNonceSize + 14 + FrameCipher::kTagSize, "sealed frame layout");
        expect(cipher.open(sealed, "a.txt") == "secret payload", "seal/open round trip");
        expect(cipher.seal("secret payload", "a.txt") != sealed, "fresh nonce per frame");

        FrameCipher other(std::string(64, 'b'));
        expectError(ErrorCode::DecryptionFailure, [&] { other.open(sealed, "a.txt"); }, "wrong key");
        expectError(ErrorCode::DecryptionFailure, [&] { cipher.open(sealed, "b.txt"); }, "frame moved to another path");
        std::string tampered = sealed;
        tampered[FrameCipher::kNonceSize + 2] ^= 0x01;
        expectError(ErrorCode::DecryptionFailure, [&] { cipher.open(tampered, "a.txt"); }, "tampered frame");
        expectError(ErrorCode::DecryptionFailure, [&] { cipher.open("short", "a.txt"); }, "short frame");
        expect(cipher.open(cipher.seal("", "e"), "e").empty(), "empty plaintext");

        expectError(ErrorCode::InvalidArgument, [] { FrameCipher bad("abcd"); }, "short key");
        expectError(ErrorCode::InvalidArgument, [] { FrameCipher bad(std::string(64, 'z')); }, "non-hex key");
    }

    std::cout << "All compressor tests passed." << std::endl;
    return 0;
}
