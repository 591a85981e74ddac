#pragma once

#include <stdexcept>
#include <string>

namespace nsm {

enum class ErrorCode {
    InvalidArgument,
    InvalidFormat,
    UnsupportedVersion,
    UnsupportedAlgorithm,
    ChecksumMismatch,
    ArchiveReadFailure,
    ArchiveWriteFailure,
    CompressionFailure,
    DecompressionFailure,
    DecryptionFailure,
    NoTokensAvailable,
    PersistenceFailure,
    ValidationFailure,
    PartialExtractFailure
};

const char* errorCodeName(ErrorCode code);

// Corruption and foreign files are data problems; everything else may succeed on retry.
bool isRetriable(ErrorCode code);

class ArchiveError : public std::runtime_error {
public:
    ArchiveError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace nsm
