#include "nsm/Errors.hpp"

namespace nsm {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidArgument: return "InvalidArgument";
    case ErrorCode::InvalidFormat: return "InvalidFormat";
    case ErrorCode::UnsupportedVersion: return "UnsupportedVersion";
    case ErrorCode::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
    case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
    case ErrorCode::ArchiveReadFailure: return "ArchiveReadFailure";
    case ErrorCode::ArchiveWriteFailure: return "ArchiveWriteFailure";
    case ErrorCode::CompressionFailure: return "CompressionFailure";
    case ErrorCode::DecompressionFailure: return "DecompressionFailure";
    case ErrorCode::DecryptionFailure: return "DecryptionFailure";
    case ErrorCode::NoTokensAvailable: return "NoTokensAvailable";
    case ErrorCode::PersistenceFailure: return "PersistenceFailure";
    case ErrorCode::ValidationFailure: return "ValidationFailure";
    case ErrorCode::PartialExtractFailure: return "PartialExtractFailure";
    }
    return "Unknown";
}

bool isRetriable(ErrorCode code) {
    return code != ErrorCode::ChecksumMismatch && code != ErrorCode::InvalidFormat;
}

} // namespace nsm
