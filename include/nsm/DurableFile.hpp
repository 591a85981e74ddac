#pragma once

#include <string>
#include <string_view>
#include <sys/types.h>
#include "nsm/Errors.hpp"

namespace nsm {

// fsync-backed helpers for the write-temp-then-rename commits. Failures throw
// ArchiveError with the caller's code.

// Replaces `path` with `data` at `mode`, fsynced before return.
void writeFileDurably(const std::string& path, std::string_view data, mode_t mode, ErrorCode onError);

// fsyncs an already written file.
void syncFile(const std::string& path, ErrorCode onError);

// fsyncs the directory holding `path` so a rename into it survives a crash.
void syncParentDirectory(const std::string& path, ErrorCode onError);

} // namespace nsm
