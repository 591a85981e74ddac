#include "nsm/DurableFile.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace nsm {

namespace {

// Owns one descriptor for the duration of a sync.
class Descriptor {
public:
    Descriptor(const std::string& path, int flags, mode_t mode, ErrorCode onError)
        : path_(path), onError_(onError) {
        fd_ = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        if (fd_ < 0) fail("cannot open");
    }
    ~Descriptor() {
        if (fd_ >= 0) ::close(fd_);
    }

    Descriptor(const Descriptor&) = delete;
    Descriptor& operator=(const Descriptor&) = delete;

    void writeAll(std::string_view data) {
        size_t done = 0;
        while (done < data.size()) {
            ssize_t n = ::write(fd_, data.data() + done, data.size() - done);
            if (n < 0) {
                if (errno == EINTR) continue;
                fail("failed writing");
            }
            done += static_cast<size_t>(n);
        }
    }

    void chmod(mode_t mode) {
        if (::fchmod(fd_, mode) != 0) fail("cannot set permissions on");
    }

    void sync() {
        if (::fsync(fd_) != 0) fail("fsync failed for");
    }

    void close() {
        int fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) fail("failed closing");
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw ArchiveError(onError_, what + " " + path_ + ": " + std::strerror(errno));
    }

    std::string path_;
    ErrorCode onError_;
    int fd_ = -1;
};

} // namespace

void writeFileDurably(const std::string& path, std::string_view data, mode_t mode, ErrorCode onError) {
    Descriptor file(path, O_WRONLY | O_CREAT | O_TRUNC, mode, onError);
    // A pre-existing file keeps its old mode through O_CREAT.
    file.chmod(mode);
    file.writeAll(data);
    file.sync();
    file.close();
}

void syncFile(const std::string& path, ErrorCode onError) {
    Descriptor file(path, O_RDONLY, 0, onError);
    file.sync();
    file.close();
}

void syncParentDirectory(const std::string& path, ErrorCode onError) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) parent = ".";
    Descriptor dir(parent.string(), O_RDONLY | O_DIRECTORY, 0, onError);
    dir.sync();
    dir.close();
}

} // namespace nsm
