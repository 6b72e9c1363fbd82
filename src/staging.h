#pragma once

#include <string>

namespace confrun {

// A uniquely named, request-scoped directory. Created on construction and
// removed with everything inside it on destruction, on every exit path.
class StagingDirectory {
public:
    // Creates <base_dir>/confrun-XXXXXX (mode 0700). Throws std::runtime_error.
    explicit StagingDirectory(const std::string& base_dir);
    ~StagingDirectory();

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    const std::string& path() const { return path_; }

    // Write `content` verbatim to a file directly inside the directory and
    // return its full path. Throws std::runtime_error on any I/O failure.
    std::string write_file(const std::string& name, const std::string& content);

private:
    std::string path_;
};

} // namespace confrun
