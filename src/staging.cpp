#include "staging.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace confrun {

namespace fs = std::filesystem;

StagingDirectory::StagingDirectory(const std::string& base_dir) {
    std::string pattern = (fs::path(base_dir) / "confrun-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Failed to create staging directory in " + base_dir +
                                 ": " + std::strerror(errno));
    }
    path_ = buffer.data();
}

StagingDirectory::~StagingDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "Failed to remove staging directory " << path_ << ": "
                  << ec.message() << std::endl;
    }
}

std::string StagingDirectory::write_file(const std::string& name, const std::string& content) {
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        throw std::runtime_error("Invalid staged file name: " + name);
    }

    std::string file_path = (fs::path(path_) / name).string();
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open " + file_path + " for writing");
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write " + file_path);
    }
    return file_path;
}

} // namespace confrun
