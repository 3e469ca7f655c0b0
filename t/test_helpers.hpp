#pragma once
#include "utils.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdlib>

// Fresh directory under $TMPDIR, removed with everything in it
class TempDir {
public:
    TempDir() {
        std::string tmpl = (queuectl::fs::temp_directory_path() / "queuectl-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) throw std::runtime_error("mkdtemp failed");
        path_ = buf.data();
    }

    ~TempDir() {
        std::error_code ec;
        queuectl::fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};
