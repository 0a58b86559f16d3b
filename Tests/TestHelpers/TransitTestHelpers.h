#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <sstream>
#include <string>

#include "TransitCore.h"

namespace transit::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        // Create a reasonably unique directory name
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto rnd = gen();
        std::ostringstream oss;
        oss << "Transit_Test_" << std::hex << now << "_" << rnd;
        _path = base / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        namespace fs = std::filesystem;
        std::error_code ec;
        // Read-only files inside must not block cleanup
        for (auto it = fs::recursive_directory_iterator(_path, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        }
        fs::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::filesystem::path join(const std::string& name) const {
        return _path / name;
    }
    std::string str(const std::string& name) const {
        return (_path / name).string();
    }

private:
    std::filesystem::path _path;
};

// RAII setenv/unsetenv for debug seams
class ScopedEnv
{
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();

private:
    std::string _name;
    bool _hadValue = false;
    std::string _previous;
};

std::string readAllBytes(const std::filesystem::path& p);
void writeAllBytes(const std::filesystem::path& p, const std::string& bytes);
std::string randomBytes(size_t count, uint64_t seed = 0x7a11);

} // namespace transit::test_helpers
