#include "TransitTestHelpers.h"
#include <cstdlib>
#include <fstream>

namespace transit::test_helpers {

ScopedEnv::ScopedEnv(const char* name, const char* value)
    : _name(name) {
    if (const char* prev = std::getenv(name)) {
        _hadValue = true;
        _previous = prev;
    }
    ::setenv(name, value, 1);
}

ScopedEnv::~ScopedEnv() {
    if (_hadValue) {
        ::setenv(_name.c_str(), _previous.c_str(), 1);
    } else {
        ::unsetenv(_name.c_str());
    }
}

std::string readAllBytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void writeAllBytes(const std::filesystem::path& p, const std::string& bytes) {
    std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::string randomBytes(size_t count, uint64_t seed) {
    std::mt19937_64 gen(seed);
    std::string out(count, '\0');
    for (size_t i = 0; i < count; ++i) {
        out[i] = static_cast<char>(gen() & 0xFF);
    }
    return out;
}

} // namespace transit::test_helpers
