#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace test
{

inline int &failures()
{
    static int count = 0;
    return count;
}

/**
 * Print PASS/FAIL for one check and remember failures for the exit code.
 */
inline bool expect(bool condition, const std::string &description)
{
    fmt::print("{}: {}\n", condition ? "PASS" : "FAIL", description);
    if (!condition)
    {
        ++failures();
    }
    return condition;
}

inline int finish()
{
    if (failures() == 0)
    {
        fmt::print("\n✅ All tests passed!\n");
        return 0;
    }
    fmt::print(stderr, "\n❌ {} check(s) failed\n", failures());
    return 1;
}

/**
 * Fresh directory under the system temp dir, removed on destruction.
 */
class ScratchDir
{
public:
    explicit ScratchDir(const std::string &name)
        : path_(std::filesystem::temp_directory_path() /
                fmt::format("filesync_{}_{}", name, static_cast<unsigned>(std::rand())))
    {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const std::filesystem::path &path() const { return path_; }
    std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline std::string makeBody(std::size_t size, unsigned seed = 7)
{
    std::string body(size, '\0');
    unsigned state = seed;
    for (auto &c : body)
    {
        state = state * 1103515245u + 12345u;
        c = static_cast<char>((state >> 16) & 0xff);
    }
    return body;
}

inline std::string readFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

// Keep test output readable
inline void quietLogging()
{
    spdlog::set_level(spdlog::level::off);
}

} // namespace test
