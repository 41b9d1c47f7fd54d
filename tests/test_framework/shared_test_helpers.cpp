// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions for test cases.
 */
#include "dlk_base.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

#include <unistd.h>

#include "shared_test_helpers.h"

namespace dirlock::tests::helper
{

bool read_file_contents(const std::string &path, std::string &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

size_t count_lines(std::string_view text, std::optional<std::string_view> must_include,
                   std::optional<std::string_view> must_exclude)
{
    size_t count = 0;
    size_t pos = 0;

    while (pos < text.size())
    {
        auto end = text.find('\n', pos);
        auto line = text.substr(pos, end - pos);

        if ((!must_include || line.find(*must_include) != std::string_view::npos) &&
            (!must_exclude || line.find(*must_exclude) == std::string_view::npos))
        {
            ++count;
        }

        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }

    return count;
}

bool wait_for_string_in_file(const fs::path &path, const std::string &expected,
                             std::chrono::milliseconds timeout)
{
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < timeout)
    {
        std::string contents;
        if (read_file_contents(path.string(), contents))
        {
            if (contents.find(expected) != std::string::npos)
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

std::string test_scale()
{
    const char *v = std::getenv("DIRLOCK_TEST_SCALE");
    return v ? std::string(v) : std::string();
}

int scaled_value(int original, int small_value)
{
    if (test_scale() == "small")
        return small_value;
    return original;
}

void backdate_mtime(const fs::path &path, std::chrono::seconds age)
{
    fs::last_write_time(path, fs::file_time_type::clock::now() - age);
}

TempDir::TempDir(const std::string &test_name)
{
    auto ts = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() / fmt::format("dirlock_test_{}_{}_{}", test_name,
                                                    static_cast<long>(getpid()), ts);
    fs::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

} // namespace dirlock::tests::helper
