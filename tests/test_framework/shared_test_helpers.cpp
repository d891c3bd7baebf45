// tests/test_framework/shared_test_helpers.cpp
/**
 * @file shared_test_helpers.cpp
 * @brief Implements common helper functions for the docgate tests.
 */
#include "dgt_base.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#include "shared_test_helpers.h"

namespace docgate::tests::helper
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
    return wait_until(
        [&]()
        {
            std::string contents;
            return read_file_contents(path.string(), contents) &&
                   contents.find(expected) != std::string::npos;
        },
        timeout);
}

bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

fs::path unique_temp_path(const std::string &stem, const std::string &ext)
{
    static std::atomic<int> counter{0};
    return fs::temp_directory_path() /
           fmt::format("docgate_test_{}_{}_{}{}", stem, platform::get_pid(), counter++, ext);
}

void TempPathsFixture::TearDown()
{
    for (const auto &p : paths_to_clean_)
    {
        std::error_code ec;
        fs::remove_all(p, ec); // best effort; a leftover temp file fails nothing
    }
}

fs::path TempPathsFixture::TempPath(const std::string &stem, const std::string &ext)
{
    auto p = unique_temp_path(stem, ext);
    paths_to_clean_.push_back(p);
    return p;
}

} // namespace docgate::tests::helper
