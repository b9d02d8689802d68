#include "testutils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <thread>

#include "random.hpp"

namespace testutils
{
bool wait_for(const std::function<bool()> &predicate, unsigned timeout_ms)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    while (!predicate() &&
           (timeout_ms == 0 ||
               duration_cast<milliseconds>(steady_clock::now() - start).count() <= timeout_ms))
    {
        std::this_thread::yield();
    }
    return predicate();
}

TempDir::TempDir(const std::string &prefix)
{
    static pshare::utils::Random rng;

    std::filesystem::path dir;
    do
    {
        dir = std::filesystem::temp_directory_path() /
              (prefix + '_' + std::to_string(rng.next<unsigned>()));
    } while (std::filesystem::exists(dir));

    std::filesystem::create_directories(dir);
    path_ = dir.string();
}

TempDir::~TempDir()
{
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

const std::string &TempDir::path() const
{
    return path_;
}

std::string TempDir::file(const std::string &name) const
{
    return (std::filesystem::path {path_} / name).string();
}

bool write_file(const std::string &path, const std::vector<uint8_t> &content)
{
    std::ofstream fs {path, std::ios::out | std::ios::binary | std::ios::trunc};
    fs.write(reinterpret_cast<const char *>(content.data()), std::streamsize(content.size()));
    return bool(fs);
}

std::vector<uint8_t> read_file(const std::string &path)
{
    std::ifstream fs {path, std::ios::in | std::ios::binary};
    return std::vector<uint8_t>(
        std::istreambuf_iterator<char> {fs}, std::istreambuf_iterator<char> {});
}
}  // namespace testutils
