#include "Fixtures.h"
#include "HarnessException.h"
#include <loguru/loguru.hpp>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using std::string;

const static unsigned kBinarySeed = 0x5eed;

string to_string(FixtureKey key)
{
    switch (key) {
        case FixtureKey::plain:               return "plain";
        case FixtureKey::blank_lines:         return "blank-lines";
        case FixtureKey::tabs:                return "tabs";
        case FixtureKey::mixed_control:       return "mixed-control";
        case FixtureKey::control:             return "control";
        case FixtureKey::no_trailing_newline: return "no-trailing-newline";
        case FixtureKey::binary:              return "binary";
    }
    return "unknown";
}

static string numbered_lines(int count)
{
    string result;
    for (int i = 1; i <= count; ++i) {
        result += "line " + std::to_string(i) + "\n";
    }
    return result;
}

/**
 * Create the fixture directory and every prepared artifact in it.
 */
Fixtures::Fixtures()
{
    const char *tmp = getenv("TMPDIR");
    string pattern = string(tmp && *tmp ? tmp : "/tmp") + "/catcheck.XXXXXX";
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw HarnessException("mkdtemp " + pattern + ": " + strerror(errno));
    }
    dir = buf.data();
    LOG_F(INFO, "fixture directory: %s", dir.c_str());

    try {
        sample_a = path("a.txt");
        write_file(sample_a, "alpha\n");
        sample_b = path("b.txt");
        write_file(sample_b, "beta\n");
        blank = path("blank.txt");
        write_file(blank, "one\n\n\nthree\n\n\n");
        tabs = path("tabs.txt");
        write_file(tabs, "col1\tcol2\nline\t2\n");
        mixed = path("mixed.txt");
        write_file(mixed, "tab\t\x01\nline\t2\x7f\n");
        dash_name = path("-dash.txt");
        write_file(dash_name, "dash file\n");
        option_like = path("-n");
        write_file(option_like, "option-looking file\n");
        dash_v_file = path("-vfile.txt");
        write_file(dash_v_file, "dash-v data\n");
        empty = path("empty.txt");
        write_file(empty, "");
        no_newline = path("no_newline.txt");
        write_file(no_newline, "no newline");
        large = path("large.txt");
        write_file(large, numbered_lines(3000));
        huge = path("huge.txt");
        write_file(huge, numbered_lines(1000));
        control = path("control.txt");
        write_file(control, string("plain\ncontrol:\x01here\nesc:\x1bX\nmeta:\x80Y\n"));
        binary = path("binary.bin");
        write_file(binary, random_bytes(512, kBinarySeed));
        dir_path = path("adir");
        fs::create_directory(dir_path);
    }
    catch (std::exception& e) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        throw HarnessException(string("creating fixtures: ") + e.what());
    }

    stdin_data = "stdin data\n";
    stdin_mix = "middle line\n";
}

Fixtures::~Fixtures()
{
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG_F(WARNING, "could not remove fixture directory %s: %s",
              dir.c_str(), ec.message().c_str());
    }
}

string Fixtures::path(const string& name) const
{
    return dir + "/" + name;
}

const string& Fixtures::path_for(FixtureKey key) const
{
    switch (key) {
        case FixtureKey::blank_lines:         return blank;
        case FixtureKey::tabs:                return tabs;
        case FixtureKey::mixed_control:       return mixed;
        case FixtureKey::control:             return control;
        case FixtureKey::no_trailing_newline: return no_newline;
        case FixtureKey::binary:              return binary;
        case FixtureKey::plain:
        default:                              return sample_a;
    }
}

string Fixtures::bytes_for(FixtureKey key) const
{
    return read_file(path_for(key));
}

/**
 * Create a new empty file named '<stem>.XXXXXX' in the fixture directory.
 *
 * @return The path of the created file; the caller removes it.
 */
string Fixtures::make_temp_file(const string& stem) const
{
    string pattern = path(stem + ".XXXXXX");
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd == -1) {
        throw HarnessException("mkstemp " + pattern + ": " + strerror(errno));
    }
    close(fd);
    return buf.data();
}

string Fixtures::read_file(const string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw HarnessException("read " + path + ": " + strerror(errno));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void Fixtures::write_file(const string& path, const string& data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw HarnessException("write " + path + ": " + strerror(errno));
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw HarnessException("write " + path + ": short write");
    }
}

/**
 * Deterministic pseudo-random bytes: the same seed always yields the same
 * buffer, so a failing case can be rerun against identical input.
 */
string Fixtures::random_bytes(std::size_t n, unsigned seed)
{
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    string result(n, '\0');
    for (char& c : result) c = static_cast<char>(dist(gen));
    return result;
}
