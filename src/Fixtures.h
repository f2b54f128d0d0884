#pragma once

#include <cstddef>
#include <string>

/* which prepared file's content should accompany a generated option set */
enum class FixtureKey {
    plain,
    blank_lines,
    tabs,
    mixed_control,
    control,
    no_trailing_newline,
    binary
};

std::string to_string(FixtureKey key);

/**
 * The input artifacts of one harness run, created in a fresh directory under
 * $TMPDIR (or /tmp) when constructed and removed with everything in it when
 * destroyed.
 *
 * All members are set by the constructor and never change afterwards. Cases
 * that need their own content write it to a new path inside 'dir'.
 *
 * Exceptions: the constructor throws HarnessException if the directory or any
 * file cannot be created.
 */
class Fixtures {
  public:
    Fixtures();
    ~Fixtures();
    Fixtures(const Fixtures&) = delete;
    Fixtures& operator=(const Fixtures&) = delete;

    /* absolute path of 'name' inside the fixture directory */
    std::string path(const std::string& name) const;

    const std::string& path_for(FixtureKey key) const;
    std::string bytes_for(FixtureKey key) const;

    /* create an empty, uniquely named file in the fixture directory */
    std::string make_temp_file(const std::string& stem) const;

    static std::string read_file(const std::string& path);
    static void write_file(const std::string& path, const std::string& data);
    static std::string random_bytes(std::size_t n, unsigned seed);

    std::string dir;

    std::string sample_a;     // "alpha\n"
    std::string sample_b;     // "beta\n"
    std::string blank;        // runs of blank lines
    std::string tabs;
    std::string mixed;        // tabs plus control bytes and DEL
    std::string dash_name;    // "-dash.txt"
    std::string option_like;  // a file literally named "-n"
    std::string dash_v_file;  // "-vfile.txt"
    std::string empty;
    std::string no_newline;
    std::string large;        // 3000 numbered lines
    std::string huge;         // 1000 numbered lines
    std::string control;      // C0 controls, ESC and a meta byte
    std::string binary;       // 512 pseudo-random bytes
    std::string dir_path;     // an empty subdirectory

    std::string stdin_data;
    std::string stdin_mix;
};
