/* helper functions for test runners.
 * (C) Simson L. Garfinkel, BasisTech LLC, 2024
 */

#ifndef RUNNER_H
#define RUNNER_H

#include <string>
#include <sstream>
#include <random>
#include <filesystem>

// https://stackoverflow.com/questions/3379956/how-to-create-a-temporary-directory-in-c
inline std::filesystem::path NamedTemporaryDirectory(std::string prefix, unsigned long long max_tries = 1000) {
    std::random_device dev;
    std::mt19937 prng(dev());
    std::uniform_int_distribution<uint64_t> rand(0);
    std::filesystem::path path;
    for (unsigned int i=0; i<max_tries; i++ ){
        std::stringstream ss;
        ss << prefix << "_" << std::hex << rand(prng);
        path = std::filesystem::temp_directory_path() / ss.str();
        if (std::filesystem::create_directory(path)) {
            return path;
        }
    }
    throw std::runtime_error("could not create NamedTemporaryDirectory");
}

namespace runner {
    bool contains(std::string line, std::string substr);
    std::string random_string(std::size_t length);
    std::string file_contents(std::filesystem::path path);
    bool file_contains(std::filesystem::path path, std::string substr);

    /* Writes bytes to a file, creating parent directories. */
    void write_file(std::filesystem::path path, const std::string& contents);

    /* A temporary directory removed with everything below it. */
    struct tempdir {
        tempdir(std::string testname);
        ~tempdir();
        std::filesystem::path path;
        std::string str() const { return path.string(); }
    };
}

#endif
