/*
 * The Sleuth Kit
 *
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#define CATCH_CONFIG_MAIN
#define CATCH_CONFIG_CONSOLE_WIDTH 120

#include "catch.hpp"
#include "runner.h"
#include <iostream>
#include <fstream>
#include <memory>

/* This program runs the catch2 tests */

/* Support for runners */
namespace runner {
    // https://inversepalindrome.com/blog/how-to-create-a-random-string-in-cpp
    std::string random_string(std::size_t length) {
        const std::string CHARACTERS = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

        std::random_device random_device;
        std::mt19937 generator(random_device());
        std::uniform_int_distribution<> distribution(0, CHARACTERS.size() - 1);

        std::string random_string;

        for (std::size_t i = 0; i < length; ++i) { random_string += CHARACTERS[distribution(generator)]; }

        return random_string;
    }

    bool contains(std::string line, std::string substr) {
        return line.find(substr) != std::string::npos;
    }

    std::string file_contents(std::filesystem::path path) {
        std::ifstream in(path, std::ios::binary | std::ios::ate);
        REQUIRE (in.is_open());
        auto size = in.tellg();
        if (size == 0) {
            return std::string();
        }
        std::unique_ptr<char[]>memblock(new char [size]);
        in.seekg (0, std::ios::beg);
        in.read (memblock.get(), size);
        in.close();
        return std::string(memblock.get(),size);
    }

    bool file_contains(std::filesystem::path path, std::string substr) {
        return contains(file_contents(path), substr);
    }

    void write_file(std::filesystem::path path, const std::string& contents) {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot write " + path.string());
        }
        out.write(contents.data(), contents.size());
    }

    tempdir::tempdir(std::string testname) {
        path = NamedTemporaryDirectory(testname);
    }

    tempdir::~tempdir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) {
            std::cerr << "cannot remove " << path << ": " << ec.message() << "\n";
        }
    }
}
