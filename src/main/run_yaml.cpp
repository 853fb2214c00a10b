// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <iostream>
#include <string>
#include <vector>

#include "test/license_yaml.hpp"

// Avoid affecting other headers by macros.
#include <CLI/CLI.hpp>

using namespace licsat;

int main(int argc, char** argv) {
    CLI::App app{"Run YAML test cases"};

    std::vector<std::string> filenames;
    app.add_option("paths", filenames, "YAML files to run")->required()->check(CLI::ExistingFile);

    std::string pattern;
    app.add_option("--pattern", pattern, "Only run the test case with this name")->type_name("NAME");

    bool verbose = false;
    app.add_flag("-v", verbose, "Print formulas and statistics for each test case");

    CLI11_PARSE(app, argc, argv);

    bool res = true;
    for (const std::string& filename : filenames) {
        std::cout << "// Test suite: " << filename << "\n";
        try {
            foreach_suite(filename, [&](const TestCase& test_case) {
                if (!pattern.empty() && test_case.name != pattern) {
                    return;
                }
                std::cout << "test case: " << test_case.name << ": ";
                if (const auto failure = run_yaml_test_case(test_case, verbose)) {
                    std::cout << "failed\n";
                    print_failure(*failure, std::cout);
                    res = false;
                } else {
                    std::cout << "pass\n";
                }
            });
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << std::endl;
            return 2;
        }
    }
    return res ? 0 : 1;
}
