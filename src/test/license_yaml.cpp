// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT

#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "license_checker.hpp"
#include "spdx/parse.hpp"
#include "test/license_yaml.hpp"

using std::string;
using std::vector;

namespace licsat {

static std::set<string> as_set_empty_default(const YAML::Node& optional_node) {
    if (!optional_node.IsDefined() || optional_node.IsNull()) {
        return {};
    }
    const auto items = optional_node.as<vector<string>>();
    return {items.begin(), items.end()};
}

static std::optional<string> as_optional_string(const YAML::Node& optional_node) {
    if (!optional_node.IsDefined() || optional_node.IsNull()) {
        return std::nullopt;
    }
    return optional_node.as<string>();
}

static string required_string(const YAML::Node& case_node, const string& key) {
    const YAML::Node node = case_node[key];
    if (!node.IsDefined() || node.IsNull() || !node.IsScalar()) {
        throw std::runtime_error("test case missing required '" + key + "' field");
    }
    return node.as<string>();
}

static TestCase::Check parse_check(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return TestCase::Check::satisfies;
    }
    const auto s = node.as<string>();
    if (s == "satisfies") {
        return TestCase::Check::satisfies;
    }
    if (s == "equivalent") {
        return TestCase::Check::equivalent;
    }
    throw std::runtime_error("Invalid check: " + s);
}

static licsat_options_t raw_options_to_options(const std::set<string>& raw_options) {
    licsat_options_t options{};
    for (const string& name : raw_options) {
        if (name == "expand_ranges") {
            options.expand_ranges = true;
        } else if (name == "!expand_ranges") {
            options.expand_ranges = false;
        } else {
            throw std::runtime_error("Unknown option: " + name);
        }
    }
    return options;
}

static TestCase read_case(const YAML::Node& case_node) {
    TestCase res{
        .name = required_string(case_node, "test-case"),
        .check = parse_check(case_node["check"]),
        .options = raw_options_to_options(as_set_empty_default(case_node["options"])),
        .lhs = {},
        .rhs = {},
        .expected = std::nullopt,
        .expected_exception = as_optional_string(case_node["expected-exception"]),
    };
    if (res.check == TestCase::Check::satisfies) {
        res.lhs = required_string(case_node, "package");
        res.rhs = required_string(case_node, "policy");
    } else {
        res.lhs = required_string(case_node, "a");
        res.rhs = required_string(case_node, "b");
    }
    if (!res.expected_exception) {
        const YAML::Node expect = case_node["expect"];
        if (!expect.IsDefined() || expect.IsNull()) {
            throw std::runtime_error("test case '" + res.name + "' needs 'expect' or 'expected-exception'");
        }
        res.expected = expect.as<bool>();
    }
    return res;
}

static vector<TestCase> read_suite(const string& path) {
    std::ifstream f{path};
    if (!f) {
        throw std::runtime_error("cannot open test suite " + path);
    }
    vector<TestCase> res;
    for (const YAML::Node& config : YAML::LoadAll(f)) {
        res.push_back(read_case(config));
    }
    return res;
}

static string describe(const bool holds) { return holds ? "true" : "false"; }

std::optional<Failure> run_yaml_test_case(TestCase test_case, const bool debug) {
    if (debug) {
        test_case.options.verbosity_opts.print_formulas = true;
        test_case.options.verbosity_opts.print_stats = true;
    }
    const string expected = test_case.expected_exception ? "Exception: " + *test_case.expected_exception
                                                         : describe(test_case.expected.value_or(false));
    string actual;
    try {
        const LicenseExpression lhs = parse_expression(test_case.lhs);
        const LicenseExpression rhs = parse_expression(test_case.rhs);
        const CheckReport report = test_case.check == TestCase::Check::satisfies
                                       ? check_satisfies(lhs, rhs, test_case.options)
                                       : check_equivalent(lhs, rhs, test_case.options);
        if (debug) {
            print_report(std::cout, report, test_case.options.verbosity_opts);
        }
        actual = describe(report.holds);
    } catch (const std::exception& ex) {
        actual = string{"Exception: "} + ex.what();
    }
    if (actual == expected) {
        return {};
    }
    return Failure{.expected = expected, .actual = actual};
}

void print_failure(const Failure& failure, std::ostream& os) {
    constexpr auto INDENT = "  ";
    os << "Expected:\n" << INDENT << failure.expected << "\n";
    os << "Actual:\n" << INDENT << failure.actual << "\n";
}

void foreach_suite(const string& path, const std::function<void(const TestCase&)>& f) {
    for (const TestCase& test_case : read_suite(path)) {
        f(test_case);
    }
}

} // namespace licsat
