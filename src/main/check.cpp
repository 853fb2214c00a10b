// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <iostream>
#include <set>
#include <string>

#include <gsl/narrow>

#include "licsat.hpp"
#include "utils/debug.hpp"

// Avoid affecting other headers by macros.
#include <CLI/CLI.hpp>

using std::string;

using namespace licsat;

static const std::set<string> log_tags = {"check", "eval", "parse", "translate"};

static void print_info(const LicenseId& id) {
    std::cout << id << "\n";
    std::cout << "name: " << license_name(id) << "\n";
    std::cout << "osi-approved: " << (is_osi_approved(id) ? "yes" : "no") << "\n";
    std::cout << "or-later:";
    for (const LicenseId& member : lookup_license_range(id)) {
        std::cout << " " << member;
    }
    std::cout << "\n";
}

int main(int argc, char** argv) {
    licsat_options_t options;

    // Parse command line arguments:

    CLI::App app{"licsat decides whether SPDX license expressions satisfy license policies."};
    app.require_subcommand(1);

    app.add_flag("-v", options.verbosity_opts.print_formulas, "Print the lattice formulas being compared")
        ->group("Verbosity");
    app.add_flag("--stats", options.verbosity_opts.print_stats, "Print search statistics")->group("Verbosity");

    std::set<string> enabled_logs;
    app.add_option("--log", enabled_logs, "Enable debug logging for TAGS")
        ->group("Verbosity")
        ->type_name("TAGS")
        ->delimiter(',')
        ->expected(0, gsl::narrow<int>(log_tags.size()))
        ->check(CLI::IsMember(log_tags));

    app.add_flag("--expand-ranges,!--no-expand-ranges", options.expand_ranges,
                 "Expand 'id+' to the later versions of id. Default: expand")
        ->group("Features");

    bool quiet_warnings = false;
    app.add_flag("-q,--no-warnings", quiet_warnings, "Do not print warnings")->group("Features");

    string package;
    string policy;
    CLI::App* satisfies_cmd = app.add_subcommand("satisfies", "Does the package license satisfy the policy?");
    satisfies_cmd->add_option("package", package, "License expression of the package")->required();
    satisfies_cmd->add_option("policy", policy, "License expression of the policy")->required();

    string lhs;
    string rhs;
    CLI::App* equivalent_cmd = app.add_subcommand("equivalent", "Are two license expressions equivalent?");
    equivalent_cmd->add_option("a", lhs, "License expression")->required();
    equivalent_cmd->add_option("b", rhs, "License expression")->required();

    string license;
    CLI::App* info_cmd = app.add_subcommand("info", "Describe a registered license identifier");
    info_cmd->add_option("id", license, "License identifier")->required();

    bool osi_only = false;
    CLI::App* list_cmd = app.add_subcommand("list", "List registered license identifiers");
    list_cmd->add_flag("--osi", osi_only, "Only OSI approved licenses");

    CLI11_PARSE(app, argc, argv);

    for (const string& tag : enabled_logs) {
        LicsatEnableLog(tag);
    }
    LicsatEnableWarningMsg(!quiet_warnings);

    // Main program

    if (list_cmd->parsed()) {
        for (const LicenseInfo& info : licenses()) {
            if (!osi_only || info.osi_approved) {
                std::cout << info.id << "\n";
            }
        }
        return 0;
    }

    if (info_cmd->parsed()) {
        const auto id = make_license_id(license);
        if (!id) {
            std::cerr << "error: unknown license identifier '" << license << "'\n";
            return 2;
        }
        print_info(*id);
        return 0;
    }

    try {
        const CheckReport report =
            satisfies_cmd->parsed()
                ? check_satisfies(parse_expression(package), parse_expression(policy), options)
                : check_equivalent(parse_expression(lhs), parse_expression(rhs), options);
        print_report(std::cout, report, options.verbosity_opts);
        return report.holds ? 0 : 1;
    } catch (const ParseError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 3;
    }
}
