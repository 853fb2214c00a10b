// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <cctype>
#include <string>

#include <boost/container/flat_map.hpp>
#include <gsl/narrow>

#include "spdx/license_id.hpp"
#include "utils/debug.hpp"

namespace licsat {

// Registered SPDX licenses: identifier, full name, OSI approval.
static constexpr LicenseInfo license_table[] = {
    {"AAL", "Attribution Assurance License", true},
    {"Abstyles", "Abstyles License", false},
    {"Adobe-2006", "Adobe Systems Incorporated Source Code License Agreement", false},
    {"Adobe-Glyph", "Adobe Glyph List License", false},
    {"ADSL", "Amazon Digital Services License", false},
    {"AFL-1.1", "Academic Free License v1.1", true},
    {"AFL-1.2", "Academic Free License v1.2", true},
    {"AFL-2.0", "Academic Free License v2.0", true},
    {"AFL-2.1", "Academic Free License v2.1", true},
    {"AFL-3.0", "Academic Free License v3.0", true},
    {"Afmparse", "Afmparse License", false},
    {"AGPL-1.0", "Affero General Public License v1.0", false},
    {"AGPL-3.0", "GNU Affero General Public License v3.0", true},
    {"Aladdin", "Aladdin Free Public License", false},
    {"AMDPLPA", "AMD's plpa_map.c License", false},
    {"AML", "Apple MIT License", false},
    {"AMPAS", "Academy of Motion Picture Arts and Sciences BSD", false},
    {"ANTLR-PD", "ANTLR Software Rights Notice", false},
    {"Apache-1.0", "Apache License 1.0", false},
    {"Apache-1.1", "Apache License 1.1", true},
    {"Apache-2.0", "Apache License 2.0", true},
    {"APAFML", "Adobe Postscript AFM License", false},
    {"APL-1.0", "Adaptive Public License 1.0", true},
    {"APSL-1.0", "Apple Public Source License 1.0", true},
    {"APSL-1.1", "Apple Public Source License 1.1", true},
    {"APSL-1.2", "Apple Public Source License 1.2", true},
    {"APSL-2.0", "Apple Public Source License 2.0", true},
    {"Artistic-1.0", "Artistic License 1.0", true},
    {"Artistic-1.0-cl8", "Artistic License 1.0 w/clause 8", true},
    {"Artistic-1.0-Perl", "Artistic License 1.0 (Perl)", true},
    {"Artistic-2.0", "Artistic License 2.0", true},
    {"Bahyph", "Bahyph License", false},
    {"Barr", "Barr License", false},
    {"Beerware", "Beerware License", false},
    {"BitTorrent-1.0", "BitTorrent Open Source License v1.0", false},
    {"BitTorrent-1.1", "BitTorrent Open Source License v1.1", false},
    {"Borceux", "Borceux license", false},
    {"BSD-2-Clause", "BSD 2-clause \"Simplified\" License", true},
    {"BSD-2-Clause-FreeBSD", "BSD 2-clause FreeBSD License", false},
    {"BSD-2-Clause-NetBSD", "BSD 2-clause NetBSD License", false},
    {"BSD-3-Clause", "BSD 3-clause \"New\" or \"Revised\" License", true},
    {"BSD-3-Clause-Clear", "BSD 3-clause Clear License", false},
    {"BSD-4-Clause", "BSD 4-clause \"Original\" or \"Old\" License", false},
    {"BSD-4-Clause-UC", "BSD-4-Clause (University of California-Specific)", false},
    {"BSL-1.0", "Boost Software License 1.0", true},
    {"bzip2-1.0.5", "bzip2 and libbzip2 License v1.0.5", false},
    {"bzip2-1.0.6", "bzip2 and libbzip2 License v1.0.6", false},
    {"CATOSL-1.1", "Computer Associates Trusted Open Source License 1.1", true},
    {"CC-BY-1.0", "Creative Commons Attribution 1.0", false},
    {"CC-BY-2.0", "Creative Commons Attribution 2.0", false},
    {"CC-BY-2.5", "Creative Commons Attribution 2.5", false},
    {"CC-BY-3.0", "Creative Commons Attribution 3.0", false},
    {"CC-BY-4.0", "Creative Commons Attribution 4.0", false},
    {"CC-BY-SA-1.0", "Creative Commons Attribution Share Alike 1.0", false},
    {"CC-BY-SA-2.0", "Creative Commons Attribution Share Alike 2.0", false},
    {"CC-BY-SA-2.5", "Creative Commons Attribution Share Alike 2.5", false},
    {"CC-BY-SA-3.0", "Creative Commons Attribution Share Alike 3.0", false},
    {"CC-BY-SA-4.0", "Creative Commons Attribution Share Alike 4.0", false},
    {"CC0-1.0", "Creative Commons Zero v1.0 Universal", false},
    {"CDDL-1.0", "Common Development and Distribution License 1.0", true},
    {"CDDL-1.1", "Common Development and Distribution License 1.1", false},
    {"CECILL-1.0", "CeCILL Free Software License Agreement v1.0", false},
    {"CECILL-1.1", "CeCILL Free Software License Agreement v1.1", false},
    {"CECILL-2.0", "CeCILL Free Software License Agreement v2.0", false},
    {"CECILL-B", "CeCILL-B Free Software License Agreement", false},
    {"CECILL-C", "CeCILL-C Free Software License Agreement", false},
    {"ClArtistic", "Clarified Artistic License", false},
    {"CNRI-Python", "CNRI Python License", true},
    {"CPAL-1.0", "Common Public Attribution License 1.0", true},
    {"CPL-1.0", "Common Public License 1.0", true},
    {"CUA-OPL-1.0", "CUA Office Public License v1.0", true},
    {"ECL-1.0", "Educational Community License v1.0", true},
    {"ECL-2.0", "Educational Community License v2.0", true},
    {"EFL-1.0", "Eiffel Forum License v1.0", true},
    {"EFL-2.0", "Eiffel Forum License v2.0", true},
    {"Entessa", "Entessa Public License v1.0", true},
    {"EPL-1.0", "Eclipse Public License 1.0", true},
    {"ErlPL-1.1", "Erlang Public License v1.1", false},
    {"EUDatagrid", "EU DataGrid Software License", true},
    {"EUPL-1.0", "European Union Public License 1.0", false},
    {"EUPL-1.1", "European Union Public License 1.1", true},
    {"Fair", "Fair License", true},
    {"Frameworx-1.0", "Frameworx Open License 1.0", true},
    {"FTL", "Freetype Project License", false},
    {"GFDL-1.1", "GNU Free Documentation License v1.1", false},
    {"GFDL-1.2", "GNU Free Documentation License v1.2", false},
    {"GFDL-1.3", "GNU Free Documentation License v1.3", false},
    {"GPL-1.0", "GNU General Public License v1.0 only", false},
    {"GPL-2.0", "GNU General Public License v2.0 only", true},
    {"GPL-3.0", "GNU General Public License v3.0 only", true},
    {"HPND", "Historic Permission Notice and Disclaimer", true},
    {"IPA", "IPA Font License", true},
    {"IPL-1.0", "IBM Public License v1.0", true},
    {"ISC", "ISC License", true},
    {"LGPL-2.0", "GNU Library General Public License v2 only", true},
    {"LGPL-2.1", "GNU Lesser General Public License v2.1 only", true},
    {"LGPL-3.0", "GNU Lesser General Public License v3.0 only", true},
    {"LPL-1.0", "Lucent Public License Version 1.0", true},
    {"LPL-1.02", "Lucent Public License v1.02", true},
    {"LPPL-1.0", "LaTeX Project Public License v1.0", false},
    {"LPPL-1.1", "LaTeX Project Public License v1.1", false},
    {"LPPL-1.2", "LaTeX Project Public License v1.2", false},
    {"LPPL-1.3a", "LaTeX Project Public License v1.3a", false},
    {"LPPL-1.3c", "LaTeX Project Public License v1.3c", true},
    {"MirOS", "MirOS Licence", true},
    {"MIT", "MIT License", true},
    {"Motosoto", "Motosoto License", true},
    {"MPL-1.0", "Mozilla Public License 1.0", true},
    {"MPL-1.1", "Mozilla Public License 1.1", true},
    {"MPL-2.0", "Mozilla Public License 2.0", true},
    {"MPL-2.0-no-copyleft-exception", "Mozilla Public License 2.0 (no copyleft exception)", true},
    {"MS-PL", "Microsoft Public License", true},
    {"MS-RL", "Microsoft Reciprocal License", true},
    {"Multics", "Multics License", true},
    {"NASA-1.3", "NASA Open Source Agreement 1.3", true},
    {"Naumen", "Naumen Public License", true},
    {"NCSA", "University of Illinois/NCSA Open Source License", true},
    {"NGPL", "Nethack General Public License", true},
    {"Nokia", "Nokia Open Source License", true},
    {"NPOSL-3.0", "Non-Profit Open Software License 3.0", true},
    {"NTP", "NTP License", true},
    {"OCLC-2.0", "OCLC Research Public License 2.0", true},
    {"ODbL-1.0", "ODC Open Database License v1.0", false},
    {"OFL-1.0", "SIL Open Font License 1.0", false},
    {"OFL-1.1", "SIL Open Font License 1.1", true},
    {"OGTSL", "Open Group Test Suite License", true},
    {"OLDAP-2.8", "Open LDAP Public License v2.8", true},
    {"OpenSSL", "OpenSSL License", false},
    {"OSL-1.0", "Open Software License 1.0", true},
    {"OSL-1.1", "Open Software License 1.1", false},
    {"OSL-2.0", "Open Software License 2.0", true},
    {"OSL-2.1", "Open Software License 2.1", true},
    {"OSL-3.0", "Open Software License 3.0", true},
    {"PHP-3.0", "PHP License v3.0", true},
    {"PHP-3.01", "PHP License v3.01", false},
    {"PostgreSQL", "PostgreSQL License", true},
    {"Python-2.0", "Python License 2.0", true},
    {"QPL-1.0", "Q Public License 1.0", true},
    {"RPL-1.1", "Reciprocal Public License 1.1", true},
    {"RPL-1.5", "Reciprocal Public License 1.5", true},
    {"RPSL-1.0", "RealNetworks Public Source License v1.0", true},
    {"RSCPL", "Ricoh Source Code Public License", true},
    {"SimPL-2.0", "Simple Public License 2.0", true},
    {"SISSL", "Sun Industry Standards Source License v1.1", true},
    {"SISSL-1.2", "Sun Industry Standards Source License v1.2", false},
    {"Sleepycat", "Sleepycat License", true},
    {"SPL-1.0", "Sun Public License v1.0", true},
    {"Unlicense", "The Unlicense", false},
    {"VSL-1.0", "Vovida Software License v1.0", true},
    {"W3C", "W3C Software Notice and License (2002-12-31)", true},
    {"Watcom-1.0", "Sybase Open Watcom Public License 1.0", true},
    {"WTFPL", "Do What The F*ck You Want To Public License", false},
    {"Xnet", "X.Net License", true},
    {"YPL-1.0", "Yahoo! Public License v1.0", false},
    {"YPL-1.1", "Yahoo! Public License v1.1", false},
    {"Zend-2.0", "Zend License v2.0", false},
    {"Zlib", "zlib License", true},
    {"ZPL-1.1", "Zope Public License 1.1", false},
    {"ZPL-2.0", "Zope Public License 2.0", true},
    {"ZPL-2.1", "Zope Public License 2.1", false},
};

static constexpr std::string_view exception_table[] = {
    "Autoconf-exception-2.0",
    "Autoconf-exception-3.0",
    "Bison-exception-2.2",
    "Classpath-exception-2.0",
    "CLISP-exception-2.0",
    "eCos-exception-2.0",
    "FLTK-exception",
    "Font-exception-2.0",
    "freertos-exception-2.0",
    "GCC-exception-2.0",
    "GCC-exception-3.1",
    "gnu-javamail-exception",
    "i2p-gpl-java-exception",
    "Libtool-exception",
    "LLVM-exception",
    "LZMA-exception",
    "mif-exception",
    "Nokia-Qt-exception-1.1",
    "OCCT-exception-1.0",
    "openvpn-openssl-exception",
    "Qwt-exception-1.0",
    "u-boot-exception-2.0",
    "WxWindows-exception-3.1",
};

static std::string to_lower(const std::string_view s) {
    std::string res{s};
    std::ranges::transform(res, res.begin(), [](const unsigned char c) { return std::tolower(c); });
    return res;
}

using NameIndex = boost::container::flat_map<std::string, uint16_t>;

// Lower-cased identifier -> table position.
template <typename Range, typename Key>
static NameIndex build_index(const Range& table, const Key& key) {
    NameIndex res;
    res.reserve(std::size(table));
    for (size_t i = 0; i < std::size(table); i++) {
        const auto [it, inserted] = res.emplace(to_lower(key(table[i])), gsl::narrow<uint16_t>(i));
        if (!inserted) {
            LICSAT_ERROR("duplicate identifier in table: ", key(table[i]));
        }
    }
    return res;
}

static const NameIndex& license_index() {
    static const NameIndex index = build_index(license_table, [](const LicenseInfo& info) { return info.id; });
    return index;
}

static const NameIndex& exception_index() {
    static const NameIndex index = build_index(exception_table, [](const std::string_view id) { return id; });
    return index;
}

std::optional<LicenseId> make_license_id(const std::string_view id) {
    const auto& index = license_index();
    const auto it = index.find(to_lower(id));
    if (it == index.end()) {
        return {};
    }
    return LicenseId{it->second};
}

std::optional<LicenseExceptionId> make_license_exception_id(const std::string_view id) {
    const auto& index = exception_index();
    const auto it = index.find(to_lower(id));
    if (it == index.end()) {
        return {};
    }
    return LicenseExceptionId{it->second};
}

const LicenseInfo& LicenseId::info() const {
    if (index_ >= std::size(license_table)) {
        LICSAT_ERROR("license index out of range: ", index_);
    }
    return license_table[index_];
}

std::string_view LicenseId::str() const { return info().id; }

std::string_view LicenseExceptionId::str() const {
    if (index_ >= std::size(exception_table)) {
        LICSAT_ERROR("license exception index out of range: ", index_);
    }
    return exception_table[index_];
}

std::span<const LicenseInfo> licenses() { return license_table; }

std::vector<LicenseId> license_identifiers() {
    std::vector<LicenseId> res;
    res.reserve(std::size(license_table));
    for (const LicenseInfo& info : license_table) {
        res.push_back(make_license_id(info.id).value());
    }
    return res;
}

std::span<const std::string_view> license_exceptions() { return exception_table; }

std::ostream& operator<<(std::ostream& os, const LicenseId& id) { return os << id.str(); }

std::ostream& operator<<(std::ostream& os, const LicenseExceptionId& id) { return os << id.str(); }

std::ostream& operator<<(std::ostream& os, const LicenseRef& ref) {
    if (ref.document) {
        os << "DocumentRef-" << *ref.document << ":";
    }
    return os << "LicenseRef-" << ref.license;
}

} // namespace licsat
