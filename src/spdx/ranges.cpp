// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <initializer_list>
#include <string_view>

#include "spdx/ranges.hpp"
#include "utils/debug.hpp"

namespace licsat {

static std::vector<LicenseId> family(const std::initializer_list<std::string_view> ids) {
    std::vector<LicenseId> res;
    for (const std::string_view id : ids) {
        const auto license = make_license_id(id);
        if (!license) {
            LICSAT_ERROR("unregistered license in range table: ", id);
        }
        res.push_back(*license);
    }
    return res;
}

const std::vector<std::vector<LicenseId>>& license_ranges() {
    static const std::vector<std::vector<LicenseId>> ranges = {
        family({"AFL-1.1", "AFL-1.2", "AFL-2.0", "AFL-2.1", "AFL-3.0"}),
        family({"AGPL-1.0", "AGPL-3.0"}),
        family({"Apache-1.0", "Apache-1.1", "Apache-2.0"}),
        family({"APSL-1.0", "APSL-1.1", "APSL-1.2", "APSL-2.0"}),
        family({"Artistic-1.0", "Artistic-2.0"}),
        family({"BitTorrent-1.0", "BitTorrent-1.1"}),
        family({"CC-BY-1.0", "CC-BY-2.0", "CC-BY-2.5", "CC-BY-3.0", "CC-BY-4.0"}),
        family({"CC-BY-SA-1.0", "CC-BY-SA-2.0", "CC-BY-SA-2.5", "CC-BY-SA-3.0", "CC-BY-SA-4.0"}),
        family({"CDDL-1.0", "CDDL-1.1"}),
        family({"CECILL-1.0", "CECILL-1.1", "CECILL-2.0"}),
        family({"ECL-1.0", "ECL-2.0"}),
        family({"EFL-1.0", "EFL-2.0"}),
        family({"EUPL-1.0", "EUPL-1.1"}),
        family({"GFDL-1.1", "GFDL-1.2", "GFDL-1.3"}),
        family({"GPL-1.0", "GPL-2.0", "GPL-3.0"}),
        family({"LGPL-2.0", "LGPL-2.1", "LGPL-3.0"}),
        family({"LPL-1.0", "LPL-1.02"}),
        family({"LPPL-1.0", "LPPL-1.1", "LPPL-1.2", "LPPL-1.3a", "LPPL-1.3c"}),
        family({"MPL-1.0", "MPL-1.1", "MPL-2.0"}),
        family({"OFL-1.0", "OFL-1.1"}),
        family({"OSL-1.0", "OSL-1.1", "OSL-2.0", "OSL-2.1", "OSL-3.0"}),
        family({"PHP-3.0", "PHP-3.01"}),
        family({"RPL-1.1", "RPL-1.5"}),
        family({"SISSL", "SISSL-1.2"}),
        family({"YPL-1.0", "YPL-1.1"}),
        family({"ZPL-1.1", "ZPL-2.0", "ZPL-2.1"}),
    };
    return ranges;
}

std::vector<LicenseId> lookup_license_range(const LicenseId& id) {
    for (const auto& range : license_ranges()) {
        const auto it = std::ranges::find(range, id);
        if (it != range.end()) {
            return {it, range.end()};
        }
    }
    return {id};
}

} // namespace licsat
