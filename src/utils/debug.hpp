// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace licsat {

// Logging is enabled per tag, e.g. LicsatEnableLog("eval").
extern bool LicsatLogFlag;
extern std::set<std::string> LicsatLog;

#ifdef NLICSATLOG
#define LICSAT_LOG(TAG, CODE) \
    {}
#else
#define LICSAT_LOG(TAG, CODE)                                                        \
    do {                                                                             \
        if (::licsat::LicsatLogFlag && ::licsat::LicsatLog.contains(TAG)) {          \
            CODE;                                                                    \
        }                                                                            \
    } while (0)
#endif

void LicsatEnableLog(const std::string& tag);
void LicsatDisableLog();

extern bool LicsatWarningFlag;
void LicsatEnableWarningMsg(bool b);

inline void licsat_print(std::ostream&) {}

template <typename Head, typename... Tail>
void licsat_print(std::ostream& os, const Head& head, const Tail&... tail) {
    os << head;
    licsat_print(os, tail...);
}

#define LICSAT_ERROR(...)                                 \
    do {                                                  \
        std::ostringstream os;                            \
        os << "LICSAT ERROR: ";                           \
        ::licsat::licsat_print(os, __VA_ARGS__);          \
        throw std::runtime_error(os.str());               \
    } while (0)

#define LICSAT_WARN(...)                                  \
    do {                                                  \
        if (::licsat::LicsatWarningFlag) {                \
            std::cerr << "LICSAT WARNING: ";              \
            ::licsat::licsat_print(std::cerr, __VA_ARGS__); \
            std::cerr << "\n";                            \
        }                                                 \
    } while (0)

} // namespace licsat
