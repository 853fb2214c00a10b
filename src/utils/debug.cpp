// Copyright (c) licsat contributors.
// SPDX-License-Identifier: MIT
#include "utils/debug.hpp"

namespace licsat {
bool LicsatLogFlag = false;
std::set<std::string> LicsatLog;

void LicsatEnableLog(const std::string& tag) {
    LicsatLogFlag = true;
    LicsatLog.insert(tag);
}

void LicsatDisableLog() {
    LicsatLogFlag = false;
    LicsatLog.clear();
}

bool LicsatWarningFlag = true;
void LicsatEnableWarningMsg(const bool b) { LicsatWarningFlag = b; }

} // namespace licsat
