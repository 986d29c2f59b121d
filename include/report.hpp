// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "application.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace replichain {
namespace app {

// Machine-readable report
nlohmann::json ReportToJson(const ScenarioResult &result);

// Human-readable report (tables of roots and verdicts); verbose adds every
// block of every replica
std::string RenderReport(const ScenarioResult &result, bool verbose = false);

} // namespace app
} // namespace replichain
