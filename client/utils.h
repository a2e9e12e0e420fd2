#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "LoadTestReport.h"

// Random RFC 4122 version 4 identifier, e.g. "3f2b...-4...-a...".
std::string generate_run_id();

// Exactly the report fields; error_stats is null when nothing failed.
nlohmann::json report_to_json(const LoadTestReport& r);

// Human-readable summary block.
std::string format_report_text(const LoadTestReport& r);
