#pragma once

#include "analyzer.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <ostream>

nlohmann::ordered_json report_to_json(const AnalysisReport& report);

// Writes the report as indented JSON, replacing `path` atomically.
void write_report(const AnalysisReport& report, const std::filesystem::path& path);

// Concise console view: name/size/paid table, image estimate and conflicts.
void print_summary(const AnalysisReport& report, std::ostream& out);
