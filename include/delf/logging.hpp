#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace delf::logging
{

// $XDG_STATE_HOME/delf/delf.log, else ~/.delf/delf.log.
std::filesystem::path defaultLogPath();

// Points the run log at an append-only file. Returns false (and keeps the
// null sink) when the file cannot be opened.
bool initRunLog(const std::filesystem::path &file, std::string_view level = "info");
void disableRunLog();

// Never null. Discards everything until initRunLog() succeeds.
std::shared_ptr<spdlog::logger> runLog();

spdlog::level::level_enum parseLevel(std::string_view level) noexcept;

} // namespace delf::logging
