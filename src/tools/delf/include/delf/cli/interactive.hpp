#pragma once

#include "delf/remove/deletion_gate.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

namespace delf::cli
{

// Expands a leading "~" to $HOME and every $VAR or ${VAR}. Unset variables
// expand to nothing.
std::string expandUserPath(const std::string &input);

// Empty answer means the current directory. The answer must name an existing
// directory.
std::optional<std::filesystem::path> promptSearchRoot(remove::Prompter &prompter, std::ostream &out, std::ostream &err);

std::optional<std::string> promptPattern(remove::Prompter &prompter, std::ostream &out, std::ostream &err);

} // namespace delf::cli
