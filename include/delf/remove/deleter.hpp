#pragma once

#include <filesystem>
#include <string>

namespace delf::remove
{

struct DeleteOutcome
{
    bool success = false;
    std::string message;
};

class Deleter
{
public:
    virtual ~Deleter() = default;

    // Removes a file or a whole directory tree. Never throws.
    virtual DeleteOutcome remove(const std::filesystem::path &path) = 0;
};

class FilesystemDeleter : public Deleter
{
public:
    DeleteOutcome remove(const std::filesystem::path &path) override;
};

} // namespace delf::remove
