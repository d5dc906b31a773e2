#include "delf/remove/deleter.hpp"

#include <system_error>

namespace delf::remove
{

DeleteOutcome FilesystemDeleter::remove(const std::filesystem::path &path)
{
    DeleteOutcome outcome;
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec)
    {
        outcome.message = ec.message();
        return outcome;
    }
    outcome.success = true;
    return outcome;
}

} // namespace delf::remove
