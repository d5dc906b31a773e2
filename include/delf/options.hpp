#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace delf::config
{

// Alternative order matches OptionValue.
enum class OptionKind
{
    Boolean,
    Integer,
    String,
    StringList
};

using OptionValue = std::variant<bool, std::int64_t, std::string, std::vector<std::string>>;

OptionKind kindOf(const OptionValue &value) noexcept;
const char *kindName(OptionKind kind) noexcept;

struct OptionDefinition
{
    std::string key;
    OptionKind kind = OptionKind::String;
    OptionValue defaultValue;
    std::string description;
};

/**
 * Typed option table for one application. A value is its definition's
 * default until a loaded file or an explicit set() replaces it. Files are
 * plain JSON objects keyed by option name; unknown keys are ignored and a
 * value of the wrong JSON type rejects the whole file.
 *
 * Reading an option that was never registered throws std::out_of_range.
 */
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(OptionDefinition definition);
    std::vector<OptionDefinition> definitions() const;

    // False for unknown keys and for values of the wrong kind.
    bool set(const std::string &key, OptionValue value);
    bool isOverridden(const std::string &key) const;

    bool getBool(const std::string &key) const;
    std::int64_t getInteger(const std::string &key) const;
    const std::string &getString(const std::string &key) const;
    const std::vector<std::string> &getStringList(const std::string &key) const;

    bool loadFromFile(const std::filesystem::path &filePath, std::string *error = nullptr);
    bool saveToFile(const std::filesystem::path &filePath, std::string *error = nullptr) const;

    // Missing defaults file is not an error.
    bool loadDefaults(std::string *error = nullptr);
    std::filesystem::path defaultOptionsPath() const;

    static std::filesystem::path configRoot();

private:
    struct Entry
    {
        OptionDefinition definition;
        std::optional<OptionValue> value;
    };

    Entry *find(const std::string &key) noexcept;
    const Entry *find(const std::string &key) const noexcept;
    const OptionValue &current(const std::string &key, OptionKind kind) const;

    std::string id;
    std::vector<Entry> entries;
};

} // namespace delf::config
