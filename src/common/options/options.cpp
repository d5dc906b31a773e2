#include "delf/options.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace delf::config
{
namespace
{

std::optional<OptionValue> fromJson(OptionKind kind, const nlohmann::json &value)
{
    switch (kind)
    {
    case OptionKind::Boolean:
        if (value.is_boolean())
            return OptionValue(value.get<bool>());
        break;
    case OptionKind::Integer:
        if (value.is_number_integer())
            return OptionValue(value.get<std::int64_t>());
        break;
    case OptionKind::String:
        if (value.is_string())
            return OptionValue(value.get<std::string>());
        break;
    case OptionKind::StringList:
        if (value.is_string())
            return OptionValue(std::vector<std::string>{value.get<std::string>()});
        if (value.is_array())
        {
            std::vector<std::string> items;
            for (const auto &item : value)
            {
                if (!item.is_string())
                    return std::nullopt;
                items.push_back(item.get<std::string>());
            }
            return OptionValue(std::move(items));
        }
        break;
    }
    return std::nullopt;
}

nlohmann::ordered_json toJson(const OptionValue &value)
{
    return std::visit([](const auto &held) { return nlohmann::ordered_json(held); }, value);
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        std::filesystem::path path(xdg);
        if (!path.empty())
            return path / "delf";
    }
    if (const char *home = std::getenv("HOME"))
    {
        std::filesystem::path path(home);
        if (!path.empty())
            return path / ".config" / "delf";
    }
    return std::filesystem::path(".config") / "delf";
}

bool fail(std::string *error, std::string reason)
{
    if (error)
        *error = std::move(reason);
    return false;
}

} // namespace

OptionKind kindOf(const OptionValue &value) noexcept
{
    return static_cast<OptionKind>(value.index());
}

const char *kindName(OptionKind kind) noexcept
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return "boolean";
    case OptionKind::Integer:
        return "integer";
    case OptionKind::String:
        return "string";
    case OptionKind::StringList:
        return "string list";
    }
    return "unknown";
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(OptionDefinition definition)
{
    if (kindOf(definition.defaultValue) != definition.kind)
        throw std::invalid_argument("default of option '" + definition.key + "' is not a " + kindName(definition.kind));

    if (Entry *existing = find(definition.key))
    {
        existing->definition = std::move(definition);
        if (existing->value && kindOf(*existing->value) != existing->definition.kind)
            existing->value.reset();
        return;
    }
    entries.push_back(Entry{std::move(definition), std::nullopt});
}

std::vector<OptionDefinition> OptionRegistry::definitions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(entries.size());
    for (const auto &entry : entries)
        result.push_back(entry.definition);
    return result;
}

bool OptionRegistry::set(const std::string &key, OptionValue value)
{
    Entry *entry = find(key);
    if (!entry || kindOf(value) != entry->definition.kind)
        return false;
    entry->value = std::move(value);
    return true;
}

bool OptionRegistry::isOverridden(const std::string &key) const
{
    const Entry *entry = find(key);
    return entry && entry->value.has_value();
}

bool OptionRegistry::getBool(const std::string &key) const
{
    return std::get<bool>(current(key, OptionKind::Boolean));
}

std::int64_t OptionRegistry::getInteger(const std::string &key) const
{
    return std::get<std::int64_t>(current(key, OptionKind::Integer));
}

const std::string &OptionRegistry::getString(const std::string &key) const
{
    return std::get<std::string>(current(key, OptionKind::String));
}

const std::vector<std::string> &OptionRegistry::getStringList(const std::string &key) const
{
    return std::get<std::vector<std::string>>(current(key, OptionKind::StringList));
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath, std::string *error)
{
    std::ifstream in(filePath);
    if (!in)
        return fail(error, "cannot open " + filePath.string());

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded())
        return fail(error, filePath.string() + ": not valid JSON");
    if (!data.is_object())
        return fail(error, filePath.string() + ": expected a JSON object");

    // Nothing is applied unless every known key converts.
    std::map<std::string, OptionValue> staged;
    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const Entry *entry = find(it.key());
        if (!entry)
            continue;
        auto parsed = fromJson(entry->definition.kind, it.value());
        if (!parsed)
        {
            return fail(error, filePath.string() + ": option '" + it.key() + "' expects a " +
                                   kindName(entry->definition.kind));
        }
        staged.emplace(it.key(), std::move(*parsed));
    }

    for (auto &[key, value] : staged)
        find(key)->value = std::move(value);
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath, std::string *error) const
{
    nlohmann::ordered_json data = nlohmann::ordered_json::object();
    for (const auto &entry : entries)
        data[entry.definition.key] = toJson(entry.value.value_or(entry.definition.defaultValue));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);
    if (ec)
        return fail(error, "cannot create " + filePath.parent_path().string() + ": " + ec.message());

    std::ofstream out(filePath);
    if (!out)
        return fail(error, "cannot write " + filePath.string());
    out << data.dump(2) << '\n';
    if (!out)
        return fail(error, "write to " + filePath.string() + " failed");
    return true;
}

bool OptionRegistry::loadDefaults(std::string *error)
{
    std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return true;
    return loadFromFile(path, error);
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / (id + ".json");
}

std::filesystem::path OptionRegistry::configRoot()
{
    static std::filesystem::path root = detectConfigRoot();
    return root;
}

OptionRegistry::Entry *OptionRegistry::find(const std::string &key) noexcept
{
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry &entry) { return entry.definition.key == key; });
    return it == entries.end() ? nullptr : &*it;
}

const OptionRegistry::Entry *OptionRegistry::find(const std::string &key) const noexcept
{
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const Entry &entry) { return entry.definition.key == key; });
    return it == entries.end() ? nullptr : &*it;
}

const OptionValue &OptionRegistry::current(const std::string &key, OptionKind kind) const
{
    const Entry *entry = find(key);
    if (!entry)
        throw std::out_of_range("unknown option '" + key + "'");
    if (entry->definition.kind != kind)
        throw std::out_of_range("option '" + key + "' is a " + kindName(entry->definition.kind));
    return entry->value ? *entry->value : entry->definition.defaultValue;
}

} // namespace delf::config
