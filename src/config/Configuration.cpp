#include "config/Configuration.hpp"

#include "config/ConfigPath.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cctype>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace ur::config
{

namespace
{

std::string read_whole_file(std::filesystem::path const &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        throw ConfigurationError(
            std::format("Settings could not be loaded from {}", path.string()));
    }
    std::ifstream input(path, std::ios::binary);
    if (!input)
    {
        throw ConfigurationError(
            std::format("Settings file {} is not readable", path.string()));
    }
    std::string content((std::istreambuf_iterator<char>(input)),
                        std::istreambuf_iterator<char>());
    if (input.bad())
    {
        throw ConfigurationError(
            std::format("Failed reading settings file {}", path.string()));
    }
    return content;
}

} // namespace

bool is_valid_scheme(std::string_view scheme) noexcept
{
    if (scheme.empty() ||
        !std::isalpha(static_cast<unsigned char>(scheme.front())))
    {
        return false;
    }
    for (char ch : scheme)
    {
        auto uch = static_cast<unsigned char>(ch);
        if (!std::isalnum(uch) && ch != '+' && ch != '-' && ch != '.')
        {
            return false;
        }
    }
    return true;
}

Configuration parse_configuration(std::string_view payload,
                                  std::string const &origin)
{
    std::string parse_error;
    auto doc = json::Document::parse(payload, &parse_error);
    if (!doc.is_valid())
    {
        throw ConfigurationError(
            std::format("Malformed settings file {}: {}", origin, parse_error));
    }
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        throw ConfigurationError(std::format(
            "Malformed settings file {}: top level is not an object", origin));
    }

    Configuration config;

    auto tool = json::get_string(root, "processing_tool_path");
    if (!tool.ok)
    {
        throw ConfigurationError(std::format(
            "Malformed settings file {}: processing_tool_path must be a string",
            origin));
    }
    if (!tool.value || tool.value->empty())
    {
        throw ConfigurationError(std::format(
            "Settings file {} does not name a processing tool "
            "(processing_tool_path)",
            origin));
    }
    config.processing_tool_path = std::move(*tool.value);

    auto search_paths = json::get_string_array(root, "extra_search_paths");
    if (!search_paths.ok)
    {
        throw ConfigurationError(std::format(
            "Malformed settings file {}: extra_search_paths must be a list of "
            "strings",
            origin));
    }
    if (search_paths.value)
    {
        config.extra_search_paths = std::move(*search_paths.value);
    }

    auto schemes = json::get_string_array(root, "schemes");
    if (!schemes.ok)
    {
        throw ConfigurationError(std::format(
            "Malformed settings file {}: schemes must be a list of strings",
            origin));
    }
    if (schemes.value)
    {
        for (auto const &scheme : *schemes.value)
        {
            if (!is_valid_scheme(scheme))
            {
                throw ConfigurationError(std::format(
                    "Malformed settings file {}: '{}' is not a URI scheme",
                    origin, scheme));
            }
        }
        config.schemes = std::move(*schemes.value);
    }

    auto idle = json::get_integer(root, "idle_timeout_ms");
    if (!idle.ok || (idle.value && (*idle.value <= 0 ||
                                    *idle.value > kMaxIdleTimeout.count())))
    {
        throw ConfigurationError(std::format(
            "Malformed settings file {}: idle_timeout_ms must be a positive "
            "integer no greater than {}",
            origin, kMaxIdleTimeout.count()));
    }
    if (idle.value)
    {
        config.idle_timeout = std::chrono::milliseconds(*idle.value);
    }

    return config;
}

Configuration load_configuration(std::filesystem::path const &settings_file)
{
    UR_LOG_INFO("Loading settings from {}", settings_file.string());
    auto content = read_whole_file(settings_file);
    auto config = parse_configuration(content, settings_file.string());
    UR_LOG_DEBUG("Processing tool: {} ({} extra search paths, {} schemes)",
                 config.processing_tool_path, config.extra_search_paths.size(),
                 config.schemes.size());
    return config;
}

FileConfigurationSource::FileConfigurationSource(
    std::filesystem::path settings_file)
    : override_path_(std::move(settings_file))
{
}

std::filesystem::path FileConfigurationSource::settings_file() const
{
    if (!override_path_.empty())
    {
        return override_path_;
    }
    auto location = ConfigPath::detect();
    if (!location)
    {
        throw ConfigurationError(
            "Unable to locate the settings directory (home directory unknown)");
    }
    return location->settings_file();
}

Configuration FileConfigurationSource::load() const
{
    return load_configuration(settings_file());
}

} // namespace ur::config
