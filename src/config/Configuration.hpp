#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ur::config
{

inline constexpr std::chrono::milliseconds kDefaultIdleTimeout{10000};
// Upper bound keeps start + timeout representable on the steady clock.
inline constexpr std::chrono::milliseconds kMaxIdleTimeout{24 * 60 * 60 * 1000};
inline constexpr char kDefaultScheme[] = "ida";

// Read once at startup, then only passed around by const reference.
struct Configuration
{
    std::string processing_tool_path;
    std::vector<std::string> extra_search_paths;
    std::vector<std::string> schemes{kDefaultScheme};
    std::chrono::milliseconds idle_timeout{kDefaultIdleTimeout};
};

class ConfigurationError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// True for RFC 3986 scheme names: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ).
bool is_valid_scheme(std::string_view scheme) noexcept;

// origin only feeds error messages.
Configuration parse_configuration(std::string_view payload,
                                  std::string const &origin);

Configuration load_configuration(std::filesystem::path const &settings_file);

class IConfigurationSource
{
  public:
    virtual ~IConfigurationSource() noexcept = default;
    // Throws ConfigurationError.
    virtual Configuration load() const = 0;
};

class FileConfigurationSource final : public IConfigurationSource
{
  public:
    // An empty path means the platform default from ConfigPath::detect().
    explicit FileConfigurationSource(std::filesystem::path settings_file = {});

    Configuration load() const override;

    std::filesystem::path settings_file() const;

  private:
    std::filesystem::path override_path_;
};

} // namespace ur::config
