#pragma once

#include <filesystem>
#include <string>

namespace ur::services
{

struct RegistrationResult
{
    bool success = false;
    // false when the desktop entry or registry keys were already in place.
    bool changed = false;
    std::string message;
};

class ISchemeRegistrar
{
  public:
    virtual ~ISchemeRegistrar() noexcept = default;

    // Idempotent. Never throws; failures are logged.
    virtual void register_scheme(std::string const &scheme) = 0;
};

// Makes this executable the per-user handler of a URI scheme.
//   Windows: HKCU\Software\Classes\<scheme>
//   Linux:   $XDG_DATA_HOME/applications/urirelay-<scheme>.desktop + xdg-mime
//   macOS:   declared by the bundle's Info.plist; nothing to do at runtime
class SchemeRegistrar final : public ISchemeRegistrar
{
  public:
    // An empty path means the running executable.
    explicit SchemeRegistrar(std::filesystem::path executable = {});

    void register_scheme(std::string const &scheme) override;

    RegistrationResult try_register(std::string const &scheme) const;

  private:
    std::filesystem::path executable_;
};

std::string desktop_entry_name(std::string const &scheme);

} // namespace ur::services
