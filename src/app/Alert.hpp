#pragma once

#include <memory>
#include <string>

namespace ur::app
{

inline constexpr char kErrorTitle[] = "UriRelay Error";
inline constexpr char kWarningTitle[] = "UriRelay Warning";
inline constexpr char kHeadlessEnv[] = "URIRELAY_HEADLESS";

// User-visible surface for fatal errors and child warnings. Both calls block
// until the user has dismissed the message.
class IAlerter
{
  public:
    virtual ~IAlerter() noexcept = default;
    virtual void error(std::string const &title, std::string const &message) = 0;
    virtual void warning(std::string const &title,
                         std::string const &message) = 0;
};

class ConsoleAlerter final : public IAlerter
{
  public:
    void error(std::string const &title, std::string const &message) override;
    void warning(std::string const &title,
                 std::string const &message) override;
};

// MessageBoxW on Windows, osascript on macOS, zenity or kdialog on Linux.
// Falls back to the console when no dialog could be shown.
class DialogAlerter final : public IAlerter
{
  public:
    void error(std::string const &title, std::string const &message) override;
    void warning(std::string const &title,
                 std::string const &message) override;

  private:
    ConsoleAlerter fallback_;
};

// ConsoleAlerter when URIRELAY_HEADLESS is set to anything but "0".
std::unique_ptr<IAlerter> make_alerter();

} // namespace ur::app
