#pragma once

#include "config/Configuration.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace ur::dispatch
{

struct DispatchResult
{
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    // Set when the child died from a signal; exit_code is then 1.
    bool killed = false;
};

// The tool could not be started at all.
class DispatchError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

class IDispatcher
{
  public:
    virtual ~IDispatcher() noexcept = default;
    virtual DispatchResult dispatch(std::string const &uri) = 0;
};

// Runs `<processing_tool_path> <uri>` and blocks until the child exits with
// both output streams drained.
class Dispatcher final : public IDispatcher
{
  public:
    explicit Dispatcher(config::Configuration const &config);

    DispatchResult dispatch(std::string const &uri) override;

    // processing_tool_path after the extra_search_paths / PATH lookup.
    std::filesystem::path resolve_tool() const;

  private:
    config::Configuration const &config_;
};

} // namespace ur::dispatch
