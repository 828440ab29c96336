#include "utils/Log.hpp"
#include "config/ConfigPath.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <system_error>

namespace ur::log
{

void append_log_line_to_file(std::string const &line)
{
    static std::mutex s_mutex;
    static std::ofstream s_ofs;
    static std::optional<std::filesystem::path> s_path;
    static bool s_resolved = false;

    std::lock_guard<std::mutex> lk(s_mutex);
    if (!s_resolved)
    {
        s_resolved = true;
        // The logger never creates the configuration directory.
        if (auto location = ur::config::ConfigPath::detect())
        {
            std::error_code ec;
            if (std::filesystem::is_directory(location->directory(), ec))
            {
                s_path = location->log_file();
            }
        }
    }
    if (!s_path)
    {
        return;
    }
    if (!s_ofs.is_open())
    {
        s_ofs.open(*s_path, std::ios::app | std::ios::out);
    }
    if (s_ofs.is_open())
    {
        s_ofs << line << '\n';
        s_ofs.flush();
    }
}

} // namespace ur::log
