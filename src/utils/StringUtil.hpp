#pragma once

#if defined(_WIN32)

#include <string>
#include <windows.h>

namespace ur::utils
{

inline std::wstring widen(std::string const &value)
{
    if (value.empty())
    {
        return {};
    }
    int len = MultiByteToWideChar(CP_UTF8, 0, value.c_str(), -1, nullptr, 0);
    if (len <= 0)
    {
        return {};
    }
    std::wstring out(len, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, value.c_str(), -1, out.data(), len);
    if (!out.empty() && out.back() == L'\0')
    {
        out.pop_back();
    }
    return out;
}

inline std::string narrow(std::wstring const &value)
{
    if (value.empty())
    {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, value.c_str(), -1, nullptr, 0,
                                  nullptr, nullptr);
    if (len <= 0)
    {
        return {};
    }
    std::string out(len, '\0');
    WideCharToMultiByte(CP_UTF8, 0, value.c_str(), -1, out.data(), len, nullptr,
                        nullptr);
    if (!out.empty() && out.back() == '\0')
    {
        out.pop_back();
    }
    return out;
}

} // namespace ur::utils

#endif
