#pragma once

#include <optional>
#include <string>
#include <Windows.h>

namespace WinHelpers {
    std::optional<std::wstring> ReadRegistryString(HKEY root, const std::wstring& sub_key, const std::wstring& value_name);
}
