#include "winhelpers.hpp"
#include "log.hpp"

#include <winreg.h>

std::optional<std::wstring> WinHelpers::ReadRegistryString(HKEY root, const std::wstring& sub_key, const std::wstring& value_name) {
    HKEY key {};
    LSTATUS result = RegOpenKeyExW(root, sub_key.c_str(), 0, KEY_READ | KEY_WOW64_32KEY, &key);
    if (result != ERROR_SUCCESS) {
        return std::nullopt;
    }

    DWORD type = 0;
    DWORD size = 0;
    result = RegQueryValueExW(key, value_name.c_str(), NULL, &type, NULL, &size);
    if (result != ERROR_SUCCESS || (type != REG_SZ && type != REG_EXPAND_SZ)) {
        RegCloseKey(key);
        return std::nullopt;
    }

    std::wstring value(size / sizeof(wchar_t), L'\0');
    result = RegQueryValueExW(
        key,
        value_name.c_str(),
        NULL,
        NULL,
        reinterpret_cast<BYTE*>(value.data()),
        &size
    );
    RegCloseKey(key);
    if (result != ERROR_SUCCESS) {
        Log::Debug("WinHelpers::ReadRegistryString", "Failed to read registry value ({})", (int)result);
        return std::nullopt;
    }

    // Strip the terminating null(s) included in the reported size
    while (!value.empty() && value.back() == L'\0') {
        value.pop_back();
    }
    return value;
}
