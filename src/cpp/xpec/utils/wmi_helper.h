#pragma once

#ifdef _WIN32

#include <windows.h>
#include <comdef.h>
#include <Wbemidl.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace xpec::wmi {

// Owns COM initialization and a connection to one WMI namespace.
// Everything is released in the destructor.
class WMIConnection {
public:
    explicit WMIConnection(const std::wstring& wmi_namespace = L"ROOT\\CIMV2");
    ~WMIConnection();

    WMIConnection(const WMIConnection&) = delete;
    WMIConnection& operator=(const WMIConnection&) = delete;

    bool is_valid() const { return services_ != nullptr; }

    // HRESULT of the last failed step (connect or query), S_OK otherwise
    HRESULT last_error() const { return last_error_; }
    bool access_denied() const;

    // Run a WQL query and invoke the callback for every returned object.
    // Returns false if the query could not be executed.
    bool query(const std::wstring& wql, const std::function<void(IWbemClassObject*)>& callback);

private:
    IWbemLocator* locator_ = nullptr;
    IWbemServices* services_ = nullptr;
    bool com_initialized_ = false;
    HRESULT last_error_ = S_OK;
};

std::string wstring_to_string(const std::wstring& wstr);
std::wstring string_to_wstring(const std::string& str);

// Property accessors, empty/0/nullopt when the property is missing or NULL
std::string get_property_string(IWbemClassObject* obj, const wchar_t* name);
int get_property_int(IWbemClassObject* obj, const wchar_t* name);
uint64_t get_property_uint64(IWbemClassObject* obj, const wchar_t* name);
std::optional<uint64_t> get_property_optional_uint64(IWbemClassObject* obj, const wchar_t* name);

} // namespace xpec::wmi

#endif // _WIN32
