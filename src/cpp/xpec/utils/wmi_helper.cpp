#ifdef _WIN32

#include "wmi_helper.h"
#include "xpec/parsers.h"

#pragma comment(lib, "wbemuuid.lib")

namespace xpec::wmi {

WMIConnection::WMIConnection(const std::wstring& wmi_namespace) {
    HRESULT hr = CoInitializeEx(nullptr, COINIT_MULTITHREADED);
    if (SUCCEEDED(hr)) {
        com_initialized_ = true;
    } else if (hr != RPC_E_CHANGED_MODE) {
        last_error_ = hr;
        return;
    }

    // Only the first call per process succeeds, later ones return RPC_E_TOO_LATE
    CoInitializeSecurity(nullptr, -1, nullptr, nullptr, RPC_C_AUTHN_LEVEL_DEFAULT,
                         RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE, nullptr);

    hr = CoCreateInstance(CLSID_WbemLocator, nullptr, CLSCTX_INPROC_SERVER,
                          IID_IWbemLocator, reinterpret_cast<LPVOID*>(&locator_));
    if (FAILED(hr)) {
        last_error_ = hr;
        locator_ = nullptr;
        return;
    }

    hr = locator_->ConnectServer(_bstr_t(wmi_namespace.c_str()), nullptr, nullptr, nullptr,
                                 0, nullptr, nullptr, &services_);
    if (FAILED(hr)) {
        last_error_ = hr;
        services_ = nullptr;
        return;
    }

    hr = CoSetProxyBlanket(services_, RPC_C_AUTHN_WINNT, RPC_C_AUTHZ_NONE, nullptr,
                           RPC_C_AUTHN_LEVEL_CALL, RPC_C_IMP_LEVEL_IMPERSONATE, nullptr, EOAC_NONE);
    if (FAILED(hr)) {
        last_error_ = hr;
        services_->Release();
        services_ = nullptr;
    }
}

WMIConnection::~WMIConnection() {
    if (services_) services_->Release();
    if (locator_) locator_->Release();
    if (com_initialized_) CoUninitialize();
}

bool WMIConnection::access_denied() const {
    return last_error_ == WBEM_E_ACCESS_DENIED || last_error_ == E_ACCESSDENIED;
}

bool WMIConnection::query(const std::wstring& wql, const std::function<void(IWbemClassObject*)>& callback) {
    if (!services_) {
        return false;
    }

    IEnumWbemClassObject* enumerator = nullptr;
    HRESULT hr = services_->ExecQuery(_bstr_t(L"WQL"), _bstr_t(wql.c_str()),
                                      WBEM_FLAG_FORWARD_ONLY | WBEM_FLAG_RETURN_IMMEDIATELY,
                                      nullptr, &enumerator);
    if (FAILED(hr) || !enumerator) {
        last_error_ = hr;
        return false;
    }

    while (true) {
        IWbemClassObject* obj = nullptr;
        ULONG returned = 0;
        hr = enumerator->Next(WBEM_INFINITE, 1, &obj, &returned);
        if (FAILED(hr)) {
            last_error_ = hr;
            break;
        }
        if (returned == 0) {
            break;
        }
        callback(obj);
        obj->Release();
    }

    enumerator->Release();
    return SUCCEEDED(hr);
}

std::string wstring_to_string(const std::wstring& wstr) {
    if (wstr.empty()) return "";
    int size = WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(), static_cast<int>(wstr.size()),
                                   nullptr, 0, nullptr, nullptr);
    std::string result(size, '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(), static_cast<int>(wstr.size()),
                        &result[0], size, nullptr, nullptr);
    return result;
}

std::wstring string_to_wstring(const std::string& str) {
    if (str.empty()) return L"";
    int size = MultiByteToWideChar(CP_UTF8, 0, str.c_str(), static_cast<int>(str.size()), nullptr, 0);
    std::wstring result(size, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, str.c_str(), static_cast<int>(str.size()), &result[0], size);
    return result;
}

std::string get_property_string(IWbemClassObject* obj, const wchar_t* name) {
    VARIANT vt;
    VariantInit(&vt);
    std::string result;
    if (SUCCEEDED(obj->Get(name, 0, &vt, nullptr, nullptr)) && vt.vt == VT_BSTR && vt.bstrVal) {
        result = wstring_to_string(vt.bstrVal);
    }
    VariantClear(&vt);
    return result;
}

std::optional<uint64_t> get_property_optional_uint64(IWbemClassObject* obj, const wchar_t* name) {
    VARIANT vt;
    VariantInit(&vt);
    std::optional<uint64_t> result;
    if (SUCCEEDED(obj->Get(name, 0, &vt, nullptr, nullptr))) {
        switch (vt.vt) {
            case VT_BSTR:
                // CIM uint64 values arrive as strings
                if (vt.bstrVal) {
                    try {
                        result = std::stoull(wstring_to_string(vt.bstrVal));
                    } catch (const std::exception&) {
                        result.reset();
                    }
                }
                break;
            case VT_UI1: result = vt.bVal; break;
            case VT_I2: result = static_cast<uint16_t>(vt.iVal); break;
            case VT_UI2: result = vt.uiVal; break;
            case VT_I4: result = cim_uint32_from_i4(vt.lVal); break;
            case VT_UI4: result = vt.ulVal; break;
            case VT_I8: result = static_cast<uint64_t>(vt.llVal < 0 ? 0 : vt.llVal); break;
            case VT_UI8: result = vt.ullVal; break;
            default: break;
        }
    }
    VariantClear(&vt);
    return result;
}

uint64_t get_property_uint64(IWbemClassObject* obj, const wchar_t* name) {
    return get_property_optional_uint64(obj, name).value_or(0);
}

int get_property_int(IWbemClassObject* obj, const wchar_t* name) {
    return static_cast<int>(get_property_uint64(obj, name));
}

} // namespace xpec::wmi

#endif // _WIN32
