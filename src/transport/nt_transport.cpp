// ==============================================================================
// nt_transport.cpp - Транспорт поверх ntdll (Windows)
// ==============================================================================
//
// Перечисление выполняется в два вызова: первый с пустым буфером возвращает
// требуемый размер, второй заполняет буфер этого размера. Любой другой
// исход первого вызова трактуется как конец перечисления.
//
// ==============================================================================

#include <ntreg/transport.hpp>

#ifdef _WIN32

#include <windows.h>
#include <winternl.h>

namespace ntreg {

namespace {

constexpr ULONG KEY_BASIC_INFORMATION_CLASS = 0;
constexpr ULONG KEY_VALUE_FULL_INFORMATION_CLASS = 1;

using NtOpenKeyFn = NTSTATUS(NTAPI*)(PHANDLE, ACCESS_MASK, POBJECT_ATTRIBUTES);
using NtCloseFn = NTSTATUS(NTAPI*)(HANDLE);
using NtEnumerateKeyFn = NTSTATUS(NTAPI*)(HANDLE, ULONG, ULONG, PVOID, ULONG, PULONG);
using NtEnumerateValueKeyFn = NTSTATUS(NTAPI*)(HANDLE, ULONG, ULONG, PVOID, ULONG, PULONG);
using NtDeleteKeyFn = NTSTATUS(NTAPI*)(HANDLE);
using NtDeleteValueKeyFn = NTSTATUS(NTAPI*)(HANDLE, PUNICODE_STRING);
using NtSetValueKeyFn = NTSTATUS(NTAPI*)(HANDLE, PUNICODE_STRING, ULONG, ULONG, PVOID, ULONG);

template <typename Fn>
Fn resolve(HMODULE ntdll, const char* name) {
    return reinterpret_cast<Fn>(reinterpret_cast<void*>(GetProcAddress(ntdll, name)));
}

/// UNICODE_STRING поверх code units (без терминатора в Length)
UNICODE_STRING make_unicode_string(std::u16string_view units) {
    UNICODE_STRING us;
    us.Length = static_cast<USHORT>(units.size() * sizeof(char16_t));
    us.MaximumLength = us.Length;
    us.Buffer = reinterpret_cast<PWSTR>(const_cast<char16_t*>(units.data()));
    return us;
}

class NtTransport : public Transport {
public:
    explicit NtTransport(HMODULE ntdll)
        : open_key_(resolve<NtOpenKeyFn>(ntdll, "NtOpenKey")),
          close_(resolve<NtCloseFn>(ntdll, "NtClose")),
          enumerate_key_(resolve<NtEnumerateKeyFn>(ntdll, "NtEnumerateKey")),
          enumerate_value_(resolve<NtEnumerateValueKeyFn>(ntdll, "NtEnumerateValueKey")),
          delete_key_(resolve<NtDeleteKeyFn>(ntdll, "NtDeleteKey")),
          delete_value_(resolve<NtDeleteValueKeyFn>(ntdll, "NtDeleteValueKey")),
          set_value_(resolve<NtSetValueKeyFn>(ntdll, "NtSetValueKey")) {}

    bool valid() const {
        return open_key_ && close_ && enumerate_key_ && enumerate_value_ && delete_key_ &&
               delete_value_ && set_value_;
    }

    std::optional<RawRecord> enumerate_key(Handle handle, std::uint32_t index) override {
        return enumerate(enumerate_key_, handle, index, KEY_BASIC_INFORMATION_CLASS);
    }

    std::optional<RawRecord> enumerate_value(Handle handle, std::uint32_t index) override {
        return enumerate(enumerate_value_, handle, index, KEY_VALUE_FULL_INFORMATION_CLASS);
    }

    OpenResult open(std::string_view path, Access access) override {
        OpenResult result;
        auto units = utf8_to_code_units(path);
        if (!units) {
            result.status = STATUS_OBJECT_NAME_INVALID;
            return result;
        }

        UNICODE_STRING name = make_unicode_string(*units);
        OBJECT_ATTRIBUTES attributes;
        InitializeObjectAttributes(&attributes, &name, OBJ_CASE_INSENSITIVE, nullptr, nullptr);

        HANDLE key = nullptr;
        const ACCESS_MASK mask = access == Access::ReadWrite ? KEY_ALL_ACCESS : KEY_READ;
        result.status = static_cast<std::uint32_t>(open_key_(&key, mask, &attributes));
        if (result.status == STATUS_SUCCESS) {
            result.handle = reinterpret_cast<Handle>(key);
        }
        return result;
    }

    std::uint32_t close(Handle handle) override {
        return static_cast<std::uint32_t>(close_(to_native(handle)));
    }

    std::uint32_t delete_key(Handle handle) override {
        return static_cast<std::uint32_t>(delete_key_(to_native(handle)));
    }

    std::uint32_t delete_value(Handle handle, std::u16string_view name) override {
        UNICODE_STRING us = make_unicode_string(name);
        return static_cast<std::uint32_t>(delete_value_(to_native(handle), &us));
    }

    std::uint32_t set_value(Handle handle, std::u16string_view name, std::uint32_t type,
                            const std::vector<std::uint8_t>& payload) override {
        UNICODE_STRING us = make_unicode_string(name);
        return static_cast<std::uint32_t>(
            set_value_(to_native(handle), &us, 0, type,
                       const_cast<std::uint8_t*>(payload.data()),
                       static_cast<ULONG>(payload.size())));
    }

private:
    static HANDLE to_native(Handle handle) { return reinterpret_cast<HANDLE>(handle); }

    template <typename Fn>
    static std::optional<RawRecord> enumerate(Fn fn, Handle handle, std::uint32_t index,
                                              ULONG info_class) {
        ULONG needed = 0;
        const auto sizing = static_cast<std::uint32_t>(
            fn(to_native(handle), index, info_class, nullptr, 0, &needed));
        if (sizing != STATUS_BUFFER_TOO_SMALL && sizing != STATUS_BUFFER_OVERFLOW) {
            return std::nullopt;
        }

        RawRecord buffer(needed);
        ULONG written = 0;
        const auto status = static_cast<std::uint32_t>(
            fn(to_native(handle), index, info_class, buffer.data(), needed, &written));
        if (status != STATUS_SUCCESS) {
            return std::nullopt;
        }
        buffer.resize(written);
        return buffer;
    }

    NtOpenKeyFn open_key_;
    NtCloseFn close_;
    NtEnumerateKeyFn enumerate_key_;
    NtEnumerateValueKeyFn enumerate_value_;
    NtDeleteKeyFn delete_key_;
    NtDeleteValueKeyFn delete_value_;
    NtSetValueKeyFn set_value_;
};

}  // anonymous namespace

std::shared_ptr<Transport> create_native_transport() {
    HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
    if (!ntdll) {
        return nullptr;
    }
    auto transport = std::make_shared<NtTransport>(ntdll);
    if (!transport->valid()) {
        return nullptr;
    }
    return transport;
}

}  // namespace ntreg

#else

namespace ntreg {

std::shared_ptr<Transport> create_native_transport() {
    return nullptr;
}

}  // namespace ntreg

#endif
