// ==============================================================================
// record.cpp - SubkeyDescriptor и ValueItem
// ==============================================================================

#include <ntreg/key.hpp>

namespace ntreg {

// ============================================================================
// SubkeyDescriptor
// ============================================================================

std::variant<std::string, RegError> SubkeyDescriptor::full_path() const {
    CodeUnits path;
    if (parent_path_) {
        path = *parent_path_;
    }
    // Завершающий NUL родителя не входит в путь
    if (!path.empty() && path.back() == u'\0') {
        path.pop_back();
    }
    path.push_back(u'\\');
    path += name_units_;

    return code_units_to_utf8(path, RegErrorKind::NameConversion);
}

std::variant<RegKey, RegError> SubkeyDescriptor::open() const {
    return open_with(Access::Read);
}

std::variant<RegKey, RegError> SubkeyDescriptor::open_write() const {
    return open_with(Access::ReadWrite);
}

std::variant<RegKey, RegError> SubkeyDescriptor::open_with(Access access) const {
    auto path = full_path();
    if (auto* err = std::get_if<RegError>(&path)) {
        err->operation = "open";
        return std::move(*err);
    }
    const auto& text = std::get<std::string>(path);
    if (access == Access::ReadWrite) {
        return RegKey::open_write(transport_, text);
    }
    return RegKey::open(transport_, text);
}

// ============================================================================
// ValueItem
// ============================================================================

std::variant<std::string, RegError> ValueItem::name() const {
    return code_units_to_utf8(name_units_, RegErrorKind::NameConversion);
}

std::string ValueItem::to_string() const {
    auto text = name();
    if (auto* s = std::get_if<std::string>(&text)) {
        return std::move(*s);
    }
    return {};
}

}  // namespace ntreg
