// ==============================================================================
// iterator.cpp - KeyIterator и ValueIterator
// ==============================================================================
//
// Каждый next() запрашивает у транспорта запись с текущим индексом.
// Отсутствие записи завершает перечисление без ошибки; ошибка разбора
// записи завершает перечисление и сохраняется в last_error().
//
// ==============================================================================

#include <ntreg/decode.hpp>
#include <ntreg/key.hpp>

namespace ntreg {

namespace {

RegError handle_closed_error(const char* operation) {
    RegError err = make_error(RegErrorKind::HandleClosed, "Registry key handle is closed");
    err.operation = operation;
    return err;
}

}  // anonymous namespace

// ============================================================================
// KeyIterator
// ============================================================================

KeyIterator::KeyIterator(std::shared_ptr<const HandleSlot> slot,
                         std::shared_ptr<const CodeUnits> parent)
    : slot_(std::move(slot)), parent_path_(std::move(parent)) {}

bool KeyIterator::fail(RegError error) {
    if (error.operation.empty()) {
        error.operation = "enumerate_key";
    }
    last_error_ = std::move(error);
    exhausted_ = true;
    return false;
}

bool KeyIterator::next(SubkeyDescriptor& out) {
    if (exhausted_) {
        return false;
    }
    if (!slot_ || slot_->closed()) {
        return fail(handle_closed_error("enumerate_key"));
    }

    auto raw = slot_->transport().enumerate_key(slot_->handle(), index_);
    if (!raw) {
        exhausted_ = true;
        return false;
    }

    auto record = decode_subkey_record(*raw);
    if (auto* err = std::get_if<RegError>(&record)) {
        return fail(std::move(*err));
    }
    auto& subkey = std::get<SubkeyRecord>(record);

    auto name = code_units_to_utf8(subkey.name, RegErrorKind::NameConversion);
    if (auto* err = std::get_if<RegError>(&name)) {
        return fail(std::move(*err));
    }

    out.name_ = std::move(std::get<std::string>(name));
    out.name_units_ = std::move(subkey.name);
    out.last_write_time_ = subkey.header.last_write_time;
    out.parent_path_ = parent_path_;
    out.transport_ = slot_->transport_ptr();

    ++index_;
    return true;
}

// ============================================================================
// ValueIterator
// ============================================================================

ValueIterator::ValueIterator(std::shared_ptr<const HandleSlot> slot) : slot_(std::move(slot)) {}

bool ValueIterator::fail(RegError error) {
    if (error.operation.empty()) {
        error.operation = "enumerate_value";
    }
    last_error_ = std::move(error);
    exhausted_ = true;
    return false;
}

bool ValueIterator::next(ValueItem& out) {
    if (exhausted_) {
        return false;
    }
    if (!slot_ || slot_->closed()) {
        return fail(handle_closed_error("enumerate_value"));
    }

    auto raw = slot_->transport().enumerate_value(slot_->handle(), index_);
    if (!raw) {
        exhausted_ = true;
        return false;
    }

    auto record = decode_value_record(*raw);
    if (auto* err = std::get_if<RegError>(&record)) {
        return fail(std::move(*err));
    }
    auto& value = std::get<ValueRecord>(record);

    out.name_units_ = std::move(value.name);
    out.value_ = std::move(value.value);
    out.type_tag_ = value.header.value_type;

    ++index_;
    return true;
}

}  // namespace ntreg
