#include <oryx/core/error.hpp>
#include <oryx/cursor/record_cursor.hpp>

#include <fmt/format.h>

namespace oryx::cursor {

auto PageRecordCursor::advance_next_position() -> bool {
    if (position_ + 1 >= static_cast<std::int64_t>(page_.position_count())) {
        position_ = static_cast<std::int64_t>(page_.position_count());
        return false;
    }
    ++position_;
    return true;
}

auto PageRecordCursor::type(std::size_t field) const -> ScalarType {
    return page_.block(field).type();
}

auto PageRecordCursor::row() const -> std::size_t {
    if (position_ < 0 || position_ >= static_cast<std::int64_t>(page_.position_count())) {
        throw OryxException(ErrorCode::InvalidInput, "cursor is not positioned on a row");
    }
    return static_cast<std::size_t>(position_);
}

auto PageRecordCursor::is_null(std::size_t field) const -> bool {
    return page_.block(field).is_null(row());
}

template <typename T>
auto PageRecordCursor::typed_column(std::size_t field, ScalarType expected) const
    -> const Column<T>& {
    const auto& block = page_.block(field);
    const auto* column = block.column<T>();
    if (column == nullptr) {
        throw OryxException(ErrorCode::TypeMismatch,
                            fmt::format("field {} is {}, not {}", field, type_name(block.type()),
                                        type_name(expected)));
    }
    return *column;
}

auto PageRecordCursor::get_boolean(std::size_t field) const -> bool {
    return typed_column<std::uint8_t>(field, ScalarType::Boolean)[row()] != 0;
}

auto PageRecordCursor::get_long(std::size_t field) const -> std::int64_t {
    return typed_column<std::int64_t>(field, ScalarType::Bigint)[row()];
}

auto PageRecordCursor::get_double(std::size_t field) const -> double {
    return typed_column<double>(field, ScalarType::Double)[row()];
}

auto PageRecordCursor::get_slice(std::size_t field) const -> std::string_view {
    return typed_column<std::string>(field, ScalarType::Varchar)[row()];
}

}  // namespace oryx::cursor
