#pragma once

#include <oryx/core/page.hpp>
#include <oryx/core/type.hpp>

#include <cstdint>
#include <memory>
#include <string_view>

namespace oryx::cursor {

/// Row-at-a-time access to a stream of records.
///
/// The cursor starts before the first row; advance_next_position() must be
/// called before any field is read. Getters must match the field's type.
class RecordCursor {
   public:
    RecordCursor() = default;
    virtual ~RecordCursor() = default;

    RecordCursor(const RecordCursor&) = delete;
    auto operator=(const RecordCursor&) -> RecordCursor& = delete;
    RecordCursor(RecordCursor&&) = default;
    auto operator=(RecordCursor&&) -> RecordCursor& = default;

    /// Move to the next row; false once the input is exhausted.
    [[nodiscard]] virtual auto advance_next_position() -> bool = 0;

    [[nodiscard]] virtual auto field_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto type(std::size_t field) const -> ScalarType = 0;
    [[nodiscard]] virtual auto is_null(std::size_t field) const -> bool = 0;
    [[nodiscard]] virtual auto get_boolean(std::size_t field) const -> bool = 0;
    [[nodiscard]] virtual auto get_long(std::size_t field) const -> std::int64_t = 0;
    [[nodiscard]] virtual auto get_double(std::size_t field) const -> double = 0;
    /// The view stays valid until the cursor advances.
    [[nodiscard]] virtual auto get_slice(std::size_t field) const -> std::string_view = 0;
};

/// A cursor over the rows of a Page.
class PageRecordCursor final : public RecordCursor {
   public:
    explicit PageRecordCursor(Page page) : page_(std::move(page)) {}

    [[nodiscard]] auto advance_next_position() -> bool override;

    [[nodiscard]] auto field_count() const -> std::size_t override {
        return page_.channel_count();
    }
    [[nodiscard]] auto type(std::size_t field) const -> ScalarType override;
    [[nodiscard]] auto is_null(std::size_t field) const -> bool override;
    [[nodiscard]] auto get_boolean(std::size_t field) const -> bool override;
    [[nodiscard]] auto get_long(std::size_t field) const -> std::int64_t override;
    [[nodiscard]] auto get_double(std::size_t field) const -> double override;
    [[nodiscard]] auto get_slice(std::size_t field) const -> std::string_view override;

    /// Index of the current row, or -1 before the first advance.
    [[nodiscard]] auto position() const noexcept -> std::int64_t { return position_; }

   private:
    [[nodiscard]] auto row() const -> std::size_t;

    template <typename T>
    [[nodiscard]] auto typed_column(std::size_t field, ScalarType expected) const
        -> const Column<T>&;

    Page page_;
    std::int64_t position_ = -1;
};

}  // namespace oryx::cursor
