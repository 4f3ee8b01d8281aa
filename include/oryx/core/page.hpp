#pragma once

#include <oryx/core/column.hpp>
#include <oryx/core/type.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace oryx {

/// Storage for a Block; the alternative must agree with the block's ScalarType.
using BlockValues = std::variant<Column<std::uint8_t>, Column<std::int64_t>, Column<double>,
                                 Column<std::string>>;

/// Ascending row positions selected by a filter.
using SelectedPositions = std::vector<std::int32_t>;

/// One typed column of a page, with an optional null mask.
///
/// An empty mask means no position is null. When present the mask holds one
/// byte per position, non-zero meaning null. Null slots still occupy a value
/// (zero / empty string) in the storage column.
class Block {
   public:
    Block(ScalarType type, BlockValues values, std::vector<std::uint8_t> nulls = {});

    [[nodiscard]] static auto booleans(std::vector<bool> values) -> Block;
    [[nodiscard]] static auto bigints(std::vector<std::int64_t> values) -> Block;
    [[nodiscard]] static auto doubles(std::vector<double> values) -> Block;
    [[nodiscard]] static auto varchars(std::vector<std::string> values) -> Block;
    /// Build from loose values; NULL entries set the mask.
    [[nodiscard]] static auto from_values(ScalarType type, const std::vector<Value>& values)
        -> Block;
    /// `count` copies of `value`.
    [[nodiscard]] static auto broadcast(ScalarType type, const Value& value, std::size_t count)
        -> Block;

    [[nodiscard]] auto type() const noexcept -> ScalarType { return type_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto may_have_nulls() const noexcept -> bool { return !nulls_.empty(); }
    [[nodiscard]] auto is_null(std::size_t position) const noexcept -> bool {
        return !nulls_.empty() && nulls_[position] != 0;
    }
    [[nodiscard]] auto nulls() const noexcept -> std::span<const std::uint8_t> { return nulls_; }
    [[nodiscard]] auto values() const noexcept -> const BlockValues& { return values_; }

    template <typename T>
    [[nodiscard]] auto column() const noexcept -> const Column<T>* {
        return std::get_if<Column<T>>(&values_);
    }

    /// Value at `position` (NULL if masked).
    [[nodiscard]] auto get(std::size_t position) const -> Value;

    [[nodiscard]] auto gather(std::span<const std::int32_t> positions) const -> Block;

   private:
    ScalarType type_;
    BlockValues values_;
    std::vector<std::uint8_t> nulls_;
};

/// Accumulates values of one type into a Block.
class BlockBuilder {
   public:
    explicit BlockBuilder(ScalarType type, std::size_t expected_positions = 0);

    /// Append a value; throws OryxException(TypeMismatch) if it does not fit the type.
    void append(const Value& value);
    void append_null();

    [[nodiscard]] auto type() const noexcept -> ScalarType { return type_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }

    /// Build the block and reset the builder for reuse.
    [[nodiscard]] auto build() -> Block;

   private:
    void reset(std::size_t expected_positions);

    ScalarType type_;
    BlockValues values_;
    std::vector<std::uint8_t> nulls_;
    bool has_null_ = false;
    std::size_t size_ = 0;
};

/// A columnar batch: a position count and one shared block per channel.
class Page {
   public:
    Page() = default;
    Page(std::size_t position_count, std::vector<std::shared_ptr<const Block>> blocks);
    /// Position count is taken from the blocks; an empty list yields an empty page.
    explicit Page(std::vector<Block> blocks);

    [[nodiscard]] auto position_count() const noexcept -> std::size_t { return position_count_; }
    [[nodiscard]] auto channel_count() const noexcept -> std::size_t { return blocks_.size(); }

    /// Checked channel access; throws OryxException(InvalidInput) when out of range.
    [[nodiscard]] auto block(std::size_t channel) const -> const Block&;
    [[nodiscard]] auto block_ptr(std::size_t channel) const -> const std::shared_ptr<const Block>&;

   private:
    std::size_t position_count_ = 0;
    std::vector<std::shared_ptr<const Block>> blocks_;
};

/// Row-at-a-time page assembly used by cursor processors.
class PageBuilder {
   public:
    static constexpr std::size_t kDefaultMaxPositions = 1024;

    explicit PageBuilder(std::vector<ScalarType> types,
                         std::size_t max_positions = kDefaultMaxPositions);

    /// Record that one more row has been appended to every block builder.
    void declare_position() { ++declared_positions_; }

    [[nodiscard]] auto block_builder(std::size_t channel) -> BlockBuilder& {
        return builders_.at(channel);
    }
    [[nodiscard]] auto types() const noexcept -> const std::vector<ScalarType>& { return types_; }
    [[nodiscard]] auto position_count() const noexcept -> std::size_t {
        return declared_positions_;
    }
    [[nodiscard]] auto is_empty() const noexcept -> bool { return declared_positions_ == 0; }
    [[nodiscard]] auto is_full() const noexcept -> bool {
        return declared_positions_ >= max_positions_;
    }

    /// Build the accumulated page and reset for the next one.
    [[nodiscard]] auto build() -> Page;

   private:
    std::vector<ScalarType> types_;
    std::vector<BlockBuilder> builders_;
    std::size_t max_positions_;
    std::size_t declared_positions_ = 0;
};

}  // namespace oryx
