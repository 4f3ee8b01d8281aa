#include <oryx/core/error.hpp>
#include <oryx/core/page.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace oryx {

namespace {

auto empty_storage(ScalarType type) -> BlockValues {
    switch (type) {
        case ScalarType::Boolean:
            return Column<std::uint8_t>{};
        case ScalarType::Bigint:
            return Column<std::int64_t>{};
        case ScalarType::Double:
            return Column<double>{};
        case ScalarType::Varchar:
            return Column<std::string>{};
    }
    throw OryxException(ErrorCode::InvalidInput, "unknown scalar type");
}

// The BlockValues alternatives are declared in ScalarType order.
auto storage_matches(ScalarType type, const BlockValues& values) noexcept -> bool {
    return values.index() == static_cast<std::size_t>(type);
}

auto storage_size(const BlockValues& values) noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, values);
}

}  // namespace

// ─── Block ────────────────────────────────────────────────────────────────────

Block::Block(ScalarType type, BlockValues values, std::vector<std::uint8_t> nulls)
    : type_(type), values_(std::move(values)), nulls_(std::move(nulls)) {
    if (!storage_matches(type_, values_)) {
        throw OryxException(ErrorCode::TypeMismatch,
                            fmt::format("block storage does not hold {} values", type_name(type_)));
    }
    if (!nulls_.empty() && nulls_.size() != storage_size(values_)) {
        throw OryxException(ErrorCode::InvalidInput,
                            fmt::format("null mask has {} entries for {} values", nulls_.size(),
                                        storage_size(values_)));
    }
    if (std::none_of(nulls_.begin(), nulls_.end(), [](std::uint8_t b) { return b != 0; })) {
        nulls_.clear();
    }
}

auto Block::booleans(std::vector<bool> values) -> Block {
    Column<std::uint8_t> col;
    col.reserve(values.size());
    for (bool v : values) {
        col.push_back(v ? 1 : 0);
    }
    return Block{ScalarType::Boolean, std::move(col)};
}

auto Block::bigints(std::vector<std::int64_t> values) -> Block {
    return Block{ScalarType::Bigint, Column<std::int64_t>{std::move(values)}};
}

auto Block::doubles(std::vector<double> values) -> Block {
    return Block{ScalarType::Double, Column<double>{std::move(values)}};
}

auto Block::varchars(std::vector<std::string> values) -> Block {
    return Block{ScalarType::Varchar, Column<std::string>{std::move(values)}};
}

auto Block::from_values(ScalarType type, const std::vector<Value>& values) -> Block {
    BlockBuilder builder(type, values.size());
    for (const auto& value : values) {
        builder.append(value);
    }
    return builder.build();
}

auto Block::broadcast(ScalarType type, const Value& value, std::size_t count) -> Block {
    if (!value_matches(type, value)) {
        throw OryxException(ErrorCode::TypeMismatch,
                            fmt::format("cannot broadcast {} as {}", format_value(value),
                                        type_name(type)));
    }
    auto values = empty_storage(type);
    std::visit(
        [&](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            T fill{};
            if constexpr (std::is_same_v<T, std::uint8_t>) {
                if (const auto* b = std::get_if<bool>(&value)) {
                    fill = *b ? 1 : 0;
                }
            } else {
                if (const auto* v = std::get_if<T>(&value)) {
                    fill = *v;
                }
            }
            col.resize(count, fill);
        },
        values);
    std::vector<std::uint8_t> nulls;
    if (oryx::is_null(value)) {
        nulls.assign(count, 1);
    }
    return Block{type, std::move(values), std::move(nulls)};
}

auto Block::size() const noexcept -> std::size_t {
    return storage_size(values_);
}

auto Block::get(std::size_t position) const -> Value {
    if (is_null(position)) {
        return Value{};
    }
    return std::visit(
        [position](const auto& col) -> Value {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::uint8_t>) {
                return Value{col.at(position) != 0};
            } else {
                return Value{col.at(position)};
            }
        },
        values_);
}

auto Block::gather(std::span<const std::int32_t> positions) const -> Block {
    auto values = std::visit([&](const auto& col) -> BlockValues { return col.gather(positions); },
                             values_);
    std::vector<std::uint8_t> nulls;
    if (!nulls_.empty()) {
        nulls.reserve(positions.size());
        for (auto pos : positions) {
            nulls.push_back(nulls_[static_cast<std::size_t>(pos)]);
        }
    }
    return Block{type_, std::move(values), std::move(nulls)};
}

// ─── BlockBuilder ─────────────────────────────────────────────────────────────

BlockBuilder::BlockBuilder(ScalarType type, std::size_t expected_positions)
    : type_(type), values_(empty_storage(type)) {
    reset(expected_positions);
}

void BlockBuilder::reset(std::size_t expected_positions) {
    values_ = empty_storage(type_);
    std::visit([expected_positions](auto& col) { col.reserve(expected_positions); }, values_);
    nulls_.clear();
    nulls_.reserve(expected_positions);
    has_null_ = false;
    size_ = 0;
}

void BlockBuilder::append(const Value& value) {
    if (is_null(value)) {
        append_null();
        return;
    }
    if (!value_matches(type_, value)) {
        throw OryxException(ErrorCode::TypeMismatch,
                            fmt::format("cannot append {} to a {} block", format_value(value),
                                        type_name(type_)));
    }
    std::visit(
        [&value](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::uint8_t>) {
                col.push_back(std::get<bool>(value) ? 1 : 0);
            } else {
                col.push_back(std::get<T>(value));
            }
        },
        values_);
    nulls_.push_back(0);
    ++size_;
}

void BlockBuilder::append_null() {
    std::visit(
        [](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            col.push_back(T{});
        },
        values_);
    nulls_.push_back(1);
    has_null_ = true;
    ++size_;
}

auto BlockBuilder::build() -> Block {
    std::vector<std::uint8_t> nulls;
    if (has_null_) {
        nulls = std::move(nulls_);
    }
    Block block{type_, std::move(values_), std::move(nulls)};
    reset(0);
    return block;
}

// ─── Page ─────────────────────────────────────────────────────────────────────

Page::Page(std::size_t position_count, std::vector<std::shared_ptr<const Block>> blocks)
    : position_count_(position_count), blocks_(std::move(blocks)) {
    for (std::size_t channel = 0; channel < blocks_.size(); ++channel) {
        if (blocks_[channel] == nullptr) {
            throw OryxException(ErrorCode::InvalidInput,
                                fmt::format("page channel {} has no block", channel));
        }
        if (blocks_[channel]->size() != position_count_) {
            throw OryxException(ErrorCode::InvalidInput,
                                fmt::format("page channel {} has {} positions, expected {}",
                                            channel, blocks_[channel]->size(), position_count_));
        }
    }
}

Page::Page(std::vector<Block> blocks) {
    position_count_ = blocks.empty() ? 0 : blocks.front().size();
    blocks_.reserve(blocks.size());
    for (auto& block : blocks) {
        if (block.size() != position_count_) {
            throw OryxException(ErrorCode::InvalidInput,
                                fmt::format("page blocks disagree on position count ({} vs {})",
                                            block.size(), position_count_));
        }
        blocks_.push_back(std::make_shared<const Block>(std::move(block)));
    }
}

auto Page::block(std::size_t channel) const -> const Block& {
    return *block_ptr(channel);
}

auto Page::block_ptr(std::size_t channel) const -> const std::shared_ptr<const Block>& {
    if (channel >= blocks_.size()) {
        throw OryxException(ErrorCode::InvalidInput,
                            fmt::format("channel {} out of range for a page with {} channels",
                                        channel, blocks_.size()));
    }
    return blocks_[channel];
}

// ─── PageBuilder ──────────────────────────────────────────────────────────────

PageBuilder::PageBuilder(std::vector<ScalarType> types, std::size_t max_positions)
    : types_(std::move(types)), max_positions_(max_positions) {
    builders_.reserve(types_.size());
    for (auto type : types_) {
        builders_.emplace_back(type);
    }
}

auto PageBuilder::build() -> Page {
    std::vector<std::shared_ptr<const Block>> blocks;
    blocks.reserve(builders_.size());
    for (auto& builder : builders_) {
        blocks.push_back(std::make_shared<const Block>(builder.build()));
    }
    auto count = declared_positions_;
    declared_positions_ = 0;
    return Page{count, std::move(blocks)};
}

}  // namespace oryx
