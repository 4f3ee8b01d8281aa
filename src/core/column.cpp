#include <oryx/core/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is header-only. The element types a Block can hold are
// instantiated once here.

namespace oryx {

template class Column<std::uint8_t>;
template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;

}  // namespace oryx
