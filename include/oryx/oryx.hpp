#pragma once

/// Convenience umbrella header for the Oryx library.

#include <oryx/cache/loading_cache.hpp>
#include <oryx/codegen/cursor_processor.hpp>
#include <oryx/codegen/page_function.hpp>
#include <oryx/codegen/row_program.hpp>
#include <oryx/codegen/vector_program.hpp>
#include <oryx/core/column.hpp>
#include <oryx/core/error.hpp>
#include <oryx/core/page.hpp>
#include <oryx/core/type.hpp>
#include <oryx/cursor/record_cursor.hpp>
#include <oryx/expr/builder.hpp>
#include <oryx/expr/builtin_functions.hpp>
#include <oryx/expr/expression.hpp>
#include <oryx/expr/function_registry.hpp>
#include <oryx/gen/expression_compiler.hpp>
#include <oryx/operator/page_processor.hpp>
