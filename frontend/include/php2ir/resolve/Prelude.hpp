// frontend/include/php2ir/resolve/Prelude.hpp
#pragma once
#include <php2ir/ast/Nodes.hpp>
#include <php2ir/sema/ExportTable.hpp>

#include <string_view>


namespace php2ir::resolve {

    inline constexpr std::string_view k_prelude_unit_name = "__prelude";

    /// @brief 내장 throwable 계층(Throwable, Exception, Error, TypeError,
    ///        ArithmeticError, DivisionByZeroError, UnhandledMatchError)을 담은 단위.
    ast::Unit build_prelude_unit();

    /// @brief prelude를 한 번 해석해 둔 export table. 여러 스레드에서 불러도 된다.
    sema::ExportTablePtr prelude_exports();

} // namespace php2ir::resolve
