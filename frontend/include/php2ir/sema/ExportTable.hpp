// frontend/include/php2ir/sema/ExportTable.hpp
#pragma once
#include <php2ir/sema/SymbolTable.hpp>
#include <php2ir/ty/TypePool.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <vector>


namespace php2ir::sema {

    /// @brief 해석이 끝난 단위가 밖으로 내보내는 읽기 전용 심볼 테이블.
    ///        자기 TypePool 사본을 들고 있어서 다른 스레드의 단위가 그대로 공유할 수 있다.
    struct ExportTable {
        std::string unit_name{};
        ty::TypePool types{};
        SymbolTable table{};
        // locally declared global symbols, in declaration order
        std::vector<SymbolId> exported{};
    };

    using ExportTablePtr = std::shared_ptr<const ExportTable>;

    /// @brief 결정적인 텍스트 덤프. 같은 입력이면 바이트 단위로 같아야 한다.
    void dump_export_table(const ExportTable& t, std::ostream& os);
    std::string dump_export_table(const ExportTable& t);

    /// @brief dep의 전역 심볼(클래스는 멤버/레이아웃 포함)을 local로 가져온다.
    ///        타입은 표기 문자열을 거쳐 local_types에 다시 intern 된다.
    ///        다른 단위에서 온 같은 이름이 이미 있으면 건너뛰고, 그 이름을 conflicts에 담아 false를 돌려준다.
    bool import_symbols(const ExportTable& dep, SymbolTable& local, ty::TypePool& local_types,
                        std::vector<std::string>* conflicts = nullptr);

} // namespace php2ir::sema
