// frontend/src/resolve/prelude.cpp
#include <php2ir/resolve/Prelude.hpp>
#include <php2ir/resolve/Resolve.hpp>
#include <php2ir/ast/Builder.hpp>


namespace php2ir::resolve {

    namespace {

        // Exception / Error 공통 본체: message, code 두 필드와 final 접근자.
        ast::ClassDecl throwable_base_(ast::Builder& b, std::string_view name) {
            using ast::Visibility;

            std::vector<ast::PropDecl> props{
                b.property(Visibility::kProtected, "message", "string", b.str("")),
                b.property(Visibility::kProtected, "code", "int", b.int_(0)),
            };

            ast::FnDecl ctor = b.method(
                Visibility::kPublic, "__construct",
                {b.param("message", "string", b.str("")), b.param("code", "int", b.int_(0))},
                "",
                {
                    b.expr(b.assign(b.prop(b.this_(), "message"), b.var("message"))),
                    b.expr(b.assign(b.prop(b.this_(), "code"), b.var("code"))),
                });

            ast::FnDecl get_message = b.method(Visibility::kPublic, "getMessage", {}, "string",
                                               {b.ret(b.prop(b.this_(), "message"))});
            get_message.is_final = true;

            ast::FnDecl get_code = b.method(Visibility::kPublic, "getCode", {}, "int",
                                            {b.ret(b.prop(b.this_(), "code"))});
            get_code.is_final = true;

            ast::ClassDecl c = b.class_(name, "", props, {ctor, get_message, get_code});
            c.interfaces.push_back("Throwable");
            return c;
        }

    } // namespace

    ast::Unit build_prelude_unit() {
        ast::Unit u{};
        u.name = std::string(k_prelude_unit_name);
        u.file_id = 0;

        ast::Builder b(u);

        b.emit(b.class_stmt(b.interface_("Throwable", {
            b.abstract_method("getMessage", {}, "string"),
            b.abstract_method("getCode", {}, "int"),
        })));

        b.emit(b.class_stmt(throwable_base_(b, "Exception")));
        b.emit(b.class_stmt(throwable_base_(b, "Error")));

        b.emit(b.class_stmt(b.class_("TypeError", "Error", {}, {})));
        b.emit(b.class_stmt(b.class_("ArithmeticError", "Error", {}, {})));
        b.emit(b.class_stmt(b.class_("DivisionByZeroError", "ArithmeticError", {}, {})));
        b.emit(b.class_stmt(b.class_("UnhandledMatchError", "Error", {}, {})));

        return u;
    }

    sema::ExportTablePtr prelude_exports() {
        // function-local static: initialized once, thread-safe
        static const sema::ExportTablePtr cached = [] {
            const ast::Unit u = build_prelude_unit();
            diag::Bag bag;
            ResolvedUnit ru = resolve_unit(u, UnitInput{}, bag);
            return ru.exports;
        }();
        return cached;
    }

} // namespace php2ir::resolve
