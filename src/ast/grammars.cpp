#include "ctxopt/ast/grammar.hpp"

#include <cctype>

#include "ctxopt/core/utils.hpp"

namespace ctxopt::ast {

namespace {

auto re(const char* pattern) -> std::regex {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

auto decl(const char* pattern, ElementType type, int name_group = 1) -> DeclarationRule {
    DeclarationRule rule{re(pattern), type};
    rule.name_group = name_group;
    return rule;
}

auto container(DeclarationRule rule) -> DeclarationRule {
    rule.container = true;
    return rule;
}

auto top_level(DeclarationRule rule) -> DeclarationRule {
    rule.top_level_only = true;
    return rule;
}

auto list(const char* pattern, int group = 1, bool split = false) -> ListRule {
    return ListRule{re(pattern), group, split};
}

auto script_grammar(Language lang) -> Grammar {
    Grammar g;
    g.language = lang;
    g.block_style = BlockStyle::Braces;
    g.line_comments = {"//"};
    g.decorator_prefixes = {"@"};

    g.imports = {
        list(R"(^\s*import\s+(?:type\s+)?[^'"]*?\s*from\s+['"]([^'"]+)['"])"),
        list(R"(^\s*\}\s*from\s+['"]([^'"]+)['"])"),
        list(R"(^\s*import\s+['"]([^'"]+)['"])"),
        list(R"(^\s*(?:const|let|var)\s+[^=]+=\s*require\s*\(\s*['"]([^'"]+)['"]\s*\))"),
    };

    g.export_lists = {
        list(R"(^\s*export\s+(?:type\s+)?\{([^}]*)\})", 1, true),
        list(R"(^\s*export\s+default\s+([A-Za-z_$][\w$]*)\s*;?\s*$)"),
        list(R"(^\s*export\s+\*\s+(?:as\s+([A-Za-z_$][\w$]*)\s+)?from)"),
        list(R"(^\s*module\.exports\s*=\s*\{([^}]*)\})", 1, true),
        list(R"(^\s*(?:module\.)?exports\.([A-Za-z_$][\w$]*)\s*=)"),
    };

    auto method = decl(
        R"(^\s+(?:(?:public|private|protected|static|async|readonly|override|abstract|get|set)\s+)*\*?([A-Za-z_$][\w$]*)\s*(?:<[^>]*>)?\s*\([^;]*$)",
        ElementType::Function);
    method.member_only = true;

    g.declarations = {
        container(decl(R"(^\s*(?:export\s+)?(?:default\s+)?(?:abstract\s+)?class\s+([A-Za-z_$][\w$]*))",
                       ElementType::Class)),
        decl(R"(^\s*(?:export\s+)?(?:declare\s+)?interface\s+([A-Za-z_$][\w$]*))",
             ElementType::Interface),
        decl(R"(^\s*(?:export\s+)?(?:declare\s+)?type\s+([A-Za-z_$][\w$]*)\s*(?:<[^>]*>)?\s*=)",
             ElementType::Type),
        decl(R"(^\s*(?:export\s+)?(?:declare\s+)?(?:const\s+)?enum\s+([A-Za-z_$][\w$]*))",
             ElementType::Type),
        decl(R"(^\s*(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*))",
             ElementType::Function),
        decl(R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=]+)?=\s*(?:async\s+)?(?:function\b|(?:\([^)]*\)|[A-Za-z_$][\w$]*)\s*(?::\s*[^=]+)?=>))",
             ElementType::Function),
        method,
        top_level(decl(R"(^(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*))",
                       ElementType::Variable)),
    };

    g.is_exported = [](std::string_view line, const CodeElement&, bool top_level) {
        return top_level && utils::trim(line).starts_with("export");
    };
    return g;
}

} // anonymous namespace

auto typescript_grammar() -> const Grammar& {
    static const Grammar g = script_grammar(Language::TypeScript);
    return g;
}

auto javascript_grammar() -> const Grammar& {
    static const Grammar g = script_grammar(Language::JavaScript);
    return g;
}

auto python_grammar() -> const Grammar& {
    static const Grammar g = [] {
        Grammar g;
        g.language = Language::Python;
        g.block_style = BlockStyle::Indentation;
        g.line_comments = {"#"};
        g.decorator_prefixes = {"@"};

        g.imports = {
            list(R"(^\s*from\s+([\w.]+)\s+import\s)"),
            list(R"(^\s*import\s+([^#]+))", 1, true),
        };

        g.declarations = {
            container(decl(R"(^(\s*)class\s+(\w+))", ElementType::Class, 2)),
            decl(R"(^(\s*)(?:async\s+)?def\s+(\w+)\s*\()", ElementType::Function, 2),
            top_level(decl(R"(^([A-Za-z_]\w*)\s*(?::\s*[^=]+)?=(?!=))", ElementType::Variable)),
        };

        g.is_exported = [](std::string_view, const CodeElement& el, bool top_level) {
            return top_level && !el.name.starts_with("_");
        };
        return g;
    }();
    return g;
}

auto go_grammar() -> const Grammar& {
    static const Grammar g = [] {
        Grammar g;
        g.language = Language::Go;
        g.block_style = BlockStyle::Braces;
        g.line_comments = {"//"};

        g.imports = {
            list(R"re(^\s*import\s+(?:[\w.]+\s+)?"([^"]+)")re"),
        };
        g.import_block_open = re(R"(^\s*import\s*\(\s*$)");
        g.import_block_entry = re(R"re(^\s*(?:[\w.]+\s+)?"([^"]+)")re");

        auto method = decl(R"(^func\s+\(\s*(?:\w+\s+)?\*?(\w+)[^)]*\)\s*(\w+))",
                           ElementType::Function, 2);
        method.parent_group = 1;

        g.declarations = {
            method,
            decl(R"(^func\s+(\w+))", ElementType::Function),
            decl(R"(^type\s+(\w+)(?:\[[^\]]*\])?\s+struct\b)", ElementType::Class),
            decl(R"(^type\s+(\w+)(?:\[[^\]]*\])?\s+interface\b)", ElementType::Interface),
            decl(R"(^type\s+(\w+))", ElementType::Type),
            top_level(decl(R"(^(?:var|const)\s+(\w+))", ElementType::Variable)),
        };

        g.is_exported = [](std::string_view, const CodeElement& el, bool) {
            return !el.name.empty() && std::isupper(static_cast<unsigned char>(el.name[0]));
        };
        return g;
    }();
    return g;
}

auto rust_grammar() -> const Grammar& {
    static const Grammar g = [] {
        Grammar g;
        g.language = Language::Rust;
        g.block_style = BlockStyle::Braces;
        g.line_comments = {"///", "//!", "//"};
        g.decorator_prefixes = {"#["};

        g.imports = {
            list(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?use\s+([^;]+);)"),
            list(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?mod\s+(\w+)\s*;)"),
            list(R"(^\s*extern\s+crate\s+(\w+))"),
        };

        auto impl = container(decl(
            R"(^\s*(?:unsafe\s+)?impl(?:<[^>]*>)?\s+(?:[\w:]+(?:<[^>]*>)?\s+for\s+)?(\w+))",
            ElementType::Class));
        impl.record = false;

        g.declarations = {
            impl,
            decl(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?(?:extern\s+"[^"]*"\s+)?fn\s+(\w+))",
                 ElementType::Function),
            decl(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?struct\s+(\w+))", ElementType::Class),
            container(decl(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:unsafe\s+)?trait\s+(\w+))",
                           ElementType::Interface)),
            decl(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?enum\s+(\w+))", ElementType::Type),
            decl(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?type\s+(\w+))", ElementType::Type),
            top_level(decl(R"(^(?:pub(?:\([^)]*\))?\s+)?(?:const|static)\s+(?:mut\s+)?(\w+))",
                           ElementType::Variable)),
        };

        g.is_exported = [](std::string_view line, const CodeElement&, bool) {
            return utils::trim(line).starts_with("pub");
        };
        return g;
    }();
    return g;
}

auto php_grammar() -> const Grammar& {
    static const Grammar g = [] {
        Grammar g;
        g.language = Language::Php;
        g.block_style = BlockStyle::Braces;
        g.line_comments = {"//", "#"};
        g.decorator_prefixes = {"#["};

        g.imports = {
            list(R"(^\s*use\s+([\w\\]+))"),
            list(R"(^\s*(?:require|require_once|include|include_once)\s*\(?\s*['"]([^'"]+)['"])"),
        };

        g.declarations = {
            container(decl(R"(^\s*(?:(?:abstract|final|readonly)\s+)*class\s+(\w+))",
                           ElementType::Class)),
            container(decl(R"(^\s*interface\s+(\w+))", ElementType::Interface)),
            container(decl(R"(^\s*trait\s+(\w+))", ElementType::Class)),
            container(decl(R"(^\s*enum\s+(\w+))", ElementType::Type)),
            decl(R"(^\s*(?:(?:public|private|protected|static|abstract|final)\s+)*function\s+&?(\w+))",
                 ElementType::Function),
            top_level(decl(R"(^\s*const\s+(\w+))", ElementType::Variable)),
        };

        g.is_exported = [](std::string_view line, const CodeElement& el, bool top_level) {
            if (el.type == ElementType::Method) {
                auto t = utils::trim(line);
                return !t.starts_with("private") && !t.starts_with("protected");
            }
            return top_level;
        };
        return g;
    }();
    return g;
}

auto swift_grammar() -> const Grammar& {
    static const Grammar g = [] {
        Grammar g;
        g.language = Language::Swift;
        g.block_style = BlockStyle::Braces;
        g.line_comments = {"///", "//"};
        g.decorator_prefixes = {"@"};

        g.imports = {
            list(R"(^\s*(?:@testable\s+)?import\s+(?:(?:class|struct|enum|protocol|func|var|typealias)\s+)?([\w.]+))"),
        };

        constexpr auto mods =
            R"((?:@\w+(?:\([^)]*\))?\s+)*(?:(?:public|open|internal|private|fileprivate|final|static|class|override|mutating|nonmutating|indirect)\s+)*)";
        auto with_mods = [&](const std::string& tail) {
            return std::string(R"(^\s*)") + mods + tail;
        };

        auto extension = container(decl(with_mods(R"(extension\s+(\w+))").c_str(),
                                        ElementType::Class));
        extension.record = false;

        g.declarations = {
            container(decl(with_mods(R"((?:class|struct|actor)\s+(\w+))").c_str(),
                           ElementType::Class)),
            container(decl(with_mods(R"(protocol\s+(\w+))").c_str(), ElementType::Interface)),
            container(decl(with_mods(R"(enum\s+(\w+))").c_str(), ElementType::Type)),
            extension,
            decl(with_mods(R"(typealias\s+(\w+))").c_str(), ElementType::Type),
            decl(with_mods(R"(func\s+(\w+))").c_str(), ElementType::Function),
            top_level(decl(R"(^(?:(?:public|private|internal|fileprivate)\s+)?(?:let|var)\s+(\w+))",
                           ElementType::Variable)),
        };

        g.is_exported = [](std::string_view line, const CodeElement&, bool) {
            auto t = utils::trim(line);
            return t.find("public ") != std::string::npos || t.find("open ") != std::string::npos;
        };
        return g;
    }();
    return g;
}

} // namespace ctxopt::ast
