#include "ctxopt/script/parser.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <vector>

#include "ctxopt/script/lexer.hpp"
#include "ctxopt/script/value.hpp"

namespace ctxopt::script {

namespace {

constexpr int kMaxSyntaxNesting = 200;

/// Carries a syntax error out of the recursive descent; parse_program turns
/// it back into a Result.
class ParseFailure : public std::exception {
public:
    explicit ParseFailure(Error error) : error_(std::move(error)) {}
    [[nodiscard]] auto error() const -> const Error& { return error_; }
    [[nodiscard]] auto what() const noexcept -> const char* override { return "syntax error"; }

private:
    Error error_;
};

auto assignment_op(std::string_view text) -> std::optional<Op> {
    if (text == "=") return Op::Assign;
    if (text == "+=") return Op::Add;
    if (text == "-=") return Op::Sub;
    if (text == "*=") return Op::Mul;
    if (text == "/=") return Op::Div;
    if (text == "%=") return Op::Mod;
    if (text == "**=") return Op::Pow;
    if (text == "<<=") return Op::Shl;
    if (text == ">>=") return Op::Shr;
    if (text == ">>>=") return Op::UShr;
    if (text == "&=") return Op::BitAnd;
    if (text == "|=") return Op::BitOr;
    if (text == "^=") return Op::BitXor;
    if (text == "&&=") return Op::And;
    if (text == "||=") return Op::Or;
    if (text == "??=") return Op::Nullish;
    return std::nullopt;
}

struct BinaryInfo {
    int precedence;
    Op op;
    ExprKind kind;
    bool right_assoc = false;
};

auto binary_info(const Token& t) -> std::optional<BinaryInfo> {
    if (t.type == TokenType::Keyword) {
        if (t.text == "in") return BinaryInfo{8, Op::In, ExprKind::Binary};
        if (t.text == "instanceof") return BinaryInfo{8, Op::InstanceOf, ExprKind::Binary};
        return std::nullopt;
    }
    if (t.type != TokenType::Punctuator) return std::nullopt;
    const auto& s = t.text;
    if (s == "??") return BinaryInfo{1, Op::Nullish, ExprKind::Logical};
    if (s == "||") return BinaryInfo{2, Op::Or, ExprKind::Logical};
    if (s == "&&") return BinaryInfo{3, Op::And, ExprKind::Logical};
    if (s == "|") return BinaryInfo{4, Op::BitOr, ExprKind::Binary};
    if (s == "^") return BinaryInfo{5, Op::BitXor, ExprKind::Binary};
    if (s == "&") return BinaryInfo{6, Op::BitAnd, ExprKind::Binary};
    if (s == "==") return BinaryInfo{7, Op::Eq, ExprKind::Binary};
    if (s == "!=") return BinaryInfo{7, Op::NotEq, ExprKind::Binary};
    if (s == "===") return BinaryInfo{7, Op::StrictEq, ExprKind::Binary};
    if (s == "!==") return BinaryInfo{7, Op::StrictNotEq, ExprKind::Binary};
    if (s == "<") return BinaryInfo{8, Op::Lt, ExprKind::Binary};
    if (s == ">") return BinaryInfo{8, Op::Gt, ExprKind::Binary};
    if (s == "<=") return BinaryInfo{8, Op::LtE, ExprKind::Binary};
    if (s == ">=") return BinaryInfo{8, Op::GtE, ExprKind::Binary};
    if (s == "<<") return BinaryInfo{9, Op::Shl, ExprKind::Binary};
    if (s == ">>") return BinaryInfo{9, Op::Shr, ExprKind::Binary};
    if (s == ">>>") return BinaryInfo{9, Op::UShr, ExprKind::Binary};
    if (s == "+") return BinaryInfo{10, Op::Add, ExprKind::Binary};
    if (s == "-") return BinaryInfo{10, Op::Sub, ExprKind::Binary};
    if (s == "*") return BinaryInfo{11, Op::Mul, ExprKind::Binary};
    if (s == "/") return BinaryInfo{11, Op::Div, ExprKind::Binary};
    if (s == "%") return BinaryInfo{11, Op::Mod, ExprKind::Binary};
    if (s == "**") return BinaryInfo{12, Op::Pow, ExprKind::Binary, true};
    return std::nullopt;
}

void collect_names(const Pattern& p, std::vector<std::string>& out) {
    if (p.kind == Pattern::Kind::Identifier) {
        out.push_back(p.name);
        return;
    }
    for (const auto& el : p.elements) {
        if (el.target) collect_names(*el.target, out);
    }
}

auto identifier_pattern(std::string name, int line) -> std::unique_ptr<Pattern> {
    auto p = std::make_unique<Pattern>();
    p->kind = Pattern::Kind::Identifier;
    p->name = std::move(name);
    p->line = line;
    return p;
}

class Parser {
public:
    Parser(std::vector<Token> tokens, std::vector<std::string>* outer_vars, int depth)
        : tokens_(std::move(tokens)), depth_(depth) {
        if (outer_vars) var_stack_.push_back(outer_vars);
    }

    auto program() -> std::unique_ptr<Program> {
        auto prog = std::make_unique<Program>();
        var_stack_.push_back(&prog->var_names);
        while (cur().type != TokenType::End) {
            prog->body.push_back(statement());
        }
        return prog;
    }

    /// A complete expression spanning every token (template substitutions).
    auto standalone_expression() -> ExprPtr {
        if (cur().type == TokenType::End) fail("Unexpected end of template substitution", cur().line);
        auto e = expression();
        if (cur().type != TokenType::End) unexpected(cur());
        return e;
    }

    int closures_created = 0;

private:
    class NestingGuard {
    public:
        explicit NestingGuard(Parser& p) : p_(p) {
            if (++p_.depth_ > kMaxSyntaxNesting) p_.fail("Code is nested too deeply", p_.cur().line);
        }
        ~NestingGuard() { --p_.depth_; }
        NestingGuard(const NestingGuard&) = delete;
        auto operator=(const NestingGuard&) -> NestingGuard& = delete;

    private:
        Parser& p_;
    };

    /// Scopes `var` collection and loop nesting to one function body.
    class FunctionContext {
    public:
        FunctionContext(Parser& p, FunctionNode& fn) : p_(p), saved_loops_(p.loop_depth_) {
            p_.var_stack_.push_back(&fn.var_names);
            p_.loop_depth_ = 0;
        }
        ~FunctionContext() {
            p_.var_stack_.pop_back();
            p_.loop_depth_ = saved_loops_;
        }
        FunctionContext(const FunctionContext&) = delete;
        auto operator=(const FunctionContext&) -> FunctionContext& = delete;

    private:
        Parser& p_;
        int saved_loops_;
    };

    /// Re-enables `in` inside brackets nested in a for-loop head.
    class AllowIn {
    public:
        explicit AllowIn(Parser& p) : p_(p), saved_(p.no_in_) { p_.no_in_ = false; }
        ~AllowIn() { p_.no_in_ = saved_; }
        AllowIn(const AllowIn&) = delete;
        auto operator=(const AllowIn&) -> AllowIn& = delete;

    private:
        Parser& p_;
        bool saved_;
    };

    // -----------------------------------------------------------------------
    // Token helpers
    // -----------------------------------------------------------------------

    [[nodiscard]] auto cur() const -> const Token& { return tokens_[pos_]; }

    [[nodiscard]] auto peek_token(std::size_t n = 1) const -> const Token& {
        return tokens_[std::min(pos_ + n, tokens_.size() - 1)];
    }

    auto advance() -> const Token& {
        const auto& t = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) ++pos_;
        return t;
    }

    [[nodiscard]] auto at_punct(std::string_view s) const -> bool { return cur().is_punct(s); }
    [[nodiscard]] auto at_keyword(std::string_view s) const -> bool { return cur().is_keyword(s); }
    [[nodiscard]] auto at_identifier(std::string_view s) const -> bool {
        return cur().is(TokenType::Identifier, s);
    }

    auto eat_punct(std::string_view s) -> bool {
        if (!at_punct(s)) return false;
        advance();
        return true;
    }

    void expect_punct(std::string_view s) {
        if (!eat_punct(s)) unexpected(cur());
    }

    [[noreturn]] void fail(const std::string& message, int line) const {
        throw ParseFailure(make_error(ErrorCode::ParseError,
                                      std::format("SyntaxError: {} (line {})", message, line)));
    }

    [[noreturn]] void unexpected(const Token& t) const {
        switch (t.type) {
            case TokenType::End: fail("Unexpected end of input", t.line);
            case TokenType::Number: fail("Unexpected number", t.line);
            case TokenType::String: fail("Unexpected string", t.line);
            case TokenType::Template: fail("Unexpected template string", t.line);
            default: fail(std::format("Unexpected token '{}'", t.text), t.line);
        }
    }

    [[noreturn]] void unsupported(std::string_view what, int line) const {
        fail(std::format("{} not supported", what), line);
    }

    void consume_semicolon() {
        if (eat_punct(";")) return;
        if (at_punct("}") || cur().type == TokenType::End || cur().newline_before) return;
        unexpected(cur());
    }

    void collect_var_names(const Pattern& p) {
        if (!var_stack_.empty()) collect_names(p, *var_stack_.back());
    }

    // -----------------------------------------------------------------------
    // Statements
    // -----------------------------------------------------------------------

    auto statement() -> StmtPtr {
        NestingGuard guard(*this);
        const auto& t = cur();

        if (t.is_punct("{")) return block();
        if (t.is_punct(";")) {
            advance();
            return std::make_unique<Stmt>(StmtKind::Empty, t.line);
        }

        if (t.type == TokenType::Keyword) {
            const auto& k = t.text;
            if (k == "var" || k == "let" || k == "const") {
                auto decl = var_declaration(false);
                consume_semicolon();
                return decl;
            }
            if (k == "function") return function_declaration(false);
            if (k == "if") return if_statement();
            if (k == "while") return while_statement();
            if (k == "do") return do_while_statement();
            if (k == "for") return for_statement();
            if (k == "return") return return_statement();
            if (k == "break" || k == "continue") return jump_statement();
            if (k == "throw") return throw_statement();
            if (k == "try") return try_statement();
            if (k == "class") unsupported("Classes are", t.line);
            if (k == "switch") unsupported("'switch' is", t.line);
            if (k == "export") unsupported("Module exports are", t.line);
            if (k == "import" && !peek_token().is_punct("(")) unsupported("Module imports are", t.line);
            if (k == "with") unsupported("'with' is", t.line);
            if (k == "debugger") unsupported("'debugger' is", t.line);
        }

        if (t.type == TokenType::Identifier) {
            if (t.text == "async" && peek_token().is_keyword("function") &&
                !peek_token().newline_before) {
                return function_declaration(true);
            }
            if (peek_token().is_punct(":")) unsupported("Labels are", t.line);
        }

        int line = t.line;
        auto expr = expression();
        consume_semicolon();
        return std::make_unique<ExpressionStmt>(std::move(expr), line);
    }

    auto block() -> std::unique_ptr<BlockStmt> {
        auto b = std::make_unique<BlockStmt>(cur().line);
        expect_punct("{");
        while (!at_punct("}")) {
            if (cur().type == TokenType::End) unexpected(cur());
            auto s = statement();
            if (s->kind == StmtKind::FunctionDecl) b->needs_scope = true;
            if (s->kind == StmtKind::VarDecl &&
                static_cast<const VarDeclStmt&>(*s).decl != DeclKind::Var) {
                b->needs_scope = true;
            }
            b->body.push_back(std::move(s));
        }
        advance();
        return b;
    }

    static auto decl_kind(std::string_view keyword) -> DeclKind {
        if (keyword == "var") return DeclKind::Var;
        if (keyword == "let") return DeclKind::Let;
        return DeclKind::Const;
    }

    auto var_declaration(bool for_init) -> std::unique_ptr<VarDeclStmt> {
        const auto& kw = advance();
        auto decl = std::make_unique<VarDeclStmt>(decl_kind(kw.text), kw.line);
        do {
            Declarator d;
            int line = cur().line;
            d.target = binding_pattern();
            if (decl->decl == DeclKind::Var) collect_var_names(*d.target);
            if (eat_punct("=")) {
                d.init = assignment();
            } else if (!for_init && d.target->kind != Pattern::Kind::Identifier) {
                fail("Missing initializer in destructuring declaration", line);
            } else if (!for_init && decl->decl == DeclKind::Const) {
                fail("Missing initializer in const declaration", line);
            }
            decl->declarations.push_back(std::move(d));
        } while (eat_punct(","));
        return decl;
    }

    auto binding_pattern() -> std::unique_ptr<Pattern> {
        NestingGuard guard(*this);
        auto p = std::make_unique<Pattern>();
        p->line = cur().line;

        if (eat_punct("[")) {
            p->kind = Pattern::Kind::Array;
            while (!at_punct("]")) {
                PatternElement el;
                if (eat_punct(",")) {
                    p->elements.push_back(std::move(el));
                    continue;
                }
                if (eat_punct("...")) {
                    el.rest = true;
                    el.target = binding_pattern();
                } else {
                    el.target = binding_pattern();
                    if (eat_punct("=")) el.default_value = assignment();
                }
                p->elements.push_back(std::move(el));
                if (!at_punct("]")) expect_punct(",");
            }
            advance();
            return p;
        }

        if (eat_punct("{")) {
            p->kind = Pattern::Kind::Object;
            while (!at_punct("}")) {
                PatternElement el;
                if (eat_punct("...")) {
                    el.rest = true;
                    const auto& name = advance();
                    if (name.type != TokenType::Identifier) unexpected(name);
                    el.target = identifier_pattern(name.text, name.line);
                } else {
                    const auto& key = advance();
                    bool plain = key.type == TokenType::Identifier;
                    if (plain || key.type == TokenType::Keyword || key.type == TokenType::String) {
                        el.key = key.text;
                    } else if (key.type == TokenType::Number) {
                        el.key = number_to_string(key.number);
                    } else {
                        unexpected(key);
                    }
                    if (eat_punct(":")) {
                        el.target = binding_pattern();
                    } else {
                        if (!plain) unexpected(cur());
                        el.target = identifier_pattern(key.text, key.line);
                    }
                    if (eat_punct("=")) el.default_value = assignment();
                }
                p->elements.push_back(std::move(el));
                if (!at_punct("}")) expect_punct(",");
            }
            advance();
            return p;
        }

        const auto& t = advance();
        if (t.type != TokenType::Identifier) unexpected(t);
        p->name = t.text;
        return p;
    }

    auto function_declaration(bool is_async) -> StmtPtr {
        int line = cur().line;
        if (is_async) advance();
        advance();
        if (at_punct("*")) unsupported("Generators are", line);
        const auto& name = advance();
        if (name.type != TokenType::Identifier) unexpected(name);
        auto fn = function_rest(name.text, is_async, line);
        return std::make_unique<FunctionDeclStmt>(std::move(fn), line);
    }

    auto function_rest(std::string name, bool is_async, int line) -> std::unique_ptr<FunctionNode> {
        auto fn = std::make_unique<FunctionNode>();
        fn->name = std::move(name);
        fn->is_async = is_async;
        fn->line = line;
        params(*fn);
        FunctionContext ctx(*this, *fn);
        fn->body = block();
        ++closures_created;
        return fn;
    }

    void params(FunctionNode& fn) {
        AllowIn allow(*this);
        expect_punct("(");
        while (!at_punct(")")) {
            Param p;
            if (eat_punct("...")) p.rest = true;
            p.target = binding_pattern();
            if (!p.rest && eat_punct("=")) p.default_value = assignment();
            fn.params.push_back(std::move(p));
            if (!at_punct(")")) expect_punct(",");
        }
        advance();
    }

    auto if_statement() -> StmtPtr {
        auto s = std::make_unique<IfStmt>(advance().line);
        expect_punct("(");
        s->test = expression();
        expect_punct(")");
        s->consequent = statement();
        if (at_keyword("else")) {
            advance();
            s->alternate = statement();
        }
        return s;
    }

    auto loop_body() -> StmtPtr {
        ++loop_depth_;
        auto body = statement();
        --loop_depth_;
        return body;
    }

    auto while_statement() -> StmtPtr {
        auto s = std::make_unique<LoopStmt>(StmtKind::While, advance().line);
        expect_punct("(");
        s->test = expression();
        expect_punct(")");
        s->body = loop_body();
        return s;
    }

    auto do_while_statement() -> StmtPtr {
        auto s = std::make_unique<LoopStmt>(StmtKind::DoWhile, advance().line);
        s->body = loop_body();
        if (!at_keyword("while")) unexpected(cur());
        advance();
        expect_punct("(");
        s->test = expression();
        expect_punct(")");
        eat_punct(";");
        return s;
    }

    auto for_statement() -> StmtPtr {
        int line = advance().line;
        if (at_keyword("await")) advance();
        expect_punct("(");

        int closures_before = closures_created;
        StmtPtr init;
        std::vector<std::string> let_names;

        if (at_keyword("var") || at_keyword("let") || at_keyword("const")) {
            auto kind = decl_kind(cur().text);
            std::size_t save = pos_;
            advance();
            auto target = binding_pattern();
            if (at_identifier("of") || at_keyword("in")) {
                return for_each(line, kind, std::move(target));
            }
            pos_ = save;
            no_in_ = true;
            auto decl = var_declaration(true);
            no_in_ = false;
            if (decl->decl == DeclKind::Let) {
                for (const auto& d : decl->declarations) collect_names(*d.target, let_names);
            }
            init = std::move(decl);
        } else if (!at_punct(";")) {
            no_in_ = true;
            auto expr = expression();
            no_in_ = false;
            if (at_identifier("of") || at_keyword("in")) {
                if (expr->kind != ExprKind::Identifier) fail("Invalid left-hand side in for-loop", line);
                auto target = identifier_pattern(static_cast<const IdentifierExpr&>(*expr).name, expr->line);
                return for_each(line, std::nullopt, std::move(target));
            }
            init = std::make_unique<ExpressionStmt>(std::move(expr), line);
        }

        auto s = std::make_unique<ForStmt>(line);
        s->init = std::move(init);
        expect_punct(";");
        if (!at_punct(";")) s->test = expression();
        expect_punct(";");
        if (!at_punct(")")) s->update = expression();
        expect_punct(")");
        s->body = loop_body();
        if (closures_created != closures_before) s->per_iteration = std::move(let_names);
        return s;
    }

    auto for_each(int line, std::optional<DeclKind> decl, std::unique_ptr<Pattern> target) -> StmtPtr {
        auto s = std::make_unique<ForEachStmt>(line);
        s->of = at_identifier("of");
        advance();
        s->decl = decl;
        if (decl == DeclKind::Var) collect_var_names(*target);
        s->target = std::move(target);
        s->iterable = s->of ? assignment() : expression();
        expect_punct(")");
        s->body = loop_body();
        return s;
    }

    auto return_statement() -> StmtPtr {
        int line = advance().line;
        ExprPtr arg;
        if (!at_punct(";") && !at_punct("}") && cur().type != TokenType::End &&
            !cur().newline_before) {
            arg = expression();
        }
        consume_semicolon();
        return std::make_unique<ArgumentStmt>(StmtKind::Return, std::move(arg), line);
    }

    auto jump_statement() -> StmtPtr {
        const auto& kw = advance();
        bool is_break = kw.text == "break";
        if (cur().type == TokenType::Identifier && !cur().newline_before) {
            unsupported("Labels are", kw.line);
        }
        if (loop_depth_ == 0) {
            fail(is_break ? "Illegal break statement"
                          : "Illegal continue statement: no surrounding iteration statement",
                 kw.line);
        }
        consume_semicolon();
        return std::make_unique<Stmt>(is_break ? StmtKind::Break : StmtKind::Continue, kw.line);
    }

    auto throw_statement() -> StmtPtr {
        int line = advance().line;
        if (cur().newline_before) fail("Illegal newline after throw", line);
        auto arg = expression();
        consume_semicolon();
        return std::make_unique<ArgumentStmt>(StmtKind::Throw, std::move(arg), line);
    }

    auto try_statement() -> StmtPtr {
        auto s = std::make_unique<TryStmt>(advance().line);
        s->block = block();
        if (at_keyword("catch")) {
            advance();
            if (eat_punct("(")) {
                s->param = binding_pattern();
                expect_punct(")");
            }
            s->handler = block();
        }
        if (at_keyword("finally")) {
            advance();
            s->finalizer = block();
        }
        if (!s->handler && !s->finalizer) fail("Missing catch or finally after try", s->line);
        return s;
    }

    // -----------------------------------------------------------------------
    // Expressions
    // -----------------------------------------------------------------------

    auto expression() -> ExprPtr {
        auto first = assignment();
        if (!at_punct(",")) return first;
        auto seq = std::make_unique<SequenceExpr>(first->line);
        seq->expressions.push_back(std::move(first));
        while (eat_punct(",")) seq->expressions.push_back(assignment());
        return seq;
    }

    /// True when the tokens at the cursor start an arrow function.
    [[nodiscard]] auto arrow_ahead() const -> bool {
        const auto& t = cur();
        if (t.type == TokenType::Identifier) {
            return peek_token().is_punct("=>") && !peek_token().newline_before;
        }
        if (!t.is_punct("(")) return false;
        int depth = 0;
        for (std::size_t i = pos_; i < tokens_.size(); ++i) {
            const auto& tok = tokens_[i];
            if (tok.type == TokenType::End) return false;
            if (tok.type != TokenType::Punctuator) continue;
            if (tok.text == "(" || tok.text == "[" || tok.text == "{") ++depth;
            if (tok.text == ")" || tok.text == "]" || tok.text == "}") {
                if (--depth == 0) {
                    return i + 1 < tokens_.size() && tokens_[i + 1].is_punct("=>");
                }
            }
        }
        return false;
    }

    auto assignment() -> ExprPtr {
        NestingGuard guard(*this);
        if (arrow_ahead()) return arrow_function(false);
        if (at_identifier("async") && !peek_token().newline_before) {
            std::size_t save = pos_;
            advance();
            if (arrow_ahead()) return arrow_function(true);
            pos_ = save;
        }

        auto left = conditional();
        if (cur().type != TokenType::Punctuator) return left;
        auto op = assignment_op(cur().text);
        if (!op) return left;

        auto node = std::make_unique<AssignExpr>(cur().line);
        advance();
        node->op = *op;
        if (*op == Op::Assign &&
            (left->kind == ExprKind::Array || left->kind == ExprKind::Object)) {
            node->pattern = to_pattern(std::move(left));
        } else if (left->kind == ExprKind::Identifier || left->kind == ExprKind::Member) {
            node->target = std::move(left);
        } else {
            fail("Invalid left-hand side in assignment", node->line);
        }
        node->value = assignment();
        return node;
    }

    auto arrow_function(bool is_async) -> ExprPtr {
        int line = cur().line;
        auto fn = std::make_unique<FunctionNode>();
        fn->is_arrow = true;
        fn->is_async = is_async;
        fn->line = line;
        if (cur().type == TokenType::Identifier) {
            Param p;
            p.target = identifier_pattern(cur().text, line);
            fn->params.push_back(std::move(p));
            advance();
        } else {
            params(*fn);
        }
        expect_punct("=>");
        {
            FunctionContext ctx(*this, *fn);
            AllowIn allow(*this);
            if (at_punct("{")) {
                fn->body = block();
            } else {
                fn->expression_body = assignment();
            }
        }
        ++closures_created;
        return std::make_unique<FunctionExpr>(std::move(fn), line);
    }

    auto conditional() -> ExprPtr {
        auto test = binary(1);
        if (!at_punct("?")) return test;
        auto node = std::make_unique<ConditionalExpr>(cur().line);
        advance();
        node->test = std::move(test);
        {
            AllowIn allow(*this);
            node->consequent = assignment();
        }
        expect_punct(":");
        node->alternate = assignment();
        return node;
    }

    auto binary(int min_precedence) -> ExprPtr {
        auto left = unary();
        while (true) {
            auto info = binary_info(cur());
            if (!info || info->precedence < min_precedence) break;
            if (no_in_ && info->op == Op::In) break;
            int line = cur().line;
            advance();
            auto right = binary(info->right_assoc ? info->precedence : info->precedence + 1);
            left = std::make_unique<BinaryExpr>(info->kind, info->op, std::move(left),
                                                std::move(right), line);
        }
        return left;
    }

    void check_update_target(const Expr& e) const {
        if (e.kind != ExprKind::Identifier && e.kind != ExprKind::Member) {
            fail("Invalid left-hand side expression in update operation", e.line);
        }
    }

    auto unary() -> ExprPtr {
        NestingGuard guard(*this);
        const auto& t = cur();
        if (t.type == TokenType::Punctuator) {
            std::optional<Op> op;
            if (t.text == "!") op = Op::Not;
            else if (t.text == "-") op = Op::Neg;
            else if (t.text == "+") op = Op::Plus;
            else if (t.text == "~") op = Op::BitNot;
            if (op) {
                advance();
                return std::make_unique<UnaryExpr>(*op, unary(), t.line);
            }
            if (t.text == "++" || t.text == "--") {
                advance();
                auto target = unary();
                check_update_target(*target);
                return std::make_unique<UpdateExpr>(t.text == "++", true, std::move(target), t.line);
            }
        }
        if (t.type == TokenType::Keyword) {
            if (t.text == "typeof" || t.text == "void" || t.text == "delete") {
                advance();
                Op op = t.text == "typeof" ? Op::TypeOf : t.text == "void" ? Op::Void : Op::Delete;
                return std::make_unique<UnaryExpr>(op, unary(), t.line);
            }
            if (t.text == "await") {
                advance();
                return std::make_unique<WrapperExpr>(ExprKind::Await, unary(), t.line);
            }
        }
        return postfix();
    }

    auto postfix() -> ExprPtr {
        auto e = call_member();
        if ((at_punct("++") || at_punct("--")) && !cur().newline_before) {
            check_update_target(*e);
            bool inc = at_punct("++");
            int line = advance().line;
            return std::make_unique<UpdateExpr>(inc, false, std::move(e), line);
        }
        return e;
    }

    auto property_name() -> std::string {
        const auto& t = advance();
        if (t.type != TokenType::Identifier && t.type != TokenType::Keyword) unexpected(t);
        return t.text;
    }

    auto arguments() -> std::vector<ExprPtr> {
        AllowIn allow(*this);
        std::vector<ExprPtr> args;
        expect_punct("(");
        while (!at_punct(")")) {
            if (at_punct("...")) {
                int line = advance().line;
                args.push_back(std::make_unique<WrapperExpr>(ExprKind::Spread, assignment(), line));
            } else {
                args.push_back(assignment());
            }
            if (!at_punct(")")) expect_punct(",");
        }
        advance();
        return args;
    }

    auto call_member() -> ExprPtr {
        int line = cur().line;
        auto expr = primary();
        bool chained = false;
        while (true) {
            const auto& t = cur();
            if (t.is_punct(".")) {
                advance();
                auto m = std::make_unique<MemberExpr>(t.line);
                m->object = std::move(expr);
                m->property = property_name();
                expr = std::move(m);
            } else if (t.is_punct("?.")) {
                advance();
                chained = true;
                if (at_punct("(")) {
                    auto c = std::make_unique<CallExpr>(t.line);
                    c->callee = std::move(expr);
                    c->optional = true;
                    c->arguments = arguments();
                    expr = std::move(c);
                } else {
                    auto m = std::make_unique<MemberExpr>(t.line);
                    m->object = std::move(expr);
                    m->optional = true;
                    if (eat_punct("[")) {
                        AllowIn allow(*this);
                        m->computed = expression();
                        expect_punct("]");
                    } else {
                        m->property = property_name();
                    }
                    expr = std::move(m);
                }
            } else if (t.is_punct("[")) {
                advance();
                auto m = std::make_unique<MemberExpr>(t.line);
                m->object = std::move(expr);
                {
                    AllowIn allow(*this);
                    m->computed = expression();
                }
                expect_punct("]");
                expr = std::move(m);
            } else if (t.is_punct("(")) {
                auto c = std::make_unique<CallExpr>(t.line);
                c->callee = std::move(expr);
                c->arguments = arguments();
                expr = std::move(c);
            } else if (t.type == TokenType::Template) {
                unsupported("Tagged templates are", t.line);
            } else {
                break;
            }
        }
        if (chained) return std::make_unique<OptionalChainExpr>(std::move(expr), line);
        return expr;
    }

    auto primary() -> ExprPtr {
        const auto& t = cur();
        switch (t.type) {
            case TokenType::Number:
                advance();
                return std::make_unique<NumberExpr>(t.number, t.line);
            case TokenType::String:
                advance();
                return std::make_unique<StringExpr>(t.text, t.line);
            case TokenType::Template:
                return template_literal();
            case TokenType::Identifier:
                if (t.text == "async" && peek_token().is_keyword("function") &&
                    !peek_token().newline_before) {
                    advance();
                    return function_expression(true);
                }
                advance();
                return std::make_unique<IdentifierExpr>(t.text, t.line);
            case TokenType::Keyword:
                return keyword_primary();
            case TokenType::Punctuator:
                if (t.text == "(") {
                    advance();
                    AllowIn allow(*this);
                    auto e = expression();
                    expect_punct(")");
                    return e;
                }
                if (t.text == "[") return array_literal();
                if (t.text == "{") return object_literal();
                unexpected(t);
            case TokenType::End:
                break;
        }
        unexpected(t);
    }

    auto keyword_primary() -> ExprPtr {
        const auto& t = cur();
        const auto& k = t.text;
        if (k == "true" || k == "false") {
            advance();
            return std::make_unique<BooleanExpr>(k == "true", t.line);
        }
        if (k == "null") {
            advance();
            return std::make_unique<WrapperExpr>(ExprKind::Null, nullptr, t.line);
        }
        if (k == "this") {
            advance();
            return std::make_unique<WrapperExpr>(ExprKind::This, nullptr, t.line);
        }
        if (k == "function") return function_expression(false);
        if (k == "new") unsupported("'new' is", t.line);
        if (k == "class") unsupported("Classes are", t.line);
        if (k == "import") unsupported("Module imports are", t.line);
        if (k == "super") unsupported("'super' is", t.line);
        if (k == "yield") unsupported("Generators are", t.line);
        unexpected(t);
    }

    auto function_expression(bool is_async) -> ExprPtr {
        int line = advance().line;
        if (at_punct("*")) unsupported("Generators are", line);
        std::string name;
        if (cur().type == TokenType::Identifier) name = advance().text;
        auto fn = function_rest(std::move(name), is_async, line);
        return std::make_unique<FunctionExpr>(std::move(fn), line);
    }

    auto template_literal() -> ExprPtr {
        const auto& t = advance();
        auto node = std::make_unique<TemplateExpr>(t.line);
        node->quasis = t.quasis;
        for (const auto& part : t.substitutions) {
            auto tokens = tokenize(part.source, part.line);
            if (!tokens) throw ParseFailure(tokens.error());
            Parser sub(std::move(*tokens), var_stack_.empty() ? nullptr : var_stack_.back(), depth_);
            node->expressions.push_back(sub.standalone_expression());
            closures_created += sub.closures_created;
        }
        return node;
    }

    auto array_literal() -> ExprPtr {
        AllowIn allow(*this);
        auto node = std::make_unique<ArrayExpr>(advance().line);
        while (!at_punct("]")) {
            if (at_punct(",")) {
                advance();
                node->elements.push_back(nullptr);
                continue;
            }
            if (at_punct("...")) {
                int line = advance().line;
                node->elements.push_back(std::make_unique<WrapperExpr>(ExprKind::Spread, assignment(), line));
            } else {
                node->elements.push_back(assignment());
            }
            if (!at_punct("]")) expect_punct(",");
        }
        advance();
        return node;
    }

    auto object_literal() -> ExprPtr {
        AllowIn allow(*this);
        auto node = std::make_unique<ObjectExpr>(advance().line);
        while (!at_punct("}")) {
            PropertyNode prop;
            if (at_punct("...")) {
                advance();
                prop.spread = true;
                prop.value = assignment();
            } else {
                object_property(prop);
            }
            node->properties.push_back(std::move(prop));
            if (!at_punct("}")) expect_punct(",");
        }
        advance();
        return node;
    }

    void object_property(PropertyNode& prop) {
        const auto& next = peek_token();
        bool next_is_key = next.type == TokenType::Identifier || next.type == TokenType::Keyword ||
                           next.type == TokenType::String || next.type == TokenType::Number ||
                           next.is_punct("[");
        if ((at_identifier("get") || at_identifier("set")) && next_is_key) {
            unsupported("Getters and setters are", cur().line);
        }
        bool is_async = false;
        if (at_identifier("async") && next_is_key && !next.newline_before) {
            is_async = true;
            advance();
        }

        const auto& key = advance();
        bool plain = key.type == TokenType::Identifier;
        if (key.is_punct("[")) {
            prop.computed_key = assignment();
            expect_punct("]");
        } else if (plain || key.type == TokenType::Keyword || key.type == TokenType::String) {
            prop.key = key.text;
        } else if (key.type == TokenType::Number) {
            prop.key = number_to_string(key.number);
        } else {
            unexpected(key);
        }

        if (at_punct("(")) {
            auto fn = function_rest(prop.key, is_async, key.line);
            prop.value = std::make_unique<FunctionExpr>(std::move(fn), key.line);
        } else if (eat_punct(":")) {
            prop.value = assignment();
        } else if (plain && !is_async) {
            prop.shorthand = true;
            auto ident = std::make_unique<IdentifierExpr>(key.text, key.line);
            if (at_punct("=")) {
                // Only meaningful once the literal becomes a destructuring target.
                auto assign = std::make_unique<AssignExpr>(cur().line);
                advance();
                assign->target = std::move(ident);
                assign->value = assignment();
                prop.value = std::move(assign);
            } else {
                prop.value = std::move(ident);
            }
        } else {
            unexpected(cur());
        }
    }

    /// Reinterprets an array/object literal on the left of `=` as a pattern.
    auto to_pattern(ExprPtr e) -> std::unique_ptr<Pattern> {
        switch (e->kind) {
            case ExprKind::Identifier:
                return identifier_pattern(static_cast<IdentifierExpr&>(*e).name, e->line);
            case ExprKind::Array: {
                auto p = std::make_unique<Pattern>();
                p->kind = Pattern::Kind::Array;
                p->line = e->line;
                for (auto& el : static_cast<ArrayExpr&>(*e).elements) {
                    PatternElement pe;
                    if (el) element_to_pattern(std::move(el), pe);
                    p->elements.push_back(std::move(pe));
                }
                return p;
            }
            case ExprKind::Object: {
                auto p = std::make_unique<Pattern>();
                p->kind = Pattern::Kind::Object;
                p->line = e->line;
                for (auto& prop : static_cast<ObjectExpr&>(*e).properties) {
                    if (prop.computed_key) fail("Computed keys are not supported in destructuring", e->line);
                    PatternElement pe;
                    pe.key = prop.key;
                    element_to_pattern(std::move(prop.value), pe);
                    pe.rest = prop.spread;
                    p->elements.push_back(std::move(pe));
                }
                return p;
            }
            default:
                fail("Invalid destructuring assignment target", e->line);
        }
    }

    void element_to_pattern(ExprPtr value, PatternElement& pe) {
        if (value->kind == ExprKind::Spread) {
            pe.rest = true;
            pe.target = to_pattern(std::move(static_cast<WrapperExpr&>(*value).operand));
        } else if (value->kind == ExprKind::Assign &&
                   static_cast<AssignExpr&>(*value).op == Op::Assign &&
                   static_cast<AssignExpr&>(*value).target) {
            auto& assign = static_cast<AssignExpr&>(*value);
            pe.target = to_pattern(std::move(assign.target));
            pe.default_value = std::move(assign.value);
        } else {
            pe.target = to_pattern(std::move(value));
        }
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    int depth_ = 0;
    int loop_depth_ = 0;
    bool no_in_ = false;
    std::vector<std::vector<std::string>*> var_stack_;
};

} // anonymous namespace

auto parse_program(std::string_view source) -> Result<std::unique_ptr<Program>> {
    auto tokens = tokenize(source);
    if (!tokens) return std::unexpected(tokens.error());
    try {
        Parser parser(std::move(*tokens), nullptr, 0);
        return parser.program();
    } catch (const ParseFailure& e) {
        return std::unexpected(e.error());
    }
}

} // namespace ctxopt::script
