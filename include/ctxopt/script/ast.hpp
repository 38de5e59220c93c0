#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxopt::script {

struct Expr;
struct Stmt;
struct Pattern;
struct FunctionNode;
struct BlockStmt;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

enum class Op {
    // binary
    Add, Sub, Mul, Div, Mod, Pow,
    Eq, NotEq, StrictEq, StrictNotEq, Lt, Gt, LtE, GtE,
    BitAnd, BitOr, BitXor, Shl, Shr, UShr, In, InstanceOf,
    // logical
    And, Or, Nullish,
    // unary
    Not, Neg, Plus, BitNot, TypeOf, Void, Delete,
    // assignment
    Assign,
};

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

enum class ExprKind {
    Number, String, Template, Boolean, Null, This, Identifier,
    Array, Object, Function, Unary, Update, Binary, Logical, Conditional,
    Assign, Member, Call, OptionalChain, Spread, Await, Sequence,
};

struct Expr {
    Expr(ExprKind k, int l) : kind(k), line(l) {}
    virtual ~Expr() = default;

    ExprKind kind;
    int line;
};

struct NumberExpr : Expr {
    NumberExpr(double v, int l) : Expr(ExprKind::Number, l), value(v) {}
    double value;
};

struct StringExpr : Expr {
    StringExpr(std::string v, int l) : Expr(ExprKind::String, l), value(std::move(v)) {}
    std::string value;
};

struct TemplateExpr : Expr {
    explicit TemplateExpr(int l) : Expr(ExprKind::Template, l) {}
    std::vector<std::string> quasis;
    std::vector<ExprPtr> expressions;
};

struct BooleanExpr : Expr {
    BooleanExpr(bool v, int l) : Expr(ExprKind::Boolean, l), value(v) {}
    bool value;
};

struct IdentifierExpr : Expr {
    IdentifierExpr(std::string n, int l) : Expr(ExprKind::Identifier, l), name(std::move(n)) {}
    std::string name;
};

/// Array literal; elements may be SpreadExpr.
struct ArrayExpr : Expr {
    explicit ArrayExpr(int l) : Expr(ExprKind::Array, l) {}
    std::vector<ExprPtr> elements;
};

struct PropertyNode {
    bool spread = false;
    bool shorthand = false;
    std::string key;
    ExprPtr computed_key;
    ExprPtr value;
};

struct ObjectExpr : Expr {
    explicit ObjectExpr(int l) : Expr(ExprKind::Object, l) {}
    std::vector<PropertyNode> properties;
};

struct UnaryExpr : Expr {
    UnaryExpr(Op o, ExprPtr arg, int l) : Expr(ExprKind::Unary, l), op(o), operand(std::move(arg)) {}
    Op op;
    ExprPtr operand;
};

struct UpdateExpr : Expr {
    UpdateExpr(bool inc, bool pre, ExprPtr t, int l)
        : Expr(ExprKind::Update, l), increment(inc), prefix(pre), target(std::move(t)) {}
    bool increment;
    bool prefix;
    ExprPtr target;
};

struct BinaryExpr : Expr {
    BinaryExpr(ExprKind k, Op o, ExprPtr a, ExprPtr b, int l)
        : Expr(k, l), op(o), left(std::move(a)), right(std::move(b)) {}
    Op op;
    ExprPtr left;
    ExprPtr right;
};

struct ConditionalExpr : Expr {
    explicit ConditionalExpr(int l) : Expr(ExprKind::Conditional, l) {}
    ExprPtr test;
    ExprPtr consequent;
    ExprPtr alternate;
};

/// `target op= value`. `op` is Assign for plain assignment, otherwise the
/// binary or logical operator applied before storing. Destructuring
/// assignment carries `pattern` instead of `target`.
struct AssignExpr : Expr {
    explicit AssignExpr(int l) : Expr(ExprKind::Assign, l) {}
    Op op = Op::Assign;
    ExprPtr target;
    std::unique_ptr<Pattern> pattern;
    ExprPtr value;
};

struct MemberExpr : Expr {
    explicit MemberExpr(int l) : Expr(ExprKind::Member, l) {}
    ExprPtr object;
    std::string property;
    ExprPtr computed;
    bool optional = false;
};

struct CallExpr : Expr {
    explicit CallExpr(int l) : Expr(ExprKind::Call, l) {}
    ExprPtr callee;
    std::vector<ExprPtr> arguments;
    bool optional = false;
};

/// Boundary of a chain containing `?.`; a nullish link ends the whole chain.
struct OptionalChainExpr : Expr {
    OptionalChainExpr(ExprPtr e, int l) : Expr(ExprKind::OptionalChain, l), expression(std::move(e)) {}
    ExprPtr expression;
};

/// `...x` (spread), `await x`, and the operand-less `null` and `this`.
struct WrapperExpr : Expr {
    WrapperExpr(ExprKind k, ExprPtr e, int l) : Expr(k, l), operand(std::move(e)) {}
    ExprPtr operand;
};

struct SequenceExpr : Expr {
    explicit SequenceExpr(int l) : Expr(ExprKind::Sequence, l) {}
    std::vector<ExprPtr> expressions;
};

// ---------------------------------------------------------------------------
// Binding patterns
// ---------------------------------------------------------------------------

struct PatternElement {
    std::string key;                  // object patterns: source property
    std::unique_ptr<Pattern> target;  // null for array holes
    ExprPtr default_value;
    bool rest = false;
};

struct Pattern {
    enum class Kind { Identifier, Object, Array };

    Kind kind = Kind::Identifier;
    int line = 1;
    std::string name;
    std::vector<PatternElement> elements;
};

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

enum class StmtKind {
    Expression, VarDecl, FunctionDecl, Return, If, Block, While, DoWhile,
    For, ForEach, Break, Continue, Throw, Try, Empty,
};

enum class DeclKind { Var, Let, Const };

struct Stmt {
    Stmt(StmtKind k, int l) : kind(k), line(l) {}
    virtual ~Stmt() = default;

    StmtKind kind;
    int line;
};

struct ExpressionStmt : Stmt {
    ExpressionStmt(ExprPtr e, int l) : Stmt(StmtKind::Expression, l), expression(std::move(e)) {}
    ExprPtr expression;
};

struct Declarator {
    std::unique_ptr<Pattern> target;
    ExprPtr init;
};

struct VarDeclStmt : Stmt {
    VarDeclStmt(DeclKind d, int l) : Stmt(StmtKind::VarDecl, l), decl(d) {}
    DeclKind decl;
    std::vector<Declarator> declarations;
};

struct FunctionDeclStmt : Stmt {
    FunctionDeclStmt(std::unique_ptr<FunctionNode> f, int l)
        : Stmt(StmtKind::FunctionDecl, l), function(std::move(f)) {}
    std::unique_ptr<FunctionNode> function;
};

/// `return`, `throw`; `argument` may be null for a bare return.
struct ArgumentStmt : Stmt {
    ArgumentStmt(StmtKind k, ExprPtr e, int l) : Stmt(k, l), argument(std::move(e)) {}
    ExprPtr argument;
};

struct IfStmt : Stmt {
    explicit IfStmt(int l) : Stmt(StmtKind::If, l) {}
    ExprPtr test;
    StmtPtr consequent;
    StmtPtr alternate;
};

struct BlockStmt : Stmt {
    explicit BlockStmt(int l) : Stmt(StmtKind::Block, l) {}
    std::vector<StmtPtr> body;
    /// True when the block declares let/const/function bindings of its own.
    bool needs_scope = false;
};

/// `while` and `do ... while`.
struct LoopStmt : Stmt {
    LoopStmt(StmtKind k, int l) : Stmt(k, l) {}
    ExprPtr test;
    StmtPtr body;
};

struct ForStmt : Stmt {
    explicit ForStmt(int l) : Stmt(StmtKind::For, l) {}
    StmtPtr init;
    ExprPtr test;
    ExprPtr update;
    StmtPtr body;
    /// Names declared with `let` in `init`, rebound per iteration when the
    /// body creates closures.
    std::vector<std::string> per_iteration;
};

/// `for (x of xs)` and `for (k in obj)`.
struct ForEachStmt : Stmt {
    explicit ForEachStmt(int l) : Stmt(StmtKind::ForEach, l) {}
    bool of = true;
    std::optional<DeclKind> decl;
    std::unique_ptr<Pattern> target;
    ExprPtr iterable;
    StmtPtr body;
};

struct TryStmt : Stmt {
    explicit TryStmt(int l) : Stmt(StmtKind::Try, l) {}
    std::unique_ptr<BlockStmt> block;
    std::unique_ptr<Pattern> param;
    std::unique_ptr<BlockStmt> handler;
    std::unique_ptr<BlockStmt> finalizer;
};

// ---------------------------------------------------------------------------
// Functions and programs
// ---------------------------------------------------------------------------

struct Param {
    std::unique_ptr<Pattern> target;
    ExprPtr default_value;
    bool rest = false;
};

struct FunctionNode {
    std::string name;
    std::vector<Param> params;
    std::unique_ptr<BlockStmt> body;
    ExprPtr expression_body;
    bool is_arrow = false;
    bool is_async = false;
    /// `var` names hoisted to the function scope.
    std::vector<std::string> var_names;
    int line = 1;
};

struct FunctionExpr : Expr {
    FunctionExpr(std::unique_ptr<FunctionNode> f, int l)
        : Expr(ExprKind::Function, l), function(std::move(f)) {}
    std::unique_ptr<FunctionNode> function;
};

/// A parsed script. Function objects created while running point into it,
/// so it must outlive the interpreter run.
struct Program {
    std::vector<StmtPtr> body;
    std::vector<std::string> var_names;
};

} // namespace ctxopt::script
