#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctxopt/core/cancellation.hpp"
#include "ctxopt/core/error.hpp"
#include "ctxopt/script/ast.hpp"
#include "ctxopt/script/value.hpp"

namespace ctxopt::script {

/// Variable bindings of one block or function body.
class Scope {
public:
    struct Binding {
        Value value;
        bool is_const = false;
    };

    explicit Scope(std::shared_ptr<Scope> parent) : parent_(std::move(parent)) {}

    /// Adds a binding to this scope; false when the name already exists here.
    auto declare(const std::string& name, Value value, bool is_const) -> bool;

    /// Finds `name` here or in an enclosing scope.
    auto lookup(const std::string& name) -> Binding*;

    [[nodiscard]] auto has_own(const std::string& name) const -> bool {
        return bindings_.contains(name);
    }

private:
    std::unordered_map<std::string, Binding> bindings_;
    std::shared_ptr<Scope> parent_;
};

using ScopePtr = std::shared_ptr<Scope>;

/// Receiver kinds that carry builtin methods (`"a".split`, `[].map`, ...).
enum class Receiver { String, Array, Number, Object };

struct InterpreterOptions {
    std::size_t max_call_depth = 200;
};

/// Tree-walking evaluator for parsed scripts. One interpreter serves one run:
/// it shares the heap and cancellation token of the execution that owns it.
class Interpreter {
public:
    Interpreter(Heap& heap, const CancellationToken& cancel, InterpreterOptions options = {});

    /// Binds a read-only global (builtins, `ctx`).
    void define_global(const std::string& name, Value value);

    /// Registers a method reachable on every value of the receiver kind.
    void define_method(Receiver receiver, const std::string& name, NativeFn fn);

    /// Runs a program. Uncaught script errors become RuntimeError (or
    /// PathRejected when the thrown error carries that code), deadline
    /// expiry becomes Timeout and budget exhaustion MemoryLimit.
    auto run(const Program& program) -> Result<Value>;

    // -- Used by builtins and host bindings; these throw ScriptException. --

    auto call(const Value& callee, const Value& self, std::vector<Value> args) -> Value;
    auto get_property(const Value& target, const std::string& key) -> Value;
    void set_property(const Value& target, const std::string& key, Value value);

    /// Wraps a freshly built string, charging its size to the heap.
    auto make_string(std::string s) -> Value;

    [[noreturn]] void throw_error(std::string_view name, std::string message);

    /// Throws AbortError(Timeout) once the token is cancelled.
    void check_cancelled() const;

    /// Elements visited by `for ... of`, spread and Array.from.
    auto iterate(const Value& v) -> std::vector<Value>;

    /// Own enumerable keys in insertion order (indices for arrays and strings).
    auto own_keys(const Value& v) -> std::vector<std::string>;

    [[nodiscard]] auto heap() -> Heap& { return heap_; }
    [[nodiscard]] auto cancellation() const -> const CancellationToken& { return cancel_; }

private:
    enum class Completion { Normal, Return, Break, Continue };
    enum class BindMode { Var, Let, Const, Assign };

    auto exec(const Stmt& stmt, const ScopePtr& scope) -> Completion;
    auto exec_list(const std::vector<StmtPtr>& body, const ScopePtr& scope) -> Completion;
    auto exec_for(const ForStmt& s, const ScopePtr& scope) -> Completion;
    auto exec_for_each(const ForEachStmt& s, const ScopePtr& scope) -> Completion;
    auto exec_try(const TryStmt& s, const ScopePtr& scope) -> Completion;

    void hoist_functions(const std::vector<StmtPtr>& body, const ScopePtr& scope);
    void bind_pattern(const Pattern& pattern, Value value, const ScopePtr& scope, BindMode mode);
    void bind_name(const std::string& name, Value value, const ScopePtr& scope, BindMode mode);

    auto eval(const Expr& expr, const ScopePtr& scope) -> Value;
    auto eval_identifier(const IdentifierExpr& e, const ScopePtr& scope) -> Value;
    auto eval_template(const TemplateExpr& e, const ScopePtr& scope) -> Value;
    auto eval_array(const ArrayExpr& e, const ScopePtr& scope) -> Value;
    auto eval_object(const ObjectExpr& e, const ScopePtr& scope) -> Value;
    auto eval_unary(const UnaryExpr& e, const ScopePtr& scope) -> Value;
    auto eval_update(const UpdateExpr& e, const ScopePtr& scope) -> Value;
    auto eval_assign(const AssignExpr& e, const ScopePtr& scope) -> Value;
    auto eval_call(const CallExpr& e, const ScopePtr& scope) -> Value;
    auto eval_arguments(const std::vector<ExprPtr>& args, const ScopePtr& scope) -> std::vector<Value>;
    auto member_key(const MemberExpr& e, const ScopePtr& scope) -> std::string;
    auto make_function(const FunctionNode& node, const ScopePtr& scope) -> Value;
    auto call_script(const Function& fn, std::vector<Value> args) -> Value;

    auto binary_op(Op op, const Value& left, const Value& right) -> Value;
    auto instance_of(const Value& left, const Value& right) -> bool;
    auto has_property(const Value& target, const std::string& key) -> bool;
    auto delete_property(const Value& target, const std::string& key) -> bool;
    auto describe(const Expr& expr) const -> std::string;
    void assign_to(const Expr& target, Value value, const ScopePtr& scope);
    auto lookup_method(Receiver receiver, const std::string& name) const -> Function*;

    Heap& heap_;
    const CancellationToken& cancel_;
    InterpreterOptions options_;
    ScopePtr globals_;
    Value return_value_;
    std::size_t depth_ = 0;
    std::unordered_map<std::string, Function*> methods_[4];
};

} // namespace ctxopt::script
