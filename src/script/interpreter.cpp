#include "ctxopt/script/interpreter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <format>
#include <iterator>
#include <new>
#include <stdexcept>
#include <utility>

namespace ctxopt::script {

namespace {

/// Unwinds an optional chain whose link evaluated to null or undefined.
struct ChainShortCircuit {};

auto to_int32(double d) -> std::int32_t {
    if (!std::isfinite(d)) return 0;
    double m = std::fmod(std::trunc(d), 4294967296.0);
    if (m < 0) m += 4294967296.0;
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(m));
}

auto to_uint32(double d) -> std::uint32_t {
    return static_cast<std::uint32_t>(to_int32(d));
}

auto is_reference(const Value& v) -> bool {
    return v.is_object() || v.is_array() || v.is_function();
}

auto short_circuits(Op op, const Value& current) -> bool {
    switch (op) {
        case Op::And: return !is_truthy(current);
        case Op::Or: return is_truthy(current);
        case Op::Nullish: return !current.is_nullish();
        default: return false;
    }
}

auto is_logical(Op op) -> bool {
    return op == Op::And || op == Op::Or || op == Op::Nullish;
}

/// Gives `const f = () => ...` and `{ f: function () {} }` their names.
void name_function(const Value& v, const std::string& name) {
    if (!v.is_function()) return;
    auto* fn = v.as_function();
    if (fn->node && fn->name.empty()) fn->name = name;
}

auto error_code_of(const Value& v) -> ErrorCode {
    if (v.is_object() && v.as_object()->is_error) {
        const auto* code = v.as_object()->properties.find("code");
        if (code && code->is_string() &&
            code->as_string() == error_code_to_string(ErrorCode::PathRejected)) {
            return ErrorCode::PathRejected;
        }
    }
    return ErrorCode::RuntimeError;
}

class CallDepthGuard {
public:
    explicit CallDepthGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
    ~CallDepthGuard() { --depth_; }
    CallDepthGuard(const CallDepthGuard&) = delete;
    auto operator=(const CallDepthGuard&) -> CallDepthGuard& = delete;

private:
    std::size_t& depth_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// Scope
// ---------------------------------------------------------------------------

auto Scope::declare(const std::string& name, Value value, bool is_const) -> bool {
    return bindings_.try_emplace(name, Binding{std::move(value), is_const}).second;
}

auto Scope::lookup(const std::string& name) -> Binding* {
    for (Scope* s = this; s != nullptr; s = s->parent_.get()) {
        auto it = s->bindings_.find(name);
        if (it != s->bindings_.end()) return &it->second;
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Interpreter: setup and entry points
// ---------------------------------------------------------------------------

Interpreter::Interpreter(Heap& heap, const CancellationToken& cancel, InterpreterOptions options)
    : heap_(heap)
    , cancel_(cancel)
    , options_(options)
    , globals_(std::make_shared<Scope>(nullptr)) {
    globals_->declare("undefined", Value{}, true);
    globals_->declare("NaN", std::nan(""), true);
    globals_->declare("Infinity", HUGE_VAL, true);
}

void Interpreter::define_global(const std::string& name, Value value) {
    if (!globals_->declare(name, value, true)) {
        globals_->lookup(name)->value = std::move(value);
    }
}

void Interpreter::define_method(Receiver receiver, const std::string& name, NativeFn fn) {
    methods_[static_cast<std::size_t>(receiver)][name] = heap_.make_native(name, std::move(fn));
}

auto Interpreter::lookup_method(Receiver receiver, const std::string& name) const -> Function* {
    const auto& table = methods_[static_cast<std::size_t>(receiver)];
    auto it = table.find(name);
    return it == table.end() ? nullptr : it->second;
}

auto Interpreter::run(const Program& program) -> Result<Value> {
    try {
        auto scope = std::make_shared<Scope>(globals_);
        for (const auto& name : program.var_names) {
            scope->declare(name, Value{}, false);
        }
        hoist_functions(program.body, scope);
        if (exec_list(program.body, scope) == Completion::Return) {
            return std::exchange(return_value_, Value{});
        }
        return Value{};
    } catch (const ScriptException& e) {
        return std::unexpected(make_error(error_code_of(e.value()), e.what()));
    } catch (const AbortError& e) {
        return std::unexpected(make_error(e.code(), e.what()));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error(ErrorCode::MemoryLimit, "Memory limit exceeded"));
    } catch (const std::length_error&) {
        return std::unexpected(make_error(ErrorCode::MemoryLimit, "Memory limit exceeded"));
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::RuntimeError, e.what()));
    }
}

auto Interpreter::make_string(std::string s) -> Value {
    heap_.charge(s.size());
    return Value(std::move(s));
}

void Interpreter::throw_error(std::string_view name, std::string message) {
    ::ctxopt::script::throw_error(heap_, name, std::move(message));
}

void Interpreter::check_cancelled() const {
    if (cancel_.is_cancelled()) {
        throw AbortError(ErrorCode::Timeout, "Execution timeout");
    }
}

auto Interpreter::call(const Value& callee, const Value& self, std::vector<Value> args) -> Value {
    if (!callee.is_function()) {
        throw_error("TypeError", to_display_string(callee) + " is not a function");
    }
    check_cancelled();
    if (depth_ >= options_.max_call_depth) {
        throw_error("RangeError", "Maximum call stack size exceeded");
    }
    CallDepthGuard guard(depth_);
    auto* fn = callee.as_function();
    if (fn->native) return fn->native(*this, self, args);
    return call_script(*fn, std::move(args));
}

auto Interpreter::call_script(const Function& fn, std::vector<Value> args) -> Value {
    const auto& node = *fn.node;
    auto scope = std::make_shared<Scope>(fn.closure);

    for (std::size_t i = 0; i < node.params.size(); ++i) {
        const auto& param = node.params[i];
        Value v;
        if (param.rest) {
            std::vector<Value> rest;
            if (i < args.size()) {
                rest.assign(std::make_move_iterator(args.begin() + static_cast<std::ptrdiff_t>(i)),
                            std::make_move_iterator(args.end()));
            }
            v = heap_.make_array(std::move(rest));
        } else {
            if (i < args.size()) v = std::move(args[i]);
            if (v.is_undefined() && param.default_value) v = eval(*param.default_value, scope);
        }
        bind_pattern(*param.target, std::move(v), scope, BindMode::Let);
    }

    if (node.expression_body) return eval(*node.expression_body, scope);

    for (const auto& name : node.var_names) {
        if (!scope->has_own(name)) scope->declare(name, Value{}, false);
    }
    hoist_functions(node.body->body, scope);
    if (exec_list(node.body->body, scope) == Completion::Return) {
        return std::exchange(return_value_, Value{});
    }
    return Value{};
}

auto Interpreter::make_function(const FunctionNode& node, const ScopePtr& scope) -> Value {
    if (node.is_arrow || node.name.empty()) {
        auto* fn = heap_.make_closure(node, scope);
        fn->name = node.name;
        return fn;
    }
    // A named function expression sees its own name.
    auto self_scope = std::make_shared<Scope>(scope);
    auto* fn = heap_.make_closure(node, self_scope);
    fn->name = node.name;
    self_scope->declare(node.name, fn, false);
    return fn;
}

void Interpreter::hoist_functions(const std::vector<StmtPtr>& body, const ScopePtr& scope) {
    for (const auto& stmt : body) {
        if (stmt->kind != StmtKind::FunctionDecl) continue;
        const auto& node = *static_cast<const FunctionDeclStmt&>(*stmt).function;
        auto* fn = heap_.make_closure(node, scope);
        fn->name = node.name;
        if (!scope->declare(node.name, fn, false)) {
            scope->lookup(node.name)->value = fn;
        }
    }
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

auto Interpreter::exec_list(const std::vector<StmtPtr>& body, const ScopePtr& scope) -> Completion {
    for (const auto& stmt : body) {
        auto c = exec(*stmt, scope);
        if (c != Completion::Normal) return c;
    }
    return Completion::Normal;
}

auto Interpreter::exec(const Stmt& stmt, const ScopePtr& scope) -> Completion {
    switch (stmt.kind) {
        case StmtKind::Expression:
            eval(*static_cast<const ExpressionStmt&>(stmt).expression, scope);
            return Completion::Normal;

        case StmtKind::VarDecl: {
            const auto& s = static_cast<const VarDeclStmt&>(stmt);
            auto mode = s.decl == DeclKind::Var   ? BindMode::Var
                        : s.decl == DeclKind::Let ? BindMode::Let
                                                  : BindMode::Const;
            for (const auto& d : s.declarations) {
                // `var x;` keeps whatever the hoisted binding holds.
                if (!d.init && s.decl == DeclKind::Var) continue;
                Value v = d.init ? eval(*d.init, scope) : Value{};
                if (d.target->kind == Pattern::Kind::Identifier) name_function(v, d.target->name);
                bind_pattern(*d.target, std::move(v), scope, mode);
            }
            return Completion::Normal;
        }

        case StmtKind::FunctionDecl:
        case StmtKind::Empty:
            return Completion::Normal;

        case StmtKind::Return: {
            const auto& s = static_cast<const ArgumentStmt&>(stmt);
            return_value_ = s.argument ? eval(*s.argument, scope) : Value{};
            return Completion::Return;
        }

        case StmtKind::Throw:
            throw ScriptException(eval(*static_cast<const ArgumentStmt&>(stmt).argument, scope));

        case StmtKind::If: {
            const auto& s = static_cast<const IfStmt&>(stmt);
            if (is_truthy(eval(*s.test, scope))) return exec(*s.consequent, scope);
            if (s.alternate) return exec(*s.alternate, scope);
            return Completion::Normal;
        }

        case StmtKind::Block: {
            const auto& b = static_cast<const BlockStmt&>(stmt);
            if (!b.needs_scope) return exec_list(b.body, scope);
            auto inner = std::make_shared<Scope>(scope);
            hoist_functions(b.body, inner);
            return exec_list(b.body, inner);
        }

        case StmtKind::While: {
            const auto& s = static_cast<const LoopStmt&>(stmt);
            while (true) {
                check_cancelled();
                if (!is_truthy(eval(*s.test, scope))) break;
                auto c = exec(*s.body, scope);
                if (c == Completion::Break) break;
                if (c == Completion::Return) return c;
            }
            return Completion::Normal;
        }

        case StmtKind::DoWhile: {
            const auto& s = static_cast<const LoopStmt&>(stmt);
            do {
                check_cancelled();
                auto c = exec(*s.body, scope);
                if (c == Completion::Break) break;
                if (c == Completion::Return) return c;
            } while (is_truthy(eval(*s.test, scope)));
            return Completion::Normal;
        }

        case StmtKind::For:
            return exec_for(static_cast<const ForStmt&>(stmt), scope);

        case StmtKind::ForEach:
            return exec_for_each(static_cast<const ForEachStmt&>(stmt), scope);

        case StmtKind::Break:
            return Completion::Break;

        case StmtKind::Continue:
            return Completion::Continue;

        case StmtKind::Try:
            return exec_try(static_cast<const TryStmt&>(stmt), scope);
    }
    return Completion::Normal;
}

auto Interpreter::exec_for(const ForStmt& s, const ScopePtr& scope) -> Completion {
    auto loop_scope = std::make_shared<Scope>(scope);
    if (s.init) exec(*s.init, loop_scope);

    while (true) {
        check_cancelled();
        if (s.test && !is_truthy(eval(*s.test, loop_scope))) break;
        auto c = exec(*s.body, loop_scope);
        if (c == Completion::Break) break;
        if (c == Completion::Return) return c;

        // Closures captured this iteration keep their own copy of the
        // loop variables.
        if (!s.per_iteration.empty()) {
            auto next = std::make_shared<Scope>(scope);
            for (const auto& name : s.per_iteration) {
                if (auto* b = loop_scope->lookup(name)) next->declare(name, b->value, b->is_const);
            }
            loop_scope = std::move(next);
        }
        if (s.update) eval(*s.update, loop_scope);
    }
    return Completion::Normal;
}

auto Interpreter::exec_for_each(const ForEachStmt& s, const ScopePtr& scope) -> Completion {
    auto iterable = eval(*s.iterable, scope);

    std::vector<Value> items;
    if (s.of) {
        items = iterate(iterable);
    } else if (!iterable.is_nullish()) {
        for (auto& key : own_keys(iterable)) items.emplace_back(std::move(key));
    }

    BindMode mode = BindMode::Assign;
    if (s.decl) {
        mode = *s.decl == DeclKind::Var   ? BindMode::Var
               : *s.decl == DeclKind::Let ? BindMode::Let
                                          : BindMode::Const;
    }
    bool fresh_scope = mode == BindMode::Let || mode == BindMode::Const;

    for (auto& item : items) {
        check_cancelled();
        auto iter_scope = fresh_scope ? std::make_shared<Scope>(scope) : scope;
        bind_pattern(*s.target, std::move(item), iter_scope, mode);
        auto c = exec(*s.body, iter_scope);
        if (c == Completion::Break) break;
        if (c == Completion::Return) return c;
    }
    return Completion::Normal;
}

auto Interpreter::exec_try(const TryStmt& s, const ScopePtr& scope) -> Completion {
    Completion result = Completion::Normal;
    std::exception_ptr pending;

    try {
        result = exec(*s.block, scope);
    } catch (const ScriptException& e) {
        if (s.handler) {
            try {
                auto catch_scope = std::make_shared<Scope>(scope);
                if (s.param) bind_pattern(*s.param, e.value(), catch_scope, BindMode::Let);
                result = exec(*s.handler, catch_scope);
            } catch (const ScriptException&) {
                if (!s.finalizer) throw;
                pending = std::current_exception();
            }
        } else {
            pending = std::current_exception();
        }
    }

    if (s.finalizer) {
        Value saved = return_value_;
        auto c = exec(*s.finalizer, scope);
        if (c != Completion::Normal) return c;
        return_value_ = std::move(saved);
    }
    if (pending) std::rethrow_exception(pending);
    return result;
}

// ---------------------------------------------------------------------------
// Bindings
// ---------------------------------------------------------------------------

void Interpreter::bind_name(const std::string& name, Value value, const ScopePtr& scope,
                            BindMode mode) {
    switch (mode) {
        case BindMode::Let:
        case BindMode::Const:
            if (!scope->declare(name, std::move(value), mode == BindMode::Const)) {
                throw_error("SyntaxError", std::format("Identifier '{}' has already been declared", name));
            }
            return;
        case BindMode::Var:
        case BindMode::Assign: {
            auto* binding = scope->lookup(name);
            if (binding == nullptr) {
                if (mode == BindMode::Var) {
                    scope->declare(name, std::move(value), false);
                    return;
                }
                throw_error("ReferenceError", name + " is not defined");
            }
            if (binding->is_const) throw_error("TypeError", "Assignment to constant variable.");
            binding->value = std::move(value);
            return;
        }
    }
}

void Interpreter::bind_pattern(const Pattern& pattern, Value value, const ScopePtr& scope,
                               BindMode mode) {
    switch (pattern.kind) {
        case Pattern::Kind::Identifier:
            bind_name(pattern.name, std::move(value), scope, mode);
            return;

        case Pattern::Kind::Object: {
            if (value.is_nullish()) {
                throw_error("TypeError", std::format("Cannot destructure '{}' as it is {}.",
                                                     to_display_string(value), to_display_string(value)));
            }
            std::vector<std::string> used;
            for (const auto& el : pattern.elements) {
                if (el.rest) {
                    auto* rest = heap_.make_object();
                    for (const auto& key : own_keys(value)) {
                        if (std::find(used.begin(), used.end(), key) != used.end()) continue;
                        heap_.charge(key.size() + sizeof(Value));
                        rest->properties.set(key, get_property(value, key));
                    }
                    bind_pattern(*el.target, rest, scope, mode);
                    continue;
                }
                used.push_back(el.key);
                Value v = get_property(value, el.key);
                if (v.is_undefined() && el.default_value) {
                    v = eval(*el.default_value, scope);
                    if (el.target->kind == Pattern::Kind::Identifier) name_function(v, el.target->name);
                }
                bind_pattern(*el.target, std::move(v), scope, mode);
            }
            return;
        }

        case Pattern::Kind::Array: {
            auto items = iterate(value);
            std::size_t index = 0;
            for (const auto& el : pattern.elements) {
                if (el.rest) {
                    std::vector<Value> rest;
                    if (index < items.size()) {
                        rest.assign(items.begin() + static_cast<std::ptrdiff_t>(index), items.end());
                    }
                    index = items.size();
                    bind_pattern(*el.target, heap_.make_array(std::move(rest)), scope, mode);
                    continue;
                }
                Value v = index < items.size() ? items[index] : Value{};
                ++index;
                if (!el.target) continue;
                if (v.is_undefined() && el.default_value) v = eval(*el.default_value, scope);
                bind_pattern(*el.target, std::move(v), scope, mode);
            }
            return;
        }
    }
}

void Interpreter::assign_to(const Expr& target, Value value, const ScopePtr& scope) {
    if (target.kind == ExprKind::Identifier) {
        bind_name(static_cast<const IdentifierExpr&>(target).name, std::move(value), scope,
                  BindMode::Assign);
        return;
    }
    const auto& m = static_cast<const MemberExpr&>(target);
    auto object = eval(*m.object, scope);
    auto key = member_key(m, scope);
    set_property(object, key, std::move(value));
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

auto Interpreter::eval(const Expr& expr, const ScopePtr& scope) -> Value {
    switch (expr.kind) {
        case ExprKind::Number:
            return static_cast<const NumberExpr&>(expr).value;
        case ExprKind::String:
            return static_cast<const StringExpr&>(expr).value;
        case ExprKind::Template:
            return eval_template(static_cast<const TemplateExpr&>(expr), scope);
        case ExprKind::Boolean:
            return static_cast<const BooleanExpr&>(expr).value;
        case ExprKind::Null:
            return Null{};
        case ExprKind::This:
            return Value{};
        case ExprKind::Identifier:
            return eval_identifier(static_cast<const IdentifierExpr&>(expr), scope);
        case ExprKind::Array:
            return eval_array(static_cast<const ArrayExpr&>(expr), scope);
        case ExprKind::Object:
            return eval_object(static_cast<const ObjectExpr&>(expr), scope);
        case ExprKind::Function:
            return make_function(*static_cast<const FunctionExpr&>(expr).function, scope);
        case ExprKind::Unary:
            return eval_unary(static_cast<const UnaryExpr&>(expr), scope);
        case ExprKind::Update:
            return eval_update(static_cast<const UpdateExpr&>(expr), scope);

        case ExprKind::Binary: {
            const auto& e = static_cast<const BinaryExpr&>(expr);
            auto left = eval(*e.left, scope);
            auto right = eval(*e.right, scope);
            return binary_op(e.op, left, right);
        }

        case ExprKind::Logical: {
            const auto& e = static_cast<const BinaryExpr&>(expr);
            auto left = eval(*e.left, scope);
            if (short_circuits(e.op, left)) return left;
            return eval(*e.right, scope);
        }

        case ExprKind::Conditional: {
            const auto& e = static_cast<const ConditionalExpr&>(expr);
            return is_truthy(eval(*e.test, scope)) ? eval(*e.consequent, scope)
                                                   : eval(*e.alternate, scope);
        }

        case ExprKind::Assign:
            return eval_assign(static_cast<const AssignExpr&>(expr), scope);

        case ExprKind::Member: {
            const auto& e = static_cast<const MemberExpr&>(expr);
            auto object = eval(*e.object, scope);
            if (e.optional && object.is_nullish()) throw ChainShortCircuit{};
            return get_property(object, member_key(e, scope));
        }

        case ExprKind::Call:
            return eval_call(static_cast<const CallExpr&>(expr), scope);

        case ExprKind::OptionalChain:
            try {
                return eval(*static_cast<const OptionalChainExpr&>(expr).expression, scope);
            } catch (const ChainShortCircuit&) {
                return Value{};
            }

        case ExprKind::Spread:
            throw_error("SyntaxError", "Unexpected spread element");

        case ExprKind::Await:
            return eval(*static_cast<const WrapperExpr&>(expr).operand, scope);

        case ExprKind::Sequence: {
            Value last;
            for (const auto& e : static_cast<const SequenceExpr&>(expr).expressions) {
                last = eval(*e, scope);
            }
            return last;
        }
    }
    return Value{};
}

auto Interpreter::eval_identifier(const IdentifierExpr& e, const ScopePtr& scope) -> Value {
    if (auto* binding = scope->lookup(e.name)) return binding->value;
    throw_error("ReferenceError", e.name + " is not defined");
}

auto Interpreter::eval_template(const TemplateExpr& e, const ScopePtr& scope) -> Value {
    std::string out = e.quasis.empty() ? std::string() : e.quasis.front();
    for (std::size_t i = 0; i < e.expressions.size(); ++i) {
        out += to_display_string(eval(*e.expressions[i], scope));
        if (i + 1 < e.quasis.size()) out += e.quasis[i + 1];
    }
    return make_string(std::move(out));
}

auto Interpreter::eval_array(const ArrayExpr& e, const ScopePtr& scope) -> Value {
    std::vector<Value> items;
    items.reserve(e.elements.size());
    for (const auto& el : e.elements) {
        if (!el) {
            items.emplace_back();
        } else if (el->kind == ExprKind::Spread) {
            auto spread = iterate(eval(*static_cast<const WrapperExpr&>(*el).operand, scope));
            items.insert(items.end(), std::make_move_iterator(spread.begin()),
                         std::make_move_iterator(spread.end()));
        } else {
            items.push_back(eval(*el, scope));
        }
    }
    return heap_.make_array(std::move(items));
}

auto Interpreter::eval_object(const ObjectExpr& e, const ScopePtr& scope) -> Value {
    auto* object = heap_.make_object();
    for (const auto& p : e.properties) {
        if (p.spread) {
            auto source = eval(*p.value, scope);
            if (source.is_nullish()) continue;
            for (const auto& key : own_keys(source)) {
                heap_.charge(key.size() + sizeof(Value));
                object->properties.set(key, get_property(source, key));
            }
            continue;
        }
        std::string key = p.computed_key ? to_property_key(eval(*p.computed_key, scope)) : p.key;
        Value v = eval(*p.value, scope);
        name_function(v, key);
        heap_.charge(key.size() + sizeof(Value));
        object->properties.set(key, std::move(v));
    }
    return object;
}

auto Interpreter::eval_unary(const UnaryExpr& e, const ScopePtr& scope) -> Value {
    if (e.op == Op::TypeOf) {
        if (e.operand->kind == ExprKind::Identifier) {
            const auto* binding = scope->lookup(static_cast<const IdentifierExpr&>(*e.operand).name);
            if (binding == nullptr) return "undefined";
            return type_of(binding->value);
        }
        return type_of(eval(*e.operand, scope));
    }
    if (e.op == Op::Delete) {
        if (e.operand->kind == ExprKind::Member) {
            const auto& m = static_cast<const MemberExpr&>(*e.operand);
            auto object = eval(*m.object, scope);
            return delete_property(object, member_key(m, scope));
        }
        eval(*e.operand, scope);
        return true;
    }

    auto v = eval(*e.operand, scope);
    switch (e.op) {
        case Op::Not: return !is_truthy(v);
        case Op::Neg: return -to_number(v);
        case Op::Plus: return to_number(v);
        case Op::BitNot: return ~to_int32(to_number(v));
        case Op::Void: return Value{};
        default: break;
    }
    return Value{};
}

auto Interpreter::eval_update(const UpdateExpr& e, const ScopePtr& scope) -> Value {
    double delta = e.increment ? 1.0 : -1.0;

    if (e.target->kind == ExprKind::Identifier) {
        const auto& name = static_cast<const IdentifierExpr&>(*e.target).name;
        auto* binding = scope->lookup(name);
        if (binding == nullptr) throw_error("ReferenceError", name + " is not defined");
        if (binding->is_const) throw_error("TypeError", "Assignment to constant variable.");
        double old = to_number(binding->value);
        binding->value = old + delta;
        return e.prefix ? old + delta : old;
    }

    const auto& m = static_cast<const MemberExpr&>(*e.target);
    auto object = eval(*m.object, scope);
    auto key = member_key(m, scope);
    double old = to_number(get_property(object, key));
    set_property(object, key, old + delta);
    return e.prefix ? old + delta : old;
}

auto Interpreter::eval_assign(const AssignExpr& e, const ScopePtr& scope) -> Value {
    if (e.pattern) {
        auto v = eval(*e.value, scope);
        bind_pattern(*e.pattern, v, scope, BindMode::Assign);
        return v;
    }

    if (e.op == Op::Assign) {
        if (e.target->kind == ExprKind::Identifier) {
            auto v = eval(*e.value, scope);
            name_function(v, static_cast<const IdentifierExpr&>(*e.target).name);
            assign_to(*e.target, v, scope);
            return v;
        }
        const auto& m = static_cast<const MemberExpr&>(*e.target);
        auto object = eval(*m.object, scope);
        auto key = member_key(m, scope);
        auto v = eval(*e.value, scope);
        set_property(object, key, v);
        return v;
    }

    // Compound and logical assignment read the current value first.
    if (e.target->kind == ExprKind::Identifier) {
        const auto& name = static_cast<const IdentifierExpr&>(*e.target).name;
        auto* binding = scope->lookup(name);
        if (binding == nullptr) throw_error("ReferenceError", name + " is not defined");
        Value current = binding->value;
        if (is_logical(e.op) && short_circuits(e.op, current)) return current;
        Value result = is_logical(e.op) ? eval(*e.value, scope)
                                        : binary_op(e.op, current, eval(*e.value, scope));
        bind_name(name, result, scope, BindMode::Assign);
        return result;
    }

    const auto& m = static_cast<const MemberExpr&>(*e.target);
    auto object = eval(*m.object, scope);
    auto key = member_key(m, scope);
    Value current = get_property(object, key);
    if (is_logical(e.op) && short_circuits(e.op, current)) return current;
    Value result = is_logical(e.op) ? eval(*e.value, scope)
                                    : binary_op(e.op, current, eval(*e.value, scope));
    set_property(object, key, result);
    return result;
}

auto Interpreter::eval_call(const CallExpr& e, const ScopePtr& scope) -> Value {
    Value self;
    Value callee;
    if (e.callee->kind == ExprKind::Member) {
        const auto& m = static_cast<const MemberExpr&>(*e.callee);
        self = eval(*m.object, scope);
        if (m.optional && self.is_nullish()) throw ChainShortCircuit{};
        callee = get_property(self, member_key(m, scope));
    } else {
        callee = eval(*e.callee, scope);
    }
    if (e.optional && callee.is_nullish()) throw ChainShortCircuit{};
    if (!callee.is_function()) {
        throw_error("TypeError", describe(*e.callee) + " is not a function");
    }
    auto args = eval_arguments(e.arguments, scope);
    return call(callee, self, std::move(args));
}

auto Interpreter::eval_arguments(const std::vector<ExprPtr>& args, const ScopePtr& scope)
    -> std::vector<Value> {
    std::vector<Value> out;
    out.reserve(args.size());
    for (const auto& arg : args) {
        if (arg->kind == ExprKind::Spread) {
            auto spread = iterate(eval(*static_cast<const WrapperExpr&>(*arg).operand, scope));
            out.insert(out.end(), std::make_move_iterator(spread.begin()),
                       std::make_move_iterator(spread.end()));
        } else {
            out.push_back(eval(*arg, scope));
        }
    }
    return out;
}

auto Interpreter::member_key(const MemberExpr& e, const ScopePtr& scope) -> std::string {
    if (e.computed) return to_property_key(eval(*e.computed, scope));
    return e.property;
}

auto Interpreter::describe(const Expr& expr) const -> std::string {
    switch (expr.kind) {
        case ExprKind::Identifier:
            return static_cast<const IdentifierExpr&>(expr).name;
        case ExprKind::Member: {
            const auto& m = static_cast<const MemberExpr&>(expr);
            if (m.computed) return describe(*m.object) + "[...]";
            return describe(*m.object) + "." + m.property;
        }
        case ExprKind::Call:
            return describe(*static_cast<const CallExpr&>(expr).callee) + "(...)";
        case ExprKind::OptionalChain:
            return describe(*static_cast<const OptionalChainExpr&>(expr).expression);
        default:
            return "expression";
    }
}

// ---------------------------------------------------------------------------
// Operators
// ---------------------------------------------------------------------------

auto Interpreter::binary_op(Op op, const Value& left, const Value& right) -> Value {
    switch (op) {
        case Op::Add: {
            if (left.is_number() && right.is_number()) return left.as_number() + right.as_number();
            if (left.is_string() || right.is_string() || is_reference(left) || is_reference(right)) {
                auto l = to_display_string(left);
                auto r = to_display_string(right);
                heap_.charge(r.size());
                l += r;
                return l;
            }
            return to_number(left) + to_number(right);
        }
        case Op::Sub: return to_number(left) - to_number(right);
        case Op::Mul: return to_number(left) * to_number(right);
        case Op::Div: return to_number(left) / to_number(right);
        case Op::Mod: return std::fmod(to_number(left), to_number(right));
        case Op::Pow: {
            double exponent = to_number(right);
            if (std::isnan(exponent)) return std::nan("");
            return std::pow(to_number(left), exponent);
        }

        case Op::Eq: return loose_equals(left, right);
        case Op::NotEq: return !loose_equals(left, right);
        case Op::StrictEq: return strict_equals(left, right);
        case Op::StrictNotEq: return !strict_equals(left, right);

        case Op::Lt:
        case Op::Gt:
        case Op::LtE:
        case Op::GtE: {
            if (left.is_string() && right.is_string()) {
                int c = left.as_string().compare(right.as_string());
                if (op == Op::Lt) return c < 0;
                if (op == Op::Gt) return c > 0;
                if (op == Op::LtE) return c <= 0;
                return c >= 0;
            }
            double a = to_number(left);
            double b = to_number(right);
            if (std::isnan(a) || std::isnan(b)) return false;
            if (op == Op::Lt) return a < b;
            if (op == Op::Gt) return a > b;
            if (op == Op::LtE) return a <= b;
            return a >= b;
        }

        case Op::BitAnd: return to_int32(to_number(left)) & to_int32(to_number(right));
        case Op::BitOr: return to_int32(to_number(left)) | to_int32(to_number(right));
        case Op::BitXor: return to_int32(to_number(left)) ^ to_int32(to_number(right));
        case Op::Shl: {
            auto shift = to_uint32(to_number(right)) & 31U;
            return static_cast<std::int32_t>(to_uint32(to_number(left)) << shift);
        }
        case Op::Shr: return to_int32(to_number(left)) >> (to_uint32(to_number(right)) & 31U);
        case Op::UShr: return to_uint32(to_number(left)) >> (to_uint32(to_number(right)) & 31U);

        case Op::In: {
            if (!is_reference(right)) {
                throw_error("TypeError", std::format("Cannot use 'in' operator to search for '{}' in {}",
                                                     to_property_key(left), to_display_string(right)));
            }
            return has_property(right, to_property_key(left));
        }
        case Op::InstanceOf:
            return instance_of(left, right);

        default:
            break;
    }
    return Value{};
}

auto Interpreter::instance_of(const Value& left, const Value& right) -> bool {
    if (!right.is_function()) {
        throw_error("TypeError", "Right-hand side of 'instanceof' is not callable");
    }
    const auto* ctor = right.as_function();
    if (!ctor->native) return false;
    const auto& name = ctor->name;
    if (name == "Array") return left.is_array();
    if (name == "Object") return is_reference(left);
    if (name == "Function") return left.is_function();
    if (!left.is_object() || !left.as_object()->is_error) return false;
    if (name == "Error") return true;
    const auto* error_name = left.as_object()->properties.find("name");
    return error_name && error_name->is_string() && error_name->as_string() == name;
}

// ---------------------------------------------------------------------------
// Property access
// ---------------------------------------------------------------------------

auto Interpreter::get_property(const Value& target, const std::string& key) -> Value {
    if (target.is_nullish()) {
        throw_error("TypeError", std::format("Cannot read properties of {} (reading '{}')",
                                             to_display_string(target), key));
    }

    if (target.is_object()) {
        if (const auto* v = target.as_object()->properties.find(key)) return *v;
        if (auto* method = lookup_method(Receiver::Object, key)) return method;
        return Value{};
    }

    if (target.is_array()) {
        const auto& items = target.as_array()->items;
        if (key == "length") return items.size();
        if (auto index = parse_array_index(key)) {
            return *index < items.size() ? items[*index] : Value{};
        }
        if (auto* method = lookup_method(Receiver::Array, key)) return method;
        return Value{};
    }

    if (target.is_string()) {
        const auto& s = target.as_string();
        if (key == "length") return s.size();
        if (auto index = parse_array_index(key)) {
            return *index < s.size() ? Value(std::string(1, s[*index])) : Value{};
        }
        if (auto* method = lookup_method(Receiver::String, key)) return method;
        return Value{};
    }

    if (target.is_function()) {
        const auto* fn = target.as_function();
        if (const auto* v = fn->members.find(key)) return *v;
        if (key == "name") return fn->name;
        if (key == "length") return fn->node ? fn->node->params.size() : std::size_t{0};
        return Value{};
    }

    if (target.is_number()) {
        if (auto* method = lookup_method(Receiver::Number, key)) return method;
    }
    return Value{};
}

void Interpreter::set_property(const Value& target, const std::string& key, Value value) {
    if (target.is_nullish()) {
        throw_error("TypeError", std::format("Cannot set properties of {} (setting '{}')",
                                             to_display_string(target), key));
    }

    if (target.is_object() || target.is_function()) {
        bool frozen = target.is_object() ? target.as_object()->frozen : target.as_function()->frozen;
        auto& props = target.is_object() ? target.as_object()->properties
                                         : target.as_function()->members;
        bool exists = props.find(key) != nullptr;
        if (frozen) {
            if (exists) {
                throw_error("TypeError", std::format("Cannot assign to read only property '{}' of object", key));
            }
            throw_error("TypeError", std::format("Cannot add property {}, object is not extensible", key));
        }
        if (!exists) heap_.charge(key.size() + sizeof(Value));
        props.set(key, std::move(value));
        return;
    }

    if (target.is_array()) {
        auto* array = target.as_array();
        if (array->frozen) {
            throw_error("TypeError", std::format("Cannot assign to read only property '{}' of object", key));
        }
        if (key == "length") {
            double n = to_number(value);
            if (!(n >= 0) || n != std::trunc(n) || n > 4294967295.0) {
                throw_error("RangeError", "Invalid array length");
            }
            auto size = static_cast<std::size_t>(n);
            if (size > array->items.size()) heap_.charge((size - array->items.size()) * sizeof(Value));
            array->items.resize(size);
            return;
        }
        if (auto index = parse_array_index(key)) {
            if (*index >= array->items.size()) {
                heap_.charge((*index + 1 - array->items.size()) * sizeof(Value));
                array->items.resize(*index + 1);
            }
            array->items[*index] = std::move(value);
            return;
        }
        throw_error("TypeError", std::format("Cannot create property '{}' on array", key));
    }

    throw_error("TypeError", std::format("Cannot create property '{}' on {} '{}'", key,
                                         type_of(target), to_display_string(target)));
}

auto Interpreter::has_property(const Value& target, const std::string& key) -> bool {
    if (target.is_object()) return target.as_object()->properties.find(key) != nullptr;
    if (target.is_function()) return target.as_function()->members.find(key) != nullptr;
    if (target.is_array()) {
        if (key == "length") return true;
        auto index = parse_array_index(key);
        return index && *index < target.as_array()->items.size();
    }
    return false;
}

auto Interpreter::delete_property(const Value& target, const std::string& key) -> bool {
    if (target.is_nullish()) {
        throw_error("TypeError", std::format("Cannot convert undefined or null to object"));
    }
    if (target.is_object() || target.is_function()) {
        bool frozen = target.is_object() ? target.as_object()->frozen : target.as_function()->frozen;
        auto& props = target.is_object() ? target.as_object()->properties
                                         : target.as_function()->members;
        if (frozen && props.find(key) != nullptr) {
            throw_error("TypeError", std::format("Cannot delete property '{}' of #<Object>", key));
        }
        props.erase(key);
        return true;
    }
    if (target.is_array()) {
        auto* array = target.as_array();
        auto index = parse_array_index(key);
        if (!index || *index >= array->items.size()) return true;
        if (array->frozen) {
            throw_error("TypeError", std::format("Cannot delete property '{}' of [object Array]", key));
        }
        array->items[*index] = Value{};
    }
    return true;
}

auto Interpreter::iterate(const Value& v) -> std::vector<Value> {
    if (v.is_array()) return v.as_array()->items;
    if (v.is_string()) {
        std::vector<Value> out;
        for (auto& ch : split_code_points(v.as_string())) out.emplace_back(std::move(ch));
        return out;
    }
    throw_error("TypeError", std::format("{} is not iterable",
                                         v.is_nullish() ? to_display_string(v) : std::string(type_of(v))));
}

auto Interpreter::own_keys(const Value& v) -> std::vector<std::string> {
    if (v.is_object()) return v.as_object()->properties.keys();
    if (v.is_function()) return v.as_function()->members.keys();

    std::size_t count = 0;
    if (v.is_array()) count = v.as_array()->items.size();
    else if (v.is_string()) count = v.as_string().size();

    std::vector<std::string> keys;
    keys.reserve(count);
    for (std::size_t i = 0; i < count; ++i) keys.push_back(std::to_string(i));
    return keys;
}

} // namespace ctxopt::script
