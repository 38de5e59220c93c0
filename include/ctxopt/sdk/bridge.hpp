#pragma once

#include <filesystem>

#include "ctxopt/core/cancellation.hpp"
#include "ctxopt/script/interpreter.hpp"
#include "ctxopt/sdk/host.hpp"
#include "ctxopt/sdk/pipeline.hpp"

namespace ctxopt::sdk {

/// Binds the capability SDK into a script interpreter as the frozen global
/// `ctx`, with the namespaces compress, code, files, git, search, analyze,
/// pipeline and utils.
///
/// SDK failures surface in script code as thrown Error objects whose `code`
/// property carries the upper-case error code name; a cancelled execution
/// aborts the run instead, so scripts cannot catch their own timeout.
///
/// One bridge serves one execution and must outlive the interpreter run it
/// was installed into.
class Bridge {
public:
    Bridge(std::filesystem::path working_dir, const CancellationToken& cancel);

    Bridge(const Bridge&) = delete;
    auto operator=(const Bridge&) -> Bridge& = delete;

    void install(script::Interpreter& interp);

    [[nodiscard]] auto host() const -> const Host& { return host_; }
    [[nodiscard]] auto template_cache() -> TemplateCache& { return cache_; }

private:
    Host host_;
    TemplateCache cache_;
};

} // namespace ctxopt::sdk
