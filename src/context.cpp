#include "specmark/context.hpp"
#include <iostream>

namespace specmark {

CompileContext::CompileContext(CompileOptions opts)
    : options(std::move(opts)), biblio(options.root_namespace) {
    sink.out = &diagnostics;
    if(options.trace){
        sink.forward = [](const Diagnostic& d){
            std::cerr << "[specmark] " << d.rule_id << " at " << d.line << ":" << d.col << ": " << d.message << "\n";
        };
    }
}

} // namespace specmark
