#pragma once

#include "diagnostics.hpp"

namespace han {

// Forwards pipeline diagnostics to common::Logger.
class LoggerSink : public DiagnosticSink {
public:
    void onDiagnostic(const Diagnostic &diagnostic) override;

    std::size_t accepted() const;
    std::size_t rejected() const;

private:
    std::size_t accepted_ = 0;
    std::size_t rejected_ = 0;
};

}  // namespace han
