#include <scene_model/errors.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace scene_model {

ErrorCategory category_of(ErrorCode code) {
    switch (code_value(code) / 1000) {
    case 1: return ErrorCategory::Lexer;
    case 2: return ErrorCategory::Parser;
    case 3: return ErrorCategory::Runtime;
    case 4: return ErrorCategory::Transport;
    default: return ErrorCategory::Render;
    }
}

int code_value(ErrorCode code) {
    return static_cast<int>(code);
}

ErrorCategory ErrorInfo::category() const {
    return category_of(code);
}

const char* category_name(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::Lexer: return "lexer";
    case ErrorCategory::Parser: return "parser";
    case ErrorCategory::Runtime: return "runtime";
    case ErrorCategory::Transport: return "transport";
    case ErrorCategory::Render: return "render";
    }
    return "render";
}

const char* severity_name(Severity severity) {
    switch (severity) {
    case Severity::Info: return "info";
    case Severity::Warning: return "warning";
    case Severity::Error: return "error";
    case Severity::Fatal: return "fatal";
    }
    return "error";
}

const char* recovery_name(RecoveryAction action) {
    switch (action) {
    case RecoveryAction::None: return "none";
    case RecoveryAction::Skip: return "skip";
    case RecoveryAction::PassThroughLiteral: return "pass_through_literal";
    case RecoveryAction::ResumeAtNextToken: return "resume_at_next_token";
    case RecoveryAction::ResumeAtLineEnd: return "resume_at_line_end";
    case RecoveryAction::UseDefault: return "use_default";
    case RecoveryAction::ReturnPartial: return "return_partial";
    case RecoveryAction::FallbackDocument: return "fallback_document";
    }
    return "none";
}

bool has_fatal(const std::vector<ErrorInfo>& errors) {
    return std::any_of(errors.begin(), errors.end(),
        [](const ErrorInfo& e) { return e.severity == Severity::Fatal; });
}

bool has_errors(const std::vector<ErrorInfo>& errors) {
    return std::any_of(errors.begin(), errors.end(), [](const ErrorInfo& e) {
        return e.severity == Severity::Error || e.severity == Severity::Fatal;
    });
}

std::string format_error(const ErrorInfo& error) {
    return fmt::format("[E{}] {} at {}:{}", code_value(error.code), error.message, error.line, error.column);
}

std::string error_summary(const std::vector<ErrorInfo>& errors) {
    if (errors.empty()) return "No errors";

    std::size_t error_count = 0;
    std::size_t warning_count = 0;
    for (const auto& e : errors) {
        if (e.severity == Severity::Error || e.severity == Severity::Fatal) ++error_count;
        else if (e.severity == Severity::Warning) ++warning_count;
    }

    std::string out;
    if (error_count > 0) out += fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    if (warning_count > 0) {
        if (!out.empty()) out += ", ";
        out += fmt::format("{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (out.empty()) out = fmt::format("{} info", errors.size());
    return out;
}

} // namespace scene_model
