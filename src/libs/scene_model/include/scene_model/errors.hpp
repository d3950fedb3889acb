#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scene_model {

// Codes keep a stable numbering; the thousands digit is the category.
enum class ErrorCode {
    LexInvalidChar = 1001,
    LexUnterminatedString = 1002,
    LexInvalidNumber = 1003,
    LexInvalidColor = 1004,
    LexIndentError = 1005,

    ParseUnexpectedToken = 2001,
    ParseExpectedValue = 2002,
    ParseUndefinedVar = 2003,
    ParseUnknownCommand = 2004,
    ParseMissingBracket = 2005,
    ParseInvalidProperty = 2006,
    ParseExpectedColor = 2007,
    ParseExpectedNumber = 2008,
    ParseExpectedPair = 2009,
    ParseExpectedString = 2010,
    ParseMissingEquals = 2011,
    ParseEmptyValue = 2012,
    ParseRecovery = 2013,

    EvalInvalidShape = 3001,
    EvalMissingProperty = 3002,
    EvalTypeMismatch = 3003,
    EvalCircularRef = 3004,
    EvalOverflow = 3005,

    TransportInvalidMessage = 4001,
    TransportInvalidPayload = 4002,
    TransportConnectionError = 4003,
    TransportTimeout = 4004,

    RenderInvalidShape = 5001,
    RenderFailed = 5002,
    RenderSvgError = 5003
};

enum class ErrorCategory { Lexer, Parser, Runtime, Transport, Render };

enum class Severity { Info, Warning, Error, Fatal };

// How processing continued after the error was recorded.
enum class RecoveryAction {
    None,
    Skip,
    PassThroughLiteral,
    ResumeAtNextToken,
    ResumeAtLineEnd,
    UseDefault,
    ReturnPartial,
    FallbackDocument
};

struct ErrorInfo {
    ErrorCode code = ErrorCode::ParseUnexpectedToken;
    std::string message;
    int line = 0;
    int column = 0;
    Severity severity = Severity::Error;
    RecoveryAction recovery = RecoveryAction::None;
    std::optional<std::string> context;

    ErrorCategory category() const;
};

ErrorCategory category_of(ErrorCode code);
int code_value(ErrorCode code);

const char* category_name(ErrorCategory category);
const char* severity_name(Severity severity);
const char* recovery_name(RecoveryAction action);

bool has_fatal(const std::vector<ErrorInfo>& errors);
bool has_errors(const std::vector<ErrorInfo>& errors);

// "[E2004] Unknown command 'foo' at 3:1"
std::string format_error(const ErrorInfo& error);

// "2 errors, 1 warning" / "No errors"
std::string error_summary(const std::vector<ErrorInfo>& errors);

} // namespace scene_model
