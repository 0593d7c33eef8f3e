/**
 * @file types.cpp
 * @brief 공통 타입 문자열 변환
 */

#include "types.h"

namespace llmshield::core {

std::string ScanResult::severityString() const {
    return severityToString(severity);
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::None:     return "none";
        case Severity::Low:      return "low";
        case Severity::Medium:   return "medium";
        case Severity::High:     return "high";
        case Severity::Critical: return "critical";
    }
    return "none";
}

std::string categoryToString(Category category) {
    switch (category) {
        case Category::PromptInjection: return "prompt-injection";
        case Category::Secret:          return "secret";
        case Category::Pii:             return "pii";
        case Category::Toxicity:        return "toxicity";
    }
    return "unknown";
}

} // namespace llmshield::core
