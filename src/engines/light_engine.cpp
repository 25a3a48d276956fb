/**
 * @file light_engine.cpp
 * @brief Shared plumbing for light engines
 */

#include "light_engine.hpp"
#include <chrono>

namespace liverun {

EngineOutput LightEngine::execute(const std::string& code, const ExecutionOptions& options) {
    if (!initialized_) {
        throw ExecutionError(get_info().language + " engine not initialized");
    }

    auto start = std::chrono::steady_clock::now();
    EngineOutput output = render(code, options);
    output.duration_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start
    ).count();
    return output;
}

std::string LightEngine::escape_html(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

std::string LightEngine::trim(const std::string& text) {
    const char* whitespace = " \t\r\n\f\v";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

} // namespace liverun
