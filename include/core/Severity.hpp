#ifndef LOGSEG_CORE_SEVERITY_HPP
#define LOGSEG_CORE_SEVERITY_HPP

#include <string_view>
#include <optional>

namespace LogSeg
{
namespace core
{
    // Presentation-layer view of the severity tokens recorded by the engine.
    // The engine stores FATAL and WARNING verbatim; consumers fold them here.
    enum class SeverityClass
    {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // FATAL -> ERROR, WARNING -> WARN, case-insensitive. Unknown tokens yield nullopt.
    std::optional<SeverityClass> classifySeverity(std::string_view token);
} // namespace core
} // namespace LogSeg

#endif // LOGSEG_CORE_SEVERITY_HPP
