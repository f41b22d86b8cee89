#include "core/Severity.hpp"
#include "utils/StringUtils.hpp"

namespace LogSeg
{
namespace core
{
    std::optional<SeverityClass> classifySeverity(std::string_view token)
    {
        using Utils::iequals;

        if (iequals(token, "ERROR") || iequals(token, "FATAL"))
            return SeverityClass::ERROR;
        if (iequals(token, "WARN") || iequals(token, "WARNING"))
            return SeverityClass::WARN;
        if (iequals(token, "INFO"))
            return SeverityClass::INFO;
        if (iequals(token, "DEBUG"))
            return SeverityClass::DEBUG;
        if (iequals(token, "TRACE"))
            return SeverityClass::TRACE;
        return std::nullopt;
    }
} // namespace core
} // namespace LogSeg
