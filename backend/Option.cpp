#include "Option.h"

/* System */
#include <algorithm>

/* Local */
#include "Log.h"
#include "Utils.h"

const char o2::Option::ArgValueSeparator = '=';
const char o2::Option::ValuesSeparator = ',';

o2::Option::Option(const std::vector<std::string>& names,
            const std::vector<std::string>& argsDescs,
            const std::vector<std::string>& defVals,
            const std::string& desc, uint32_t id, const Handler& handler)
    : m_names(names),
    m_argsDescs(argsDescs),
    m_defVals(defVals),
    m_desc(desc),
    m_id(id),
    m_valueType(ValueType::Custom),
    m_handler(handler)
{
    if (m_argsDescs.empty())
        m_valueType = ValueType::None;
    else if (m_argsDescs.size() == 1 && m_argsDescs[0].empty())
        m_valueType = ValueType::Boolean;
}

bool o2::Option::HasName(const std::string& name) const
{
    return std::find(m_names.cbegin(), m_names.cend(), name) != m_names.cend();
}

void o2::Option::SplitArg(const std::string& arg, std::string& name,
        std::string& value, bool& hasValue)
{
    const std::string::size_type sepPos = arg.find(ArgValueSeparator);
    hasValue = (sepPos != std::string::npos);
    name = arg.substr(0, sepPos);
    value = (hasValue) ? arg.substr(sepPos + 1) : "";
}

bool o2::Option::Apply(const std::string& name, const std::string& value,
        bool hasValue) const
{
    if (!m_handler)
    {
        Log::LogE("Option %s has no handler", name.c_str());
        return false;
    }

    std::string handlerValue = value;
    switch (m_valueType)
    {
    case ValueType::None:
        if (hasValue)
        {
            Log::LogE("Option %s does not take any value", name.c_str());
            return false;
        }
        break;
    case ValueType::Custom:
        if (!hasValue || value.empty())
        {
            Log::LogE("Option %s requires a value", name.c_str());
            return false;
        }
        break;
    case ValueType::Boolean:
        if (!hasValue)
        {
            handlerValue = "true";
        }
        else
        {
            bool unused;
            if (!StrToBool(value, unused))
            {
                Log::LogE("Option %s takes a boolean value or none", name.c_str());
                return false;
            }
        }
        break;
    }

    if (!m_handler(handlerValue))
    {
        Log::LogE("Invalid value '%s' for option %s", handlerValue.c_str(),
                name.c_str());
        return false;
    }

    Log::LogD("Option %s set to '%s'", name.c_str(), handlerValue.c_str());
    return true;
}

std::string o2::Option::GetUsage() const
{
    std::string args;
    if (m_valueType == ValueType::Custom)
    {
        args = ArgValueSeparator + JoinStrings(m_argsDescs, ValuesSeparator, "<", ">");
    }
    else if (m_valueType == ValueType::Boolean)
    {
        args = std::string("[") + ArgValueSeparator + "<boolean>]";
    }

    std::string usage;
    for (const std::string& name : m_names)
        usage += "  " + name + args + "\n";

    // Continuation lines of multi-line description are indented too
    usage += "    ";
    for (char c : m_desc)
    {
        usage += c;
        if (c == '\n')
            usage += "    ";
    }

    const bool hasDefault = !m_defVals.empty()
        && !(m_defVals.size() == 1 && m_defVals[0].empty());
    if (hasDefault)
        usage += "\n    Default value is '" + JoinStrings(m_defVals, ValuesSeparator) + "'.";

    return usage + "\n";
}
