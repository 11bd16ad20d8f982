#pragma once
#ifndef O2_OPTION_H
#define O2_OPTION_H

/* System */
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace o2 {

// One command line option, e.g. --frequency=10 or --modes=blue,green
class Option
{
public:
    using Handler = std::function<bool(const std::string& value)>;

    enum class ValueType
    {
        // Option without value, e.g. --help
        None,
        // Option requires ArgValueSeparator and a value
        Custom,
        // Value is optional, the option alone means true
        Boolean,
    };

    static const char ArgValueSeparator;
    // Separates parts of one value, e.g. mode and exposure
    static const char ValuesSeparator;

public:
    /* Empty argsDescs makes the option value-less, one empty description
       makes it boolean. Sizes of argsDescs and defVals have to match, the id
       has to be unique and non-zero. */
    Option(const std::vector<std::string>& names,
            const std::vector<std::string>& argsDescs,
            const std::vector<std::string>& defVals,
            const std::string& desc, uint32_t id, const Handler& handler);

    Option() = delete;

public:
    const std::vector<std::string>& GetNames() const
    { return m_names; }
    const std::vector<std::string>& GetArgsDescriptions() const
    { return m_argsDescs; }
    const std::vector<std::string>& GetDefaultValues() const
    { return m_defVals; }
    const std::string& GetDescription() const
    { return m_desc; }
    uint32_t GetId() const
    { return m_id; }
    ValueType GetValueType() const
    { return m_valueType; }

    bool HasName(const std::string& name) const;

    // Splits "--name=value", hasValue tells whether the separator was there
    static void SplitArg(const std::string& arg, std::string& name,
            std::string& value, bool& hasValue);

    // Checks value presence against value type and calls the handler
    bool Apply(const std::string& name, const std::string& value,
            bool hasValue) const;

    // Usage lines for this option
    std::string GetUsage() const;

private:
    std::vector<std::string> m_names;
    std::vector<std::string> m_argsDescs;
    std::vector<std::string> m_defVals;
    std::string m_desc;
    uint32_t m_id;
    ValueType m_valueType;
    Handler m_handler;
};

} // namespace o2

#endif /* O2_OPTION_H */
