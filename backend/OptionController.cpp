#include "OptionController.h"

/* System */
#include <fstream>

/* Local */
#include "Log.h"
#include "Utils.h"

const char o2::OptionController::OptionsFilePrefix = '@';

o2::OptionController::OptionController()
    : m_options(),
    m_optionsPassed(),
    m_optionsPassedFailed()
{
}

bool o2::OptionController::AddOption(const Option& option)
{
    if (option.GetNames().empty())
    {
        Log::LogE("Cannot add option without name");
        return false;
    }
    const std::string& firstName = option.GetNames()[0];

    if (option.GetId() == 0)
    {
        Log::LogE("Cannot add option %s, zero id is reserved", firstName.c_str());
        return false;
    }

    if (option.GetArgsDescriptions().size() != option.GetDefaultValues().size())
    {
        Log::LogE("Cannot add option %s, arguments and default values differ",
                firstName.c_str());
        return false;
    }

    for (const Option& other : m_options)
    {
        if (other.GetId() == option.GetId())
        {
            Log::LogE("Cannot add option %s, id %u taken by %s", firstName.c_str(),
                    option.GetId(), other.GetNames()[0].c_str());
            return false;
        }
    }

    for (const std::string& name : option.GetNames())
    {
        if (name.empty() || name[0] == OptionsFilePrefix || FindOption(name))
        {
            Log::LogE("Cannot add option %s, name '%s' is invalid or taken",
                    firstName.c_str(), name.c_str());
            return false;
        }
    }

    m_options.push_back(option);
    return true;
}

bool o2::OptionController::ProcessOptions(int argc, char* argv[])
{
    std::vector<std::string> args;
    for (int n = 1; n < argc; n++)
        args.emplace_back(argv[n]);
    return ProcessOptions(args);
}

bool o2::OptionController::ProcessOptions(const std::vector<std::string>& args)
{
    m_optionsPassed.clear();
    m_optionsPassedFailed.clear();

    std::vector<std::string> expandedArgs;
    for (const std::string& arg : args)
    {
        if (arg.empty() || arg[0] != OptionsFilePrefix)
        {
            expandedArgs.push_back(arg);
            continue;
        }
        if (!ReadOptionsFile(arg.substr(1), expandedArgs))
            return false;
    }

    bool ok = true;
    for (const std::string& arg : expandedArgs)
    {
        std::string name;
        std::string value;
        bool hasValue;
        Option::SplitArg(arg, name, value, hasValue);

        const Option* option = FindOption(name);
        if (!option)
        {
            Log::LogE("Unknown option '%s'", arg.c_str());
            ok = false;
            break;
        }

        m_optionsPassed.push_back(*option);
        if (!option->Apply(name, value, hasValue))
        {
            m_optionsPassedFailed.push_back(*option);
            ok = false;
        }
    }

    if (!ok)
        Log::LogE("Command line has errors, see messages above");

    return ok;
}

std::string o2::OptionController::GetOptionsDescription(
        const std::vector<Option>& options) const
{
    std::string usage =
        "Notes\n"
        "-----\n"
        "\n"
        "  Valid boolean values are not case-sensitive:\n"
        "    - false, 0, off, no\n"
        "    - true, 1, on, yes\n"
        "    - or no value separator and no value meaning true\n"
        "\n"
        "  Options can be read from a file given as @<file>, one option per line.\n"
        "  Options are applied in order, the last occurrence wins.\n"
        "\n"
        "Options\n"
        "-------\n";

    for (const Option& option : options)
        usage += "\n" + option.GetUsage();

    return usage;
}

bool o2::OptionController::WasProcessed(uint32_t id) const
{
    for (const Option& option : m_optionsPassed)
    {
        if (option.GetId() == id)
            return true;
    }
    return false;
}

const o2::Option* o2::OptionController::FindOption(const std::string& name) const
{
    for (const Option& option : m_options)
    {
        if (option.HasName(name))
            return &option;
    }
    return nullptr;
}

bool o2::OptionController::ReadOptionsFile(const std::string& fileName,
        std::vector<std::string>& args) const
{
    std::ifstream file(fileName);
    if (!file.is_open())
    {
        Log::LogE("Failed to open options file '%s'", fileName.c_str());
        return false;
    }

    std::string line;
    while (std::getline(file, line))
    {
        const std::string arg = TrimString(line);
        if (arg.empty() || arg[0] == '#')
            continue;
        if (arg[0] == OptionsFilePrefix)
        {
            Log::LogE("Options file '%s' cannot include another file",
                    fileName.c_str());
            return false;
        }
        args.push_back(arg);
    }

    if (file.bad())
    {
        Log::LogE("Failed to read options file '%s'", fileName.c_str());
        return false;
    }

    Log::LogD("Read %zu options from '%s'", args.size(), fileName.c_str());
    return true;
}
