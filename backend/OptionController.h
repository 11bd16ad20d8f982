#pragma once
#ifndef O2_OPTION_CONTROLLER_H
#define O2_OPTION_CONTROLLER_H

/* System */
#include <cstdint>
#include <string>
#include <vector>

/* Local */
#include "Option.h"

namespace o2 {

/* Parses command line into registered options. An argument "@file" is
   replaced by options read from that file, one per line, empty lines and
   lines starting with '#' are skipped. Lab presets are kept that way. */
class OptionController
{
public:
    static const char OptionsFilePrefix;

public:
    OptionController();

    // Names and id have to be unique among all added options
    bool AddOption(const Option& option);

    // Runs handlers in order of appearance, later values override earlier ones
    bool ProcessOptions(int argc, char* argv[]);
    bool ProcessOptions(const std::vector<std::string>& args);

    // Usage text of given options
    std::string GetOptionsDescription(const std::vector<Option>& options) const;

    const std::vector<Option>& GetOptions() const
    { return m_options; }
    const std::vector<Option>& GetAllProcessedOptions() const
    { return m_optionsPassed; }
    const std::vector<Option>& GetFailedProcessedOptions() const
    { return m_optionsPassedFailed; }

    // True if an option with given id was passed on command line
    bool WasProcessed(uint32_t id) const;

private:
    const Option* FindOption(const std::string& name) const;
    bool ReadOptionsFile(const std::string& fileName,
            std::vector<std::string>& args) const;

private:
    std::vector<Option> m_options;
    std::vector<Option> m_optionsPassed;
    std::vector<Option> m_optionsPassedFailed;
};

} // namespace o2

#endif /* O2_OPTION_CONTROLLER_H */
