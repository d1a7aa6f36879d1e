#pragma once

#include "cli/cli_options.hpp"
#include <istream>
#include <ostream>
#include <string>

/**
 * @brief Asks for the settings the command line did not provide
 */
class InteractivePrompt
{
public:
    InteractivePrompt(std::istream &in, std::ostream &out);

    /**
     * @brief Show the usage notice and read y/yes
     * @return true if the user agreed
     */
    bool acknowledgeNotice();

    /**
     * @brief Fill in URL, output directory, bitrate and per-kind extras
     *
     * Values already present in options are not asked for again.
     *
     * @throws UsageError if no URL is entered
     */
    void gather(CliOptions &options);

private:
    std::string ask(const std::string &question, const std::string &def);

    std::istream &in_;
    std::ostream &out_;
};
