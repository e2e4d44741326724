// *****************************************************************************
// * This file is part of the SafeMove project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SafeMove developers                                         *
// *****************************************************************************

#ifndef COMMAND_LINE_H_3475092834750928
#define COMMAND_LINE_H_3475092834750928

#include <vector>
#include <basis/file_error.h>
#include "base/structures.h"


namespace sm
{
struct CommandLine
{
    MoveSettings settings; //defaults <- config file (--config) <- switches
    bool showHelp = false;
    bool verbose  = false;
    std::string configWarning; //non-fatal problems with the config file
};

//"args" without program name; FileError for invalid syntax or unreadable config file
CommandLine parseCommandLine(const std::vector<std::string>& args); //throw FileError

std::string getSyntaxHelp();

//"64M" => 64 MiB; plain number => bytes
std::optional<uint64_t> parseByteCount(std::string_view str);
}

#endif //COMMAND_LINE_H_3475092834750928
