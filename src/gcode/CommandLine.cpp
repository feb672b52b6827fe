// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "gcode/CommandLine.h"

namespace switchtower::gcode
{

std::string CommandLine::toString() const
{
    std::string result = command.value_or("");
    if (comment)
    {
        result += ';';
        result += *comment;
    }
    return result;
}

std::ostream& operator<<(std::ostream& out, const CommandLine& line)
{
    return out << line.toString();
}

} // namespace switchtower::gcode
