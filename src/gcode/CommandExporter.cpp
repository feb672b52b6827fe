// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#include "gcode/CommandExporter.h"

#include <sstream>

namespace switchtower::gcode
{

void CommandBuffer::write(CommandLine line)
{
    lines_.push_back(std::move(line));
}

std::string CommandBuffer::str() const
{
    std::ostringstream out;
    for (const CommandLine& line : lines_)
    {
        out << line << '\n';
    }
    return out.str();
}

StreamExporter::StreamExporter(std::ostream& output, std::string new_line)
    : output_(output)
    , new_line_(std::move(new_line))
{
}

void StreamExporter::write(CommandLine line)
{
    output_ << line << new_line_;
    lines_written_++;
}

} // namespace switchtower::gcode
