// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef GCODE_COMMAND_EXPORTER_H
#define GCODE_COMMAND_EXPORTER_H

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "gcode/CommandLine.h"

namespace switchtower::gcode
{

/*!
 * Ordered receiver of generated g-code lines.
 *
 * Lines are written in the exact order in which the print head has to execute them. An
 * implementation must never reorder, drop or merge lines.
 */
class CommandExporter
{
public:
    virtual ~CommandExporter() = default; // Force class being polymorphic

    virtual void write(CommandLine line) = 0;

    void write(std::string command, std::string comment)
    {
        write(CommandLine{ std::move(command), std::move(comment) });
    }

    /*!
     * \brief Write the line if there is one. Helpers that conditionally produce a command return an optional.
     */
    void write(std::optional<CommandLine> line)
    {
        if (line)
        {
            write(std::move(*line));
        }
    }
};

/*!
 * Keeps all written lines in memory, in order.
 */
class CommandBuffer : public CommandExporter
{
public:
    using CommandExporter::write;

    void write(CommandLine line) override;

    [[nodiscard]] const std::vector<CommandLine>& lines() const noexcept
    {
        return lines_;
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return lines_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return lines_.empty();
    }

    void clear() noexcept
    {
        lines_.clear();
    }

    /*!
     * \brief Serialize all lines, each followed by a newline.
     */
    [[nodiscard]] std::string str() const;

private:
    std::vector<CommandLine> lines_;
};

/*!
 * Serializes every written line to an output stream, terminated with a newline.
 */
class StreamExporter : public CommandExporter
{
public:
    using CommandExporter::write;

    explicit StreamExporter(std::ostream& output, std::string new_line = "\n");

    void write(CommandLine line) override;

    [[nodiscard]] size_t linesWritten() const noexcept
    {
        return lines_written_;
    }

private:
    std::ostream& output_;
    std::string new_line_;
    size_t lines_written_{ 0 };
};

} // namespace switchtower::gcode

#endif // GCODE_COMMAND_EXPORTER_H
