// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef GCODE_COMMAND_LINE_H
#define GCODE_COMMAND_LINE_H

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace switchtower::gcode
{

/*!
 * A single generated g-code line: an optional command and an optional comment.
 *
 * A line that only carries a comment is a section marker, used to bracket generated blocks
 * such as " TOWER START" and " TOWER END".
 */
struct CommandLine
{
    std::optional<std::string> command;
    std::optional<std::string> comment;

    CommandLine() = default;

    CommandLine(std::optional<std::string> command_, std::optional<std::string> comment_)
        : command(std::move(command_))
        , comment(std::move(comment_))
    {
    }

    /*!
     * \brief Create a section marker line, which has no command.
     */
    static CommandLine marker(std::string comment_)
    {
        return CommandLine{ std::nullopt, std::move(comment_) };
    }

    [[nodiscard]] bool isMarker() const noexcept
    {
        return ! command.has_value() && comment.has_value();
    }

    [[nodiscard]] bool isEmpty() const noexcept
    {
        return ! command.has_value() && ! comment.has_value();
    }

    /*!
     * \brief Serialize the line without a line terminator.
     *
     * The comment is appended after a semicolon, e.g. "G91; relative positioning".
     */
    [[nodiscard]] std::string toString() const;

    bool operator==(const CommandLine& other) const = default;
};

std::ostream& operator<<(std::ostream& out, const CommandLine& line);

} // namespace switchtower::gcode

#endif // GCODE_COMMAND_LINE_H
