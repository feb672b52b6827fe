// Copyright (c) 2024 UltiMaker
// SwitchTower is released under the terms of the AGPLv3 or higher

#ifndef APPLICATION_H
#define APPLICATION_H

#include <cstddef>
#include <string>
#include <vector>

#include "settings/Settings.h"

namespace switchtower
{

/*!
 * A singleton class that serves as the starting point of the command line tool.
 *
 * It sets up logging, parses the command line arguments into settings and runs the requested command.
 */
class Application
{
public:
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /*!
     * Gets the instance of this application class.
     */
    static Application& getInstance();

    /*!
     * \brief Print to the stderr channel what the original call to the executable was.
     */
    void printCall() const;

    /*!
     * \brief Print to the stdout channel how to use SwitchTower.
     */
    void printHelp() const;

    /*!
     * \brief Starts the application.
     *
     * \param argc The number of arguments provided to the application.
     * \param argv The arguments provided to the application.
     * \return The process exit code.
     */
    int run(const size_t argc, char** argv);

private:
    size_t argc_{ 0 };
    char** argv_{ nullptr };

    Settings settings_; //!< Global settings, parent of all extruder settings.
    std::vector<Settings> extruder_settings_;
    size_t layer_count_{ 10 };
    std::string output_file_;

    Application();

    /*!
     * \brief Fill the global settings with the defaults of a two-extruder PTFE machine.
     */
    void loadDefaults();

    /*!
     * \brief Parse the arguments after the command.
     * \return Whether all arguments could be parsed.
     */
    bool parseArguments(const std::vector<std::string>& arguments);

    /*!
     * \brief Get the settings of an extruder, creating extruders up to \p extruder_nr if needed.
     */
    Settings& getExtruderSettings(const size_t extruder_nr);

    int printSpeeds();

    int writeTower();
};

} // namespace switchtower

#endif // APPLICATION_H
