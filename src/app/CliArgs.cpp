//------------------------------------------------------------------------------
/*
    This file is part of tablemig.
    Copyright (c) 2025, the tablemig developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "app/CliArgs.hpp"

#include "app/MigrationStatusApplication.hpp"
#include "util/newconfig/ConfigDescription.hpp"

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <boost/program_options/variables_map.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace app {

CliArgs::Action
CliArgs::parse(int argc, char const* argv[])
{
    namespace po = boost::program_options;
    // clang-format off
    po::options_description description("Options");
    description.add_options()
        ("help,h", "print help message and exit")
        ("conf,c", po::value<std::string>()->default_value(kDEFAULT_CONFIG_PATH), "configuration file")
        ("verify", "check the configuration file and exit")
        ("force,f", "refresh the migration status before printing it")
        ("config-description,d", "print the description of every configuration key and exit")
        ("command", po::value<std::string>()->default_value("status"), "status | check <schema>.<table> | refresh")
        ("table", po::value<std::string>(), "table to check, as <schema>.<table>")
    ;
    // clang-format on
    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("table", 1);

    po::variables_map parsed;
    po::store(po::command_line_parser(argc, argv).options(description).positional(positional).run(), parsed);
    po::notify(parsed);

    if (parsed.count("help") != 0u) {
        std::cout << "tablemig\n\nUsage: tablemig [options] [status | check <schema>.<table> | refresh]\n\n"
                  << description;
        return Action{Action::Exit{EXIT_SUCCESS}};
    }

    if (parsed.count("config-description") != 0u) {
        util::config::ConfigDescription::print(std::cout);
        return Action{Action::Exit{EXIT_SUCCESS}};
    }

    auto configPath = parsed["conf"].as<std::string>();

    if (parsed.count("verify") != 0u)
        return Action{Action::VerifyConfig{std::move(configPath)}};

    auto const command = parsed["command"].as<std::string>();
    if (command == "status")
        return Action{Action::Run{std::move(configPath), MigrationStatusCmd::status(parsed.count("force") != 0u)}};

    if (command == "refresh")
        return Action{Action::Run{std::move(configPath), MigrationStatusCmd::refresh()}};

    if (command == "check") {
        if (parsed.count("table") == 0u) {
            std::cerr << "check requires a table as <schema>.<table>" << std::endl;
            return Action{Action::Exit{EXIT_FAILURE}};
        }

        auto const table = parsed["table"].as<std::string>();
        auto const dot = table.find('.');
        if (dot == std::string::npos or dot == 0 or dot + 1 == table.size()) {
            std::cerr << "Invalid table name '" << table << "', expected <schema>.<table>" << std::endl;
            return Action{Action::Exit{EXIT_FAILURE}};
        }
        return Action{
            Action::Run{std::move(configPath), MigrationStatusCmd::check(table.substr(0, dot), table.substr(dot + 1))}
        };
    }

    std::cerr << "Unknown command '" << command << "'\n\n" << description;
    return Action{Action::Exit{EXIT_FAILURE}};
}

}  // namespace app
