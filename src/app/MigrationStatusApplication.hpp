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

#pragma once

#include "migration/TableMigrationInspectorInterface.hpp"
#include "util/newconfig/ConfigDefinition.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace app {

/**
 * @brief The command to run against the migration status
 */
struct MigrationStatusCmd {
    /**
     * @brief Print the migration status of every known table
     */
    struct Status {
        bool forceRefresh = false;
    };
    /**
     * @brief Check a single table against the legacy store
     */
    struct Check {
        std::string schema;
        std::string table;
    };
    /**
     * @brief Recompute the migration status
     */
    struct Refresh {};

    std::variant<Status, Check, Refresh> state;

    /**
     * @brief Helper function to create a status command
     *
     * @param forceRefresh Whether to refresh before printing
     * @return Cmd object containing the status command
     */
    static MigrationStatusCmd
    status(bool forceRefresh = false)
    {
        return MigrationStatusCmd{Status{forceRefresh}};
    }

    /**
     * @brief Helper function to create a check command
     *
     * @param schema The schema of the table to check
     * @param table The table to check
     * @return Cmd object containing the check command
     */
    static MigrationStatusCmd
    check(std::string schema, std::string table)
    {
        return MigrationStatusCmd{Check{std::move(schema), std::move(table)}};
    }

    /**
     * @brief Helper function to create a refresh command
     *
     * @return Cmd object containing the refresh command
     */
    static MigrationStatusCmd
    refresh()
    {
        return MigrationStatusCmd{Refresh{}};
    }
};

/**
 * @brief The migration status application class
 */
class MigrationStatusApplication {
    std::shared_ptr<migration::TableMigrationInspectorInterface> inspector_;
    MigrationStatusCmd cmd_;
    std::reference_wrapper<std::ostream> out_;

public:
    /**
     * @brief Construct a new MigrationStatusApplication object from the config. The workspace export and the
     * snapshot store are taken from the config.
     *
     * @param config The configuration of the application
     * @param command The command to run
     * @throws std::runtime_error if the workspace export can't be loaded
     */
    MigrationStatusApplication(util::config::ConfigDefinition const& config, MigrationStatusCmd command);

    /**
     * @brief Construct a new MigrationStatusApplication object around an existing inspector
     *
     * @param inspector The migration inspector
     * @param command The command to run
     * @param out The stream to print results to
     */
    MigrationStatusApplication(
        std::shared_ptr<migration::TableMigrationInspectorInterface> inspector,
        MigrationStatusCmd command,
        std::ostream& out = std::cout
    );

    /**
     * @brief Run the application
     *
     * @return The exit code
     */
    int
    run();

private:
    int
    printStatus(bool forceRefresh);

    int
    check(std::string const& schema, std::string const& table);

    int
    refresh();
};

}  // namespace app
