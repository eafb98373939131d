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

#include "app/MigrationStatusApplication.hpp"

#include "catalog/JsonWorkspace.hpp"
#include "crawler/JsonFileSnapshotStore.hpp"
#include "migration/LiveMigrationStatus.hpp"
#include "migration/TableMigrationInspectorFactory.hpp"
#include "migration/TableMigrationInspectorInterface.hpp"
#include "util/Assert.hpp"
#include "util/OverloadSet.hpp"
#include "util/log/Logger.hpp"
#include "util/newconfig/ConfigDefinition.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace app {

MigrationStatusApplication::MigrationStatusApplication(
    util::config::ConfigDefinition const& config,
    MigrationStatusCmd command
)
    : cmd_(std::move(command)), out_{std::cout}
{
    auto const exportFile = config.maybeValue<std::string>("workspace.export_file");
    if (not exportFile.has_value())
        throw std::runtime_error("Workspace export file is not configured: set workspace.export_file");

    auto const legacyCatalog = config.get<std::string>("migration.legacy_catalog");
    auto expectedWorkspace = catalog::makeJsonWorkspace(*exportFile, legacyCatalog);
    if (not expectedWorkspace)
        throw std::runtime_error("Failed to load workspace export: " + expectedWorkspace.error());

    auto const workspace = std::move(expectedWorkspace).value();
    auto const snapshotStore =
        std::make_shared<crawler::JsonFileSnapshotStore>(config.get<std::string>("snapshot_store.directory"));

    LOG(util::LogService::info()) << "Loaded workspace export from " << *exportFile;
    inspector_ = migration::makeTableMigrationStatusRefresher(config, workspace, workspace, workspace, snapshotStore);
}

MigrationStatusApplication::MigrationStatusApplication(
    std::shared_ptr<migration::TableMigrationInspectorInterface> inspector,
    MigrationStatusCmd command,
    std::ostream& out
)
    : inspector_(std::move(inspector)), cmd_(std::move(command)), out_{out}
{
    ASSERT(inspector_ != nullptr, "Migration inspector is not initialized");
}

int
MigrationStatusApplication::run()
{
    return std::visit(
        util::OverloadSet{
            [this](MigrationStatusCmd::Status const& cmd) { return printStatus(cmd.forceRefresh); },
            [this](MigrationStatusCmd::Check const& cmd) { return check(cmd.schema, cmd.table); },
            [this](MigrationStatusCmd::Refresh const&) { return refresh(); }
        },
        cmd_.state
    );
}

int
MigrationStatusApplication::printStatus(bool forceRefresh)
{
    auto const index = inspector_->index(forceRefresh);
    auto tables = index.snapshot();
    std::ranges::sort(tables);

    out_.get() << "Current Migration Status:" << std::endl;
    if (tables.empty())
        out_.get() << "No table found" << std::endl;

    for (auto const& [schema, table] : tables) {
        auto const status = index.get(schema, table);
        out_.get() << schema << "." << table << " - ";
        if (status.has_value()) {
            out_.get() << *status->destinationIdentity() << std::endl;
        } else {
            out_.get() << "not migrated" << std::endl;
        }
    }
    return EXIT_SUCCESS;
}

int
MigrationStatusApplication::check(std::string const& schema, std::string const& table)
{
    auto const status = inspector_->probe(schema, table);
    out_.get() << schema << "." << table << " - " << status.toString() << std::endl;
    return status.countsAsMigrated() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int
MigrationStatusApplication::refresh()
{
    auto const index = inspector_->index(true);
    auto const tables = index.snapshot();
    auto const migrated = std::ranges::count_if(tables, [&index](auto const& key) {
        return index.isMigrated(key.first, key.second);
    });

    out_.get() << "Refreshed migration status: " << migrated << " of " << tables.size() << " tables migrated"
               << std::endl;
    return EXIT_SUCCESS;
}

}  // namespace app
