#pragma once

#include "config.hpp"

#include <CLI/CLI.hpp>

/**
 * Register every SyncConfig field on `app`, plus the "-c,--config" INI file
 * (default sync_config.ini, keys are the long option names).
 * Values given on the command line override the file.
 */
void addSyncOptions(CLI::App &app, SyncConfig &config);
