#pragma once

/**
 * sweep
 *
 * Finds the files an application leaves behind, sizes them through a
 * persistent metadata cache, snapshots them and removes them.
 */

#include <sweep/types.hpp>
#include <sweep/config.hpp>
#include <sweep/exclusion_rules.hpp>
#include <sweep/path_matcher.hpp>
#include <sweep/metadata_cache.hpp>
#include <sweep/scanner.hpp>
#include <sweep/quick_locator.hpp>
#include <sweep/snapshot/snapshot_manager.hpp>
#include <sweep/removal.hpp>
