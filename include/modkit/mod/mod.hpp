#pragma once

/// @file mod.hpp
/// @brief Main include header for modkit_mod
///
/// Mod discovery, load ordering and content patching:
/// - ModManifest: mod.json parsing and validation
/// - ModDependencyResolver: priority-seeded topological load order
/// - DocumentStore: content documents keyed by content key
/// - PatchFileLoader: patch file parsing per mod
/// - ModLoader: discovery, loading, unloading and reloading

#include "fwd.hpp"
#include "version.hpp"
#include "manifest.hpp"
#include "resolver.hpp"
#include "document_store.hpp"
#include "patch_loader.hpp"
#include "script_host.hpp"
#include "loader.hpp"

#include <modkit/document/document.hpp>
#include <modkit/document/json_pointer.hpp>
#include <modkit/document/patch.hpp>
#include <modkit/document/patch_applicator.hpp>
