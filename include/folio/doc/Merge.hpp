// File: include/folio/doc/Merge.hpp
// Purpose: Stable façade for label extraction, link validation and merging.
// Key invariants: Re-exports supported document interfaces; helpers stay internal.
// Ownership/Lifetime: Mirrors the underlying implementations.
// Links: docs/codemap.md
#pragma once

#include "doc/FileIdentity.hpp"
#include "doc/Label.hpp"
#include "doc/LabelRegistry.hpp"
#include "doc/LinkError.hpp"
#include "doc/LinkScanner.hpp"
#include "doc/LinkValidator.hpp"
#include "doc/Merger.hpp"
#include "doc/Pipeline.hpp"

/// @file include/folio/doc/Merge.hpp
/// @brief Aggregated public header for the document merge pipeline.  Provides
///        the registry, validator and merger used by the `folio` tool so
///        other programs can embed the same checks.
