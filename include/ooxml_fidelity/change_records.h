// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file change_records.h
/// @brief Bridge from semantic differences to tolerance change records.

#pragma once

#include "api.h"
#include "semantic_diff.h"
#include "tolerance.h"

#include <vector>

namespace ooxml_fidelity {

/// Change type a difference counts as in tolerance evaluation:
///   IGNORABLE / package metadata          -> METADATA_CHANGE
///   text, or a dropped element with text  -> CONTENT_LOSS
///   image references and extents          -> RESOLUTION_LOSS
///   color values                          -> COLOR_SHIFT
///   font faces                            -> FONT_SUBSTITUTION
///   spacing, indentation, margins         -> SPACING_CHANGE
///   other element add/drop outside styles -> STRUCTURE_CHANGE
///   anything else                         -> FORMATTING_LOSS
[[nodiscard]] OOXML_FIDELITY_API ChangeType classify_change(const SemanticDifference& difference);

/// One record per difference, in the same order
[[nodiscard]] OOXML_FIDELITY_API std::vector<ChangeRecord>
to_change_records(const std::vector<SemanticDifference>& differences);

} // namespace ooxml_fidelity
