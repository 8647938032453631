//===----------------------------------------------------------------------===//
//
// Part of the Folio project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line validity query for the SourceLoc value type.  A
// location is valid when it refers to a file registered with the
// SourceManager; line and column components stay optional.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace folio::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses identifiers starting at one for every
///          input file.  The default-constructed location uses zero to mark
///          "unknown", which lets diagnostics elide the path prefix.
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace folio::support
