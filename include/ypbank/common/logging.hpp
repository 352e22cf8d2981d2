#pragma once

#include <string_view>

namespace ypbank::common {

/// Install a color logger on stderr as the spdlog default logger.
///
/// stdout is left untouched so tools can stream converted records there.
/// `verbose` lowers the level from info to debug.
void configure_logging(std::string_view name, bool verbose);

}  // namespace ypbank::common
