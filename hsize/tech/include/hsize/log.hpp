#pragma once

// Logging goes through spdlog. Header-only usage is forced locally without exporting SPDLOG_HEADER_ONLY
// as a public compile definition (consumers may link the compiled spdlog variant instead).
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace hsize {
namespace log = spdlog;
}  // namespace hsize
