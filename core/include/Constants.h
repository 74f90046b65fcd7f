#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for QuietSync
 *
 * All magic numbers and configuration values should be defined here
 * to ensure consistency across the codebase.
 */

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace qsync::config {

// =============================================================================
// Diff-Copy Configuration
// =============================================================================

/// Chunk size compared per loop iteration (bytes)
constexpr std::size_t DEFAULT_BUFFER_SIZE = 8 * 1024;  // 8KB

/// Largest chunk size accepted from configuration (bytes)
constexpr std::size_t MAX_BUFFER_SIZE = 64 * 1024 * 1024;  // 64MB

/// Permission bits for destinations created by a copy
constexpr mode_t DEFAULT_FILE_MODE = 0644;

// =============================================================================
// Logging
// =============================================================================

/// Log file size that triggers rotation (MB)
constexpr std::size_t DEFAULT_LOG_FILE_SIZE_MB = 100;

/// Largest rotation size accepted from configuration (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 10 * 1024;

// =============================================================================
// Command-line exit codes
// =============================================================================

constexpr int EXIT_OK = 0;
constexpr int EXIT_IO_FAILURE = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_VERIFY_MISMATCH = 3;

} // namespace qsync::config
