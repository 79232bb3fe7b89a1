#pragma once

/**
 * @file export.h
 * @brief Export/import macros for the Huginn libraries
 *
 * NOTE: With WINDOWS_EXPORT_ALL_SYMBOLS, CMake auto-generates exports.
 *       HUGINN_API is kept as an empty macro so public declarations stay annotated.
 */

#define HUGINN_API

// For classes that should not be exported (internal use only)
#define HUGINN_INTERNAL
