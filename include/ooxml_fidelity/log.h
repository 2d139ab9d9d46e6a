// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief stderr diagnostics gated by OOXML_FIDELITY_VERBOSE_LOG.
///
/// To explicitly enable:  #define OOXML_FIDELITY_VERBOSE_LOG 1
/// To explicitly disable: #define OOXML_FIDELITY_VERBOSE_LOG 0

#pragma once

#include "ooxml_fidelity_config.h"

#include <iostream>
#include <source_location>
#include <string_view>

namespace ooxml_fidelity {

namespace detail {

inline void log_warning(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OOXML_FIDELITY_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

/// Report input the library refused (bad markup, bad profile record, failed job).
/// @param subject Identifies the offending input (file, profile name, platform)
inline void log_input_error(
    std::string_view func,
    std::string_view subject,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if OOXML_FIDELITY_VERBOSE_LOG
    std::cerr << "[" << func << "] '" << subject << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)subject;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

} // namespace ooxml_fidelity
