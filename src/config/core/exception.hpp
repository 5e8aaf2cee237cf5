/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Configuration Exception Types

**************************************************/

#ifndef BMTL_CONFIG_CORE_EXCEPTION_HPP
#define BMTL_CONFIG_CORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace bmtl::config {

/**
 * @brief Base exception for configuration errors
 */
class BadConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_BAD_CONFIG_EXCEPTION(...)                                    \
    throw bmtl::config::BadConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                           ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief The configuration file exists but cannot be parsed
 */
class InvalidConfigException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_INVALID_CONFIG_EXCEPTION(...)     \
    throw bmtl::config::InvalidConfigException( \
        ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Exception for configuration file I/O errors
 */
class ConfigIOException : public BadConfigException {
    using BadConfigException::BadConfigException;
};

#define THROW_CONFIG_IO_EXCEPTION(...)                                    \
    throw bmtl::config::ConfigIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_CORE_EXCEPTION_HPP
