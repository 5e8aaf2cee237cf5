/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Configuration store exception types

**************************************************/

#ifndef BMTL_STORE_EXCEPTION_HPP
#define BMTL_STORE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace bmtl::store {

/**
 * @brief Base exception for document store errors
 */
class StoreException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

/**
 * @brief The store directory or a document file cannot be accessed
 *
 * Disk full, permission denied, read-only filesystem. Fatal for the
 * operation that raised it only.
 */
class StoreIOException : public StoreException {
    using StoreException::StoreException;
};

#define THROW_STORE_IO_ERROR(...)                                        \
    throw bmtl::store::StoreIOException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                        ATOM_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A document file exists but does not hold valid JSON
 */
class StoreFormatException : public StoreException {
    using StoreException::StoreException;
};

#define THROW_STORE_FORMAT_ERROR(...)                                        \
    throw bmtl::store::StoreFormatException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                            ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_DOCUMENT_NAME(...)                               \
    throw bmtl::store::StoreException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                      ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace bmtl::store

#endif  // BMTL_STORE_EXCEPTION_HPP
