/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_UPDATE_EXCEPTION_HPP
#define BMTL_UPDATE_EXCEPTION_HPP

#include "atom/error/exception.hpp"

namespace bmtl::update {

/**
 * @brief The update section cannot describe a valid slot layout
 */
class UpdateConfigException : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_UPDATE_CONFIG_ERROR(...)                                       \
    throw bmtl::update::UpdateConfigException(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                              ATOM_FUNC_NAME, __VA_ARGS__)

}  // namespace bmtl::update

#endif  // BMTL_UPDATE_EXCEPTION_HPP
