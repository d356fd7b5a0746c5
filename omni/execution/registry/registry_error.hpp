// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <omni/core/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

OMNI_NAMESPACE_BEGIN

enum class RegistryError
{
    Success = 0,
    ChainTypeAlreadyRegistered,
    ChainTypeNotRegistered,
    InvalidVmType,
    VmTypeMismatch,
    InvalidImplementation,
    ImplementationAlreadyRegistered,
    ImplementationNotRegistered,
    InvalidChainNamespace,
};

OMNI_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<omni::RegistryError>
    : quick_status_code_from_enum_defaults<omni::RegistryError>
{
    static constexpr auto const domain_name = "Registry Error";
    static constexpr auto const domain_uuid =
        "1d7b3e95-64c2-4a08-9f1e-b5a2c8d0e637";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
