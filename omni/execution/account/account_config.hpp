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
#include <omni/execution/core/address.hpp>

#include <string>

OMNI_NAMESPACE_BEGIN

struct AccountConfig
{
    // bound into every domain separator
    std::string version{"1"};

    // deployer address used for account address derivation
    Address registry{};
};

OMNI_NAMESPACE_END
