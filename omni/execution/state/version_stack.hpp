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

#include <omni/core/assert.h>
#include <omni/core/config.hpp>

#include <deque>
#include <utility>

OMNI_NAMESPACE_BEGIN

// Copy-on-write history of a value across nested checkpoints. Each entry is
// tagged with the checkpoint version that last wrote it.
template <class T>
class VersionStack
{
    std::deque<std::pair<unsigned, T>> stack_{};

public:
    explicit VersionStack(T value, unsigned const version = 0)
    {
        stack_.emplace_back(version, std::move(value));
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    T const &recent() const
    {
        OMNI_ASSERT(!stack_.empty());
        return stack_.back().second;
    }

    T &current(unsigned const version)
    {
        OMNI_ASSERT(!stack_.empty());
        auto &[top_version, top] = stack_.back();
        if (version > top_version) {
            T copy = top;
            stack_.emplace_back(version, std::move(copy));
        }
        return stack_.back().second;
    }

    // Folds the writes of `version` into the enclosing checkpoint
    void pop_accept(unsigned const version)
    {
        OMNI_ASSERT(version > 0);
        OMNI_ASSERT(!stack_.empty());

        if (stack_.back().first != version) {
            return;
        }
        auto const size = stack_.size();
        if (size > 1 && stack_[size - 2].first + 1 == version) {
            stack_[size - 2].second = std::move(stack_.back().second);
            stack_.pop_back();
        }
        else {
            stack_.back().first = version - 1;
        }
    }

    // Drops the writes of `version`; returns true when nothing is left
    bool pop_reject(unsigned const version)
    {
        OMNI_ASSERT(version > 0);
        OMNI_ASSERT(!stack_.empty());

        if (stack_.back().first == version) {
            stack_.pop_back();
        }
        return stack_.empty();
    }
};

OMNI_NAMESPACE_END
